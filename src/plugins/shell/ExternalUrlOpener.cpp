// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "shell/ExternalUrlOpener.hpp"

namespace Shell {

ExternalUrlError validateExternalUrl(QStringView url, QString& trimmed)
{
	const QStringView t = url.trimmed();
	if (!t.startsWith(u"http://") && !t.startsWith(u"https://"))
		return {ExternalUrlErrorCode::InputRejected, QStringLiteral("Only http(s) URLs are allowed")};

	trimmed = t.toString();
	return ExternalUrlError::none();
}

LaunchCommand browserCommand(const QString& url)
{
#if defined(Q_OS_MACOS)
	return {QStringLiteral("open"), {url}};
#elif defined(Q_OS_WIN)
	return {QStringLiteral("cmd"), {QStringLiteral("/C"), QStringLiteral("start"), QString(), url}};
#else
	return {QStringLiteral("xdg-open"), {url}};
#endif
}

QString describeLaunchStatus(const LaunchOutcome& outcome)
{
	if (outcome.exitStatus == QProcess::CrashExit)
		return QStringLiteral("terminated abnormally");
	return QStringLiteral("exit status: %1").arg(outcome.exitCode);
}

LaunchOutcome QtProcessLaunchPolicy::run(const LaunchCommand& command) const
{
	LaunchOutcome out;

	QProcess process;
	process.setProcessChannelMode(QProcess::ForwardedChannels);
	process.start(command.program, command.arguments);
	if (!process.waitForStarted()) {
		out.startError = process.errorString();
		return out;
	}

	out.started = true;
	process.waitForFinished(-1);
	out.exitStatus = process.exitStatus();
	out.exitCode = process.exitCode();
	return out;
}

} // namespace Shell
