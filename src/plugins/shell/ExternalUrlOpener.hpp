// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "shell/ShellGlobal.hpp"

#include <QtCore/QProcess>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QStringView>

#include <utility>

namespace Shell {

enum class ExternalUrlErrorCode : quint8 {
	None = 0,
	InputRejected,
	BrowserLaunchFailure
};

class SHELL_EXPORT ExternalUrlError final {
public:
	ExternalUrlError() = default;
	ExternalUrlError(ExternalUrlErrorCode code, QString message)
		: m_code(code), m_message(std::move(message)) {}

	bool ok() const noexcept { return m_code == ExternalUrlErrorCode::None; }
	ExternalUrlErrorCode code() const noexcept { return m_code; }

	// Shown to the page as-is.
	const QString& message() const noexcept { return m_message; }

	static ExternalUrlError none() { return {}; }

private:
	ExternalUrlErrorCode m_code{ExternalUrlErrorCode::None};
	QString m_message;
};

struct LaunchCommand final {
	QString program;
	QStringList arguments;
};

struct LaunchOutcome final {
	bool started = false;
	QString startError;
	QProcess::ExitStatus exitStatus = QProcess::NormalExit;
	int exitCode = 0;

	bool succeeded() const noexcept { return started && exitStatus == QProcess::NormalExit && exitCode == 0; }
};

// Trims `url` into `trimmed`; only http:// and https:// are accepted.
SHELL_EXPORT ExternalUrlError validateExternalUrl(QStringView url, QString& trimmed);

// The platform's "open in default browser" command for an already validated url.
SHELL_EXPORT LaunchCommand browserCommand(const QString& url);

// "exit status: 3", or a description of an abnormal termination.
SHELL_EXPORT QString describeLaunchStatus(const LaunchOutcome& outcome);

// Runs a command to completion with QProcess.
class SHELL_EXPORT QtProcessLaunchPolicy final {
public:
	LaunchOutcome run(const LaunchCommand& command) const;
};

// Opens web links in the user's browser. One launcher run per call, blocking until it exits.
template <typename LaunchPolicy>
class BasicExternalUrlOpener final {
public:
	explicit BasicExternalUrlOpener(LaunchPolicy policy = LaunchPolicy{})
		: m_policy(std::move(policy))
	{}

	const LaunchPolicy& policy() const noexcept { return m_policy; }

	ExternalUrlError open(QStringView url) const
	{
		QString trimmed;
		if (auto err = validateExternalUrl(url, trimmed); !err.ok())
			return err;

		const LaunchOutcome outcome = m_policy.run(browserCommand(trimmed));
		if (!outcome.started) {
			return {ExternalUrlErrorCode::BrowserLaunchFailure,
					QStringLiteral("Failed to launch browser: %1").arg(outcome.startError)};
		}
		if (!outcome.succeeded()) {
			return {ExternalUrlErrorCode::BrowserLaunchFailure,
					QStringLiteral("Browser command failed with status: %1").arg(describeLaunchStatus(outcome))};
		}
		return ExternalUrlError::none();
	}

private:
	LaunchPolicy m_policy;
};

using ExternalUrlOpener = BasicExternalUrlOpener<QtProcessLaunchPolicy>;

} // namespace Shell
