// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "shell/ShellBridge.hpp"

#include "shell/ShellConstants.hpp"

namespace Shell {

ShellBridge::ShellBridge(QObject* parent)
	: ShellBridge([](QStringView url) { return ExternalUrlOpener{}.open(url); }, parent)
{
}

ShellBridge::ShellBridge(UrlOpener opener, QObject* parent)
	: QObject(parent)
	, m_openUrl(std::move(opener))
{
	setObjectName(QString::fromLatin1(Constants::BRIDGE_OBJECT_NAME));
}

QVariantMap ShellBridge::open_external_url(const QString& url)
{
	const ExternalUrlError err = m_openUrl(url);
	if (err.ok())
		return {{QStringLiteral("ok"), true}};

	qCWarning(shelllog).noquote() << "open_external_url failed:" << err.message();
	return {{QStringLiteral("ok"), false}, {QStringLiteral("error"), err.message()}};
}

} // namespace Shell
