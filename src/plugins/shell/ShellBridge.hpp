// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "shell/ExternalUrlOpener.hpp"

#include <QtCore/QObject>
#include <QtCore/QVariantMap>

#include <functional>

namespace Shell {

// Commands the page can invoke through window.plutoShell.invoke(...).
// Each returns {ok: true} or {ok: false, error: <message>}.
class SHELL_EXPORT ShellBridge final : public QObject
{
	Q_OBJECT

public:
	using UrlOpener = std::function<ExternalUrlError(QStringView url)>;

	explicit ShellBridge(QObject* parent = nullptr);
	ShellBridge(UrlOpener opener, QObject* parent = nullptr);

	Q_INVOKABLE QVariantMap open_external_url(const QString& url);

private:
	UrlOpener m_openUrl;
};

} // namespace Shell
