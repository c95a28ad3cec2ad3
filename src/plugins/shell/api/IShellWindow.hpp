// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "shell/ShellGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QUrl>

namespace Shell {

// A top-level window hosting web content.
class SHELL_EXPORT IShellWindow
{
public:
	virtual ~IShellWindow() = default;

	virtual QString id() const = 0;

	// Shows (restoring if minimized), raises and focuses.
	virtual void showAndFocus() = 0;
	virtual bool isWindowVisible() const = 0;

	virtual void navigate(const QUrl& url) = 0;
	virtual QUrl currentUrl() const = 0;

	// Runs `script` in the page's main world. Failures are not reported.
	virtual void evaluateScript(const QString& script) = 0;
};

} // namespace Shell
