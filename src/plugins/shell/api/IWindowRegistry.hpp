// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "shell/ShellConstants.hpp"
#include "shell/api/IShellWindow.hpp"

#include <QtCore/QList>
#include <QtCore/QObject>

namespace Shell {

class SHELL_EXPORT IWindowRegistry : public QObject
{
	Q_OBJECT

public:
	explicit IWindowRegistry(QObject* parent = nullptr) : QObject(parent) {}
	~IWindowRegistry() override = default;

	// nullptr if no window with that id exists.
	virtual IShellWindow* window(const QString& id) const = 0;
	virtual QList<IShellWindow*> windows() const = 0;

	virtual bool hasVisibleWindows() const = 0;
	virtual void showAll() = 0;

	// Shows every window, but only when none is visible. Returns whether anything was shown.
	virtual bool reopen() = 0;

	IShellWindow* mainWindow() const { return window(QString::fromLatin1(Constants::MAIN_WINDOW_ID)); }

signals:
	void windowCreated(const QString& id);
};

} // namespace Shell
