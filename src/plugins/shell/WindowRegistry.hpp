// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "shell/WebSurface.hpp"
#include "shell/api/IWindowRegistry.hpp"

#include <QtCore/QHash>
#include <QtCore/QPointer>
#include <QtCore/QStringList>

namespace Shell {
class ShellWindow;

// Owns the shell's top-level windows, at most one per id.
class SHELL_EXPORT WindowRegistry final : public IWindowRegistry
{
	Q_OBJECT

public:
	explicit WindowRegistry(WebSurfaceFactory surfaceFactory, QObject* parent = nullptr);
	~WindowRegistry() override;

	IShellWindow* window(const QString& id) const override;
	QList<IShellWindow*> windows() const override;
	bool hasVisibleWindows() const override;
	void showAll() override;
	bool reopen() override;

	// Get-or-create. A new window starts at `initialUrl` when it is valid.
	ShellWindow* ensureWindow(const QString& id, const QUrl& initialUrl = {});
	ShellWindow* shellWindow(const QString& id) const;

	// While quitting, closing a window really closes it.
	void setQuitting(bool quitting);
	bool isQuitting() const noexcept { return m_quitting; }

private:
	WebSurfaceFactory m_surfaceFactory;
	QStringList m_order;
	QHash<QString, QPointer<ShellWindow>> m_windows;
	bool m_quitting = false;
};

} // namespace Shell
