// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "shell/WebSurface.hpp"
#include "shell/api/IShellWindow.hpp"

#include <QtWidgets/QMainWindow>

#include <memory>

QT_BEGIN_NAMESPACE
class QAction;
class QToolBar;
QT_END_NAMESPACE

namespace Shell {

// Closing hides the window; it is only destroyed when the application quits.
class SHELL_EXPORT ShellWindow final : public QMainWindow, public IShellWindow
{
	Q_OBJECT

public:
	ShellWindow(QString id, const WebSurfaceFactory& surfaceFactory, QWidget* parent = nullptr);
	~ShellWindow() override;

	QString id() const override { return m_id; }
	void showAndFocus() override;
	bool isWindowVisible() const override { return isVisible(); }
	void navigate(const QUrl& url) override;
	QUrl currentUrl() const override;
	void evaluateScript(const QString& script) override;

	WebSurface* surface() const noexcept { return m_surface.get(); }

	// Once cleared, close events are accepted.
	void setCloseHides(bool hides) noexcept { m_closeHides = hides; }
	bool closeHides() const noexcept { return m_closeHides; }

	void installQuitAction(QAction* action);

protected:
	void closeEvent(QCloseEvent* event) override;

private:
	void applyPlatformChrome();

	QString m_id;
	std::unique_ptr<WebSurface> m_surface;
	QToolBar* m_titlebarReserve = nullptr;
	bool m_closeHides = true;
};

} // namespace Shell
