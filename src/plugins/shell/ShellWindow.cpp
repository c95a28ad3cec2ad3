// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "shell/ShellWindow.hpp"

#include "shell/ShellConstants.hpp"

#include <QtGui/QAction>
#include <QtGui/QCloseEvent>
#include <QtWidgets/QMenuBar>
#include <QtWidgets/QToolBar>

namespace Shell {

ShellWindow::ShellWindow(QString id, const WebSurfaceFactory& surfaceFactory, QWidget* parent)
	: QMainWindow(parent)
	, m_id(std::move(id))
{
	setObjectName(QString::fromLatin1(Constants::WINDOW_OBJECT_NAME_PREFIX) + m_id);
	setWindowTitle(QString::fromLatin1(Constants::WINDOW_TITLE));
	resize(Constants::DEFAULT_WINDOW_WIDTH, Constants::DEFAULT_WINDOW_HEIGHT);

	if (surfaceFactory)
		m_surface = surfaceFactory(this);
	if (m_surface && m_surface->widget())
		setCentralWidget(m_surface->widget());
	else
		qCWarning(shelllog) << "window" << m_id << "created without web content";

	applyPlatformChrome();
}

ShellWindow::~ShellWindow() = default;

void ShellWindow::applyPlatformChrome()
{
#if defined(Q_OS_MACOS)
	// Content runs under a unified, title-less bar; the empty toolbar reserves its height.
	setUnifiedTitleAndToolBarOnMac(true);
	m_titlebarReserve = addToolBar(QString());
	m_titlebarReserve->setObjectName(QString::fromLatin1(Constants::MACOS_TITLEBAR_OBJECT_NAME));
	m_titlebarReserve->setMovable(false);
	m_titlebarReserve->setFloatable(false);
	m_titlebarReserve->setFixedHeight(Constants::MACOS_TITLEBAR_HEIGHT);
	m_titlebarReserve->setContextMenuPolicy(Qt::PreventContextMenu);
	m_titlebarReserve->setStyleSheet(QStringLiteral("QToolBar { background: transparent; border: 0; }"));
	setWindowTitle(QString());
#endif
}

void ShellWindow::installQuitAction(QAction* action)
{
	if (!action)
		return;

	addAction(action);
#if defined(Q_OS_MACOS)
	// QuitRole moves the entry into the application menu.
	menuBar()->addMenu(tr("&File"))->addAction(action);
#endif
}

void ShellWindow::showAndFocus()
{
	if (isMinimized())
		showNormal();
	else
		show();
	raise();
	activateWindow();
}

void ShellWindow::navigate(const QUrl& url)
{
	if (!m_surface)
		return;
	qCInfo(shelllog).noquote() << "window" << m_id << "navigating to" << url.toString();
	m_surface->load(url);
}

QUrl ShellWindow::currentUrl() const
{
	return m_surface ? m_surface->url() : QUrl();
}

void ShellWindow::evaluateScript(const QString& script)
{
	if (m_surface)
		m_surface->runJavaScript(script);
}

void ShellWindow::closeEvent(QCloseEvent* event)
{
	if (!m_closeHides) {
		QMainWindow::closeEvent(event);
		return;
	}

	event->ignore();
	hide();
	qCDebug(shelllog) << "window" << m_id << "hidden on close";
}

} // namespace Shell
