// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "shell/WindowRegistry.hpp"

#include "shell/ShellWindow.hpp"

namespace Shell {

WindowRegistry::WindowRegistry(WebSurfaceFactory surfaceFactory, QObject* parent)
	: IWindowRegistry(parent)
	, m_surfaceFactory(std::move(surfaceFactory))
{
	setObjectName("Shell.WindowRegistry");
}

WindowRegistry::~WindowRegistry()
{
	setQuitting(true);
	for (const QString& id : std::as_const(m_order)) {
		if (ShellWindow* w = m_windows.value(id))
			delete w;
	}
}

IShellWindow* WindowRegistry::window(const QString& id) const
{
	return shellWindow(id);
}

ShellWindow* WindowRegistry::shellWindow(const QString& id) const
{
	return m_windows.value(id).data();
}

QList<IShellWindow*> WindowRegistry::windows() const
{
	QList<IShellWindow*> out;
	for (const QString& id : m_order) {
		if (ShellWindow* w = m_windows.value(id))
			out.push_back(w);
	}
	return out;
}

bool WindowRegistry::hasVisibleWindows() const
{
	for (const auto& w : m_windows) {
		if (w && w->isVisible())
			return true;
	}
	return false;
}

void WindowRegistry::showAll()
{
	for (IShellWindow* w : windows())
		w->showAndFocus();
}

bool WindowRegistry::reopen()
{
	const bool visible = hasVisibleWindows();
	qCInfo(shelllog) << "App reopen event - has_visible_windows:" << visible;
	if (visible)
		return false;
	showAll();
	return true;
}

ShellWindow* WindowRegistry::ensureWindow(const QString& id, const QUrl& initialUrl)
{
	if (ShellWindow* existing = shellWindow(id))
		return existing;

	auto* w = new ShellWindow(id, m_surfaceFactory);
	w->setCloseHides(!m_quitting);
	if (initialUrl.isValid())
		w->navigate(initialUrl);

	if (!m_order.contains(id))
		m_order.push_back(id);
	m_windows.insert(id, w);

	qCInfo(shelllog) << "created window" << id;
	emit windowCreated(id);
	return w;
}

void WindowRegistry::setQuitting(bool quitting)
{
	m_quitting = quitting;
	for (const auto& w : std::as_const(m_windows)) {
		if (w)
			w->setCloseHides(!quitting);
	}
}

} // namespace Shell
