// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QPointer>
#include <QtCore/QStringList>

#include "extensionsystem/IPlugin.hpp"
#include "shell/WebSurface.hpp"

QT_BEGIN_NAMESPACE
class QAction;
QT_END_NAMESPACE

namespace Shell {
class AppEventRouter;
class ShellBridge;
class WindowRegistry;

class ShellPlugin final : public ExtensionSystem::IPlugin
{
	Q_OBJECT

public:
	explicit ShellPlugin(QObject* parent = nullptr);
	// Builds windows on the given surfaces instead of Qt WebEngine.
	explicit ShellPlugin(WebSurfaceFactory surfaceFactory, QObject* parent = nullptr);
	~ShellPlugin() override;

	Utils::Result initialize(const QStringList& arguments,
							 ExtensionSystem::PluginManager& manager) override;

	void extensionsInitialized(ExtensionSystem::PluginManager& manager) override;

	ShutdownFlag aboutToShutdown() override;

private:
	void setupMainWindow();
	void setupEventRouting();
	void unpublish();

	WebSurfaceFactory m_surfaceFactory;
	QPointer<WindowRegistry> m_registry;
	QPointer<AppEventRouter> m_router;
	QPointer<ShellBridge> m_bridge;
	QPointer<QAction> m_quitAction;
	bool m_published = false;
};

} // namespace Shell
