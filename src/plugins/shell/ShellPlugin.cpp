// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "shell/ShellPlugin.hpp"

#include "shell/AppEventRouter.hpp"
#include "shell/ShellBridge.hpp"
#include "shell/ShellConstants.hpp"
#include "shell/ShellWindow.hpp"
#include "shell/WebEngineSurface.hpp"
#include "shell/WindowNavigator.hpp"
#include "shell/WindowRegistry.hpp"

#include <extensionsystem/PluginManager.hpp>
#include <sidecar/api/ISidecarService.hpp>
#include <utils/EnvironmentQtPolicy.hpp>

#include <QtCore/QCoreApplication>
#include <QtGui/QAction>
#include <QtGui/QKeySequence>

#include <utility>

Q_LOGGING_CATEGORY(shelllog, "plutoduck.shell")

namespace Shell {

ShellPlugin::ShellPlugin(QObject* parent)
	: ExtensionSystem::IPlugin(parent)
{
}

ShellPlugin::ShellPlugin(WebSurfaceFactory surfaceFactory, QObject* parent)
	: ExtensionSystem::IPlugin(parent)
	, m_surfaceFactory(std::move(surfaceFactory))
{
}

ShellPlugin::~ShellPlugin()
{
	unpublish();
}

Utils::Result ShellPlugin::initialize(const QStringList& arguments,
									  ExtensionSystem::PluginManager& manager)
{
	Q_UNUSED(arguments);
	Q_UNUSED(manager);

	qCInfo(shelllog) << "Initializing...";
	if (m_registry)
		return Utils::Result::failure("ShellPlugin initialized twice.");

	m_bridge = new ShellBridge(this);

	const WebSurfaceFactory webFactory = m_surfaceFactory ? m_surfaceFactory : WebEngineSurface::factory();
	QPointer<ShellBridge> bridge = m_bridge;
	m_registry = new WindowRegistry([webFactory, bridge](QWidget* parent) {
		std::unique_ptr<WebSurface> surface = webFactory(parent);
		if (surface && bridge)
			surface->registerObject(QString::fromLatin1(Constants::BRIDGE_OBJECT_NAME), bridge);
		return surface;
	}, this);

	m_quitAction = new QAction(tr("Quit Pluto Duck"), this);
	m_quitAction->setObjectName(QString::fromLatin1(Constants::QUIT_ACTION_ID));
	m_quitAction->setShortcut(QKeySequence::Quit);
	m_quitAction->setMenuRole(QAction::QuitRole);
	connect(m_quitAction, &QAction::triggered, this, [] { QCoreApplication::quit(); });

	setupMainWindow();
	setupEventRouting();

	ExtensionSystem::PluginManager::addObject(m_registry);
	ExtensionSystem::PluginManager::addObject(m_router);
	m_published = true;

	return Utils::Result::success();
}

void ShellPlugin::setupMainWindow()
{
	const Utils::Environment env(Utils::applicationEnvironmentConfig());
	const QUrl defaultUrl = QUrl::fromUserInput(env.defaultUrl());

	ShellWindow* window = m_registry->ensureWindow(QString::fromLatin1(Constants::MAIN_WINDOW_ID), defaultUrl);
	window->installQuitAction(m_quitAction);

	auto* sidecar = ExtensionSystem::PluginManager::getObject<Sidecar::ISidecarService>();
	if (!sidecar) {
		qCWarning(shelllog) << "failed to navigate window to node server: no sidecar service";
		return;
	}

	if (!WindowNavigator::navigate(*window, *sidecar)) {
		// Readiness may still settle later; navigate then.
		QPointer<ShellWindow> target = window;
		connect(sidecar, &Sidecar::ISidecarService::statusChanged, window,
				[target, sidecar](Sidecar::ISidecarService::Status) {
					if (target && sidecar->readinessSettled())
						WindowNavigator::navigate(*target, *sidecar);
				});
	}
}

void ShellPlugin::setupEventRouting()
{
	m_router = new AppEventRouter(QCoreApplication::instance(), this);

	QPointer<WindowRegistry> registry = m_registry;
	connect(m_router, &AppEventRouter::quitRequested, this, [registry] {
		if (registry)
			registry->setQuitting(true);
	});
	connect(m_router, &AppEventRouter::reopenRequested, this, [registry] {
		if (registry)
			registry->reopen();
	});
	if (auto* app = QCoreApplication::instance()) {
		connect(app, &QCoreApplication::aboutToQuit, this, [registry] {
			if (registry)
				registry->setQuitting(true);
		});
	}
}

void ShellPlugin::extensionsInitialized(ExtensionSystem::PluginManager& manager)
{
	Q_UNUSED(manager);

	if (m_registry) {
		if (IShellWindow* main = m_registry->mainWindow())
			main->showAndFocus();
	}
	if (m_router)
		m_router->start();
}

ExtensionSystem::IPlugin::ShutdownFlag ShellPlugin::aboutToShutdown()
{
	if (m_registry)
		m_registry->setQuitting(true);
	unpublish();
	return ShutdownFlag::SynchronousShutdown;
}

void ShellPlugin::unpublish()
{
	if (!m_published)
		return;
	m_published = false;

	if (m_router)
		ExtensionSystem::PluginManager::removeObject(m_router);
	if (m_registry)
		ExtensionSystem::PluginManager::removeObject(m_registry);
}

} // namespace Shell
