// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sidecar/SidecarPlugin.hpp"

#include "sidecar/SidecarLocator.hpp"
#include "sidecar/SidecarSupervisor.hpp"

#include <extensionsystem/PluginManager.hpp>
#include <utils/EnvironmentQtPolicy.hpp>

#include <QtCore/QDir>

#include <cstdio>

Q_LOGGING_CATEGORY(sidecarlog, "plutoduck.sidecar")

namespace Sidecar {

SidecarContext contextFromEnvironment(const Utils::EnvironmentConfig& cfg)
{
	const Utils::Environment env(cfg);

	SidecarContext ctx;
#if defined(PLUTODUCK_PROJECT_DIR)
	ctx.projectDir = QString::fromUtf8(PLUTODUCK_PROJECT_DIR);
#endif
	const QString resourceOverride = env.resourceDirOverride();
	ctx.resourceDir = resourceOverride.isEmpty() ? platformResourceDir() : resourceOverride;
	ctx.appDataDir = env.paths().appDataDir;
	ctx.tempDir = QDir::tempPath();
	ctx.runtimeProgram = env.sidecarRuntime();
	return ctx;
}

SidecarPlugin::SidecarPlugin(QObject* parent)
	: ExtensionSystem::IPlugin(parent)
{
}

SidecarPlugin::~SidecarPlugin()
{
	if (m_published && m_supervisor)
		ExtensionSystem::PluginManager::removeObject(m_supervisor);
}

Utils::Result SidecarPlugin::initialize(const QStringList& arguments,
										ExtensionSystem::PluginManager& manager)
{
	Q_UNUSED(arguments);
	Q_UNUSED(manager);

	if (m_supervisor)
		return Utils::Result::failure("SidecarPlugin initialized twice.");

	m_supervisor = new SidecarSupervisor(contextFromEnvironment(Utils::applicationEnvironmentConfig()), this);
	ExtensionSystem::PluginManager::addObject(m_supervisor);
	m_published = true;

	// A missing sidecar leaves the shell usable on its default page.
	const SidecarLaunchResult launched = m_supervisor->launch();
	if (!launched) {
		const QString message = launched.error().toString();
		qCCritical(sidecarlog).noquote() << "node server launch failed:" << message;
		std::fputs(qPrintable(QString("node server launch failed: %1\n").arg(message)), stderr);
	}

	return Utils::Result::success();
}

ExtensionSystem::IPlugin::ShutdownFlag SidecarPlugin::aboutToShutdown()
{
	if (m_supervisor) {
		m_supervisor->shutdown();
		if (m_published) {
			ExtensionSystem::PluginManager::removeObject(m_supervisor);
			m_published = false;
		}
	}
	return ShutdownFlag::SynchronousShutdown;
}

} // namespace Sidecar
