// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QPointer>
#include <QtCore/QStringList>

#include "extensionsystem/IPlugin.hpp"
#include "sidecar/SidecarContext.hpp"

namespace Utils {
struct EnvironmentConfig;
}

namespace Sidecar {
class SidecarSupervisor;

// Builds the host description the supervisor runs against from the user settings.
SIDECAR_EXPORT SidecarContext contextFromEnvironment(const Utils::EnvironmentConfig& cfg);

class SidecarPlugin final : public ExtensionSystem::IPlugin
{
	Q_OBJECT

public:
	explicit SidecarPlugin(QObject* parent = nullptr);
	~SidecarPlugin() override;

	Utils::Result initialize(const QStringList& arguments,
							 ExtensionSystem::PluginManager& manager) override;

	ShutdownFlag aboutToShutdown() override;

private:
	QPointer<SidecarSupervisor> m_supervisor;
	bool m_published = false;
};

} // namespace Sidecar
