// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QPointer>
#include <QtCore/QStringList>

#include "extensionsystem/IPlugin.hpp"

namespace DeepLink {
class ActivationDispatcher;
class InstanceChannel;

class DeepLinkPlugin final : public ExtensionSystem::IPlugin
{
	Q_OBJECT

public:
	explicit DeepLinkPlugin(QObject* parent = nullptr);
	~DeepLinkPlugin() override;

	Utils::Result initialize(const QStringList& arguments,
							 ExtensionSystem::PluginManager& manager) override;

	void extensionsInitialized(ExtensionSystem::PluginManager& manager) override;

	ShutdownFlag aboutToShutdown() override;

private:
	QPointer<ActivationDispatcher> m_dispatcher;
	QPointer<InstanceChannel> m_channel;
	QStringList m_coldStartUrls;
	bool m_ownsChannel = false;
};

} // namespace DeepLink
