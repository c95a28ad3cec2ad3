// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "deeplink/DeepLinkPlugin.hpp"

#include "deeplink/ActivationDispatcher.hpp"
#include "deeplink/ActivationUrls.hpp"
#include "deeplink/InstanceChannel.hpp"

#include <extensionsystem/PluginManager.hpp>
#include <shell/AppEventRouter.hpp>
#include <shell/api/IWindowRegistry.hpp>
#include <utils/EnvironmentQtPolicy.hpp>

#include <QtCore/QTimer>

#include <utility>

Q_LOGGING_CATEGORY(deeplinklog, "plutoduck.deeplink")

namespace DeepLink {

DeepLinkPlugin::DeepLinkPlugin(QObject* parent)
	: ExtensionSystem::IPlugin(parent)
{
}

DeepLinkPlugin::~DeepLinkPlugin() = default;

Utils::Result DeepLinkPlugin::initialize(const QStringList& arguments,
										 ExtensionSystem::PluginManager& manager)
{
	Q_UNUSED(manager);

	auto* registry = ExtensionSystem::PluginManager::getObject<Shell::IWindowRegistry>();
	if (!registry)
		return Utils::Result::failure("DeepLinkPlugin requires the shell window registry.");

	m_dispatcher = new ActivationDispatcher(registry, this);

	if (auto* router = ExtensionSystem::PluginManager::getObject<Shell::AppEventRouter>())
		connect(router, &Shell::AppEventRouter::urlsOpened, m_dispatcher, &ActivationDispatcher::dispatch);
	else
		qCWarning(deeplinklog) << "no application event router - OS url activations are not routed";

	// main() claims the instance name before the sidecar blocks startup; adopt that channel.
	m_channel = ExtensionSystem::PluginManager::getObject<InstanceChannel>();
	if (!m_channel) {
		m_channel = new InstanceChannel(this);
		m_ownsChannel = true;
		m_channel->holdActivations();
		m_channel->listen();
	}

	connect(m_channel, &InstanceChannel::activationReceived, m_dispatcher, &ActivationDispatcher::dispatch);
	QPointer<Shell::IWindowRegistry> target = registry;
	connect(m_channel, &InstanceChannel::reopenRequested, this, [target] {
		if (target)
			target->reopen();
	});

	const Utils::Environment env(Utils::applicationEnvironmentConfig());
	m_coldStartUrls = activationUrlsFromArguments(arguments, env.deepLinkSchemes());
	return Utils::Result::success();
}

void DeepLinkPlugin::extensionsInitialized(ExtensionSystem::PluginManager& manager)
{
	Q_UNUSED(manager);

	// Runs once the event loop turns, after the main window is shown. Cold-start links go
	// first, then whatever other instances sent while this one was starting.
	const QStringList urls = std::exchange(m_coldStartUrls, {});
	QPointer<ActivationDispatcher> dispatcher = m_dispatcher;
	QPointer<InstanceChannel> channel = m_channel;
	QTimer::singleShot(0, this, [dispatcher, channel, urls] {
		if (dispatcher && !urls.isEmpty())
			dispatcher->dispatch(urls);
		if (channel)
			channel->releaseActivations();
	});
}

ExtensionSystem::IPlugin::ShutdownFlag DeepLinkPlugin::aboutToShutdown()
{
	if (m_channel) {
		if (m_ownsChannel)
			delete m_channel;
		else
			m_channel->disconnect(this);
	}
	return ShutdownFlag::SynchronousShutdown;
}

} // namespace DeepLink
