// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCoreApplication>
#include <QtCore/QLoggingCategory>
#include <QtCore/QStringList>

#include <QtWidgets/QApplication>

#include "deeplink/ActivationUrls.hpp"
#include "deeplink/DeepLinkConstants.hpp"
#include "deeplink/DeepLinkPlugin.hpp"
#include "deeplink/InstanceChannel.hpp"
#include "extensionsystem/PluginManager.hpp"
#include "extensionsystem/PluginSpec.hpp"
#include "shell/ShellConstants.hpp"
#include "shell/ShellPlugin.hpp"
#include "sidecar/SidecarConstants.hpp"
#include "sidecar/SidecarPlugin.hpp"
#include "utils/EnvironmentQtPolicy.hpp"

#include <cstdlib>

using namespace ExtensionSystem;

Q_LOGGING_CATEGORY(applog, "plutoduck.app")

#ifndef PLUTODUCK_VERSION
#define PLUTODUCK_VERSION "0.0.0"
#endif

static void applyLoggingRules(const Utils::Environment& env)
{
	QStringList rules;
#if !defined(PLUTODUCK_DEV_BUILD)
	rules << QStringLiteral("plutoduck.*.debug=false");
#endif

	// Users separate extra rules with ';' in the INI file.
	const QString extra = env.logFilterRules();
	for (const QString& rule : extra.split(QLatin1Char(';'), Qt::SkipEmptyParts))
		rules << rule.trimmed();

	if (!rules.isEmpty())
		QLoggingCategory::setFilterRules(rules.join(QLatin1Char('\n')));
}

static void registerShellPlugins()
{
	PluginManager::registerPlugin(PluginSpec(
		QString::fromLatin1(Sidecar::Constants::SIDECAR_PLUGIN_ID), {},
		[] { return new Sidecar::SidecarPlugin; }));

	PluginManager::registerPlugin(PluginSpec(
		QString::fromLatin1(Shell::Constants::SHELL_PLUGIN_ID),
		{QString::fromLatin1(Sidecar::Constants::SIDECAR_PLUGIN_ID)},
		[] { return new Shell::ShellPlugin; }));

	PluginManager::registerPlugin(PluginSpec(
		QString::fromLatin1(DeepLink::Constants::DEEPLINK_PLUGIN_ID),
		{QString::fromLatin1(Shell::Constants::SHELL_PLUGIN_ID)},
		[] { return new DeepLink::DeepLinkPlugin; }));
}

static void printErrorsAndFail(const QString& header, const QStringList& errors)
{
	qCritical().noquote() << header;
	for (const QString& e : errors)
		qCritical().noquote() << "  " << e;
}

int main(int argc, char** argv)
{
	QCoreApplication::setOrganizationName(QStringLiteral("PlutoDuck"));
	QCoreApplication::setApplicationName(QStringLiteral("Pluto Duck"));
	QCoreApplication::setApplicationVersion(QStringLiteral(PLUTODUCK_VERSION));
	QCoreApplication::setAttribute(Qt::AA_ShareOpenGLContexts);

	QApplication app(argc, argv);
	app.setQuitOnLastWindowClosed(false);

	const Utils::Environment env(Utils::applicationEnvironmentConfig());
	applyLoggingRules(env);

	// Another instance owns the windows and the sidecar; hand it our links and leave.
	const QStringList activationUrls =
		DeepLink::activationUrlsFromArguments(app.arguments(), env.deepLinkSchemes());
	if (DeepLink::InstanceChannel::forwardToPrimary(activationUrls)) {
		qCInfo(applog) << "forwarded" << activationUrls.size() << "activation url(s) to the running instance";
		return EXIT_SUCCESS;
	}

	// Claim the instance name before plugin startup blocks on the sidecar, so launches in that
	// window are queued here instead of starting a second shell.
	DeepLink::InstanceChannel instanceChannel;
	instanceChannel.holdActivations();
	if (!instanceChannel.listen()) {
		if (DeepLink::InstanceChannel::forwardToPrimary(activationUrls)) {
			qCInfo(applog) << "forwarded" << activationUrls.size() << "activation url(s) to the running instance";
			return EXIT_SUCCESS;
		}
		qCWarning(applog) << "continuing without the single-instance channel";
	}
	PluginManager::addObject(&instanceChannel);

	registerShellPlugins();

	// Exit path: plugins shut down in reverse order before exec() returns.
	QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [] {
		qCInfo(applog) << "App is exiting";
		PluginManager::shutdown();
	});

	if (!PluginManager::loadPlugins(app.arguments())) {
		printErrorsAndFail("Failed to load plugins.", PluginManager::lastErrors());
		PluginManager::shutdown();
		PluginManager::removeObject(&instanceChannel);
		return EXIT_FAILURE;
	}

	const int rc = app.exec();
	PluginManager::shutdown();
	PluginManager::removeObject(&instanceChannel);
	return rc;
}
