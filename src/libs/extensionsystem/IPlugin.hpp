// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <utils/Result.hpp>

namespace ExtensionSystem {

class PluginManager;

// Plugins are owned by the PluginManager. initialize() runs in dependency order,
// aboutToShutdown() in reverse order when the application quits.
class EXTENSIONSYSTEM_EXPORT IPlugin : public QObject
{
	Q_OBJECT

public:
	enum class ShutdownFlag {
		SynchronousShutdown,
		AsynchronousShutdown
	};
	Q_ENUM(ShutdownFlag)

	explicit IPlugin(QObject* parent = nullptr) : QObject(parent) {}
	~IPlugin() override = default;

	virtual Utils::Result initialize(const QStringList& arguments, PluginManager& manager) = 0;

	virtual void extensionsInitialized(PluginManager& /*manager*/) {}

	virtual ShutdownFlag aboutToShutdown() { return ShutdownFlag::SynchronousShutdown; }

	signals:
		void asynchronousShutdownFinished();
};

} // namespace ExtensionSystem
