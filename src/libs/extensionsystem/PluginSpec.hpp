// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QPointer>
#include <functional>

#include "extensionsystem/IPlugin.hpp"

namespace ExtensionSystem {

class EXTENSIONSYSTEM_EXPORT PluginSpec
{
public:
	enum class State {
		Registered,
		Instantiated,
		Initialized,
		Running,
		Stopped,
		Failed
	};

	using Factory = std::function<IPlugin*()>;

	PluginSpec() = default;

	PluginSpec(QString id, QStringList dependencies, Factory factory)
		: m_id(std::move(id))
		, m_dependencies(std::move(dependencies))
		, m_factory(std::move(factory))
	{}

	const QString& id() const { return m_id; }
	const QStringList& dependencies() const { return m_dependencies; }

	bool hasError() const { return !m_errors.isEmpty(); }
	const QStringList& errors() const { return m_errors; }
	QString errorString() const { return m_errors.join('\n'); }

	void addError(const QString& msg)
	{
		if (!msg.isEmpty())
			m_errors.push_back(msg);
		m_state = State::Failed;
	}

	State state() const { return m_state; }

	IPlugin* plugin() const { return m_plugin.data(); }

	IPlugin* instantiate();

	void markInitialized() { m_state = State::Initialized; }
	void markRunning() { m_state = State::Running; }
	void markStopped() { m_state = State::Stopped; }

	// Hands ownership of the plugin object back to the caller and forgets it.
	IPlugin* release();

private:
	QString m_id;
	QStringList m_dependencies;
	Factory m_factory;

	QStringList m_errors;
	State m_state = State::Registered;

	QPointer<IPlugin> m_plugin;
};

} // namespace ExtensionSystem
