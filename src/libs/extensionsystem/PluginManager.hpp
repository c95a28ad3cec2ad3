// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>
#include <QtCore/QHash>

#include "extensionsystem/PluginSpec.hpp"

namespace ExtensionSystem {

class EXTENSIONSYSTEM_EXPORT PluginManager final : public QObject
{
	Q_OBJECT

public:
	static PluginManager& instance();

	static PluginSpec* specById(const char* id);
	static PluginSpec* specById(const QString& id);

	static void registerPlugin(PluginSpec spec);

	static bool loadPlugins(const QStringList& arguments = {});

	// Runs aboutToShutdown() in reverse load order, then deletes the plugins.
	// Safe to call more than once.
	static void shutdown();

	// Drops all specs, plugins and pooled objects. Used between test cases.
	static void reset();

	static QStringList loadOrder();

	static void addObject(QObject* obj);
	static void removeObject(QObject* obj);

	static QObject* getObject(const QString& objectName);

	template <class T>
	static T* getObject()
	{
		for (QObject* o : instance().m_objects) {
			if (auto* casted = qobject_cast<T*>(o))
				return casted;
		}
		return nullptr;
	}

	static QStringList lastErrors();

	~PluginManager() override;

signals:
	void pluginsLoaded();
	void shutdownFinished();

private:
	explicit PluginManager(QObject* parent = nullptr);

	bool validateGraph(QStringList& errors) const;
	bool computeLoadOrder(QVector<QString>& order, QStringList& errors) const;
	bool findCycle(QStringList& cycleOut) const;
	void deletePlugins();

	static bool isValidId(const QString& id);

private:
	QHash<QString, PluginSpec> m_specs;
	QVector<QString> m_loadOrder;
	QStringList m_lastErrors;

	QVector<QObject*> m_objects;
	QVector<IPlugin*> m_plugins;
	bool m_shutdownDone = false;
};

} // namespace ExtensionSystem
