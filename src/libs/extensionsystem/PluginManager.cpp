// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/PluginManager.hpp"

#include <QtCore/QEventLoop>
#include <QtCore/QSet>

#include <algorithm>
#include <functional>

Q_LOGGING_CATEGORY(extensionsystemlog, "plutoduck.extensionsystem")

namespace ExtensionSystem {

PluginManager& PluginManager::instance()
{
	static PluginManager pm;
	return pm;
}

PluginManager::PluginManager(QObject* parent)
	: QObject(parent)
{
}

PluginManager::~PluginManager()
{
	deletePlugins();
	m_objects.clear();
}

PluginSpec* PluginManager::specById(const char* id)
{
	return specById(QString::fromUtf8(id));
}

PluginSpec* PluginManager::specById(const QString& id)
{
	auto& self = instance();
	auto it = self.m_specs.find(id);
	if (it == self.m_specs.end())
		return nullptr;
	return &it.value();
}

QStringList PluginManager::lastErrors()
{
	return instance().m_lastErrors;
}

QStringList PluginManager::loadOrder()
{
	const auto& order = instance().m_loadOrder;
	return QStringList(order.begin(), order.end());
}

bool PluginManager::isValidId(const QString& id)
{
	if (id.isEmpty())
		return false;

	return std::all_of(id.cbegin(), id.cend(), [](QChar c) {
		return c.isLetterOrNumber() || c == '_' || c == '-' || c == '.';
	});
}

void PluginManager::registerPlugin(PluginSpec spec)
{
	auto& self = instance();
	const QString id = spec.id();

	if (!isValidId(id)) {
		self.m_lastErrors.push_back(QString("Invalid plugin id '%1'.").arg(id));
		return;
	}

	if (self.m_specs.contains(id)) {
		self.m_specs[id].addError(QString("Duplicate plugin id '%1' registered.").arg(id));
		self.m_lastErrors.push_back(QString("Duplicate plugin id '%1' registered.").arg(id));
		return;
	}

	qCDebug(extensionsystemlog) << "registered plugin" << id << "deps:" << spec.dependencies();
	self.m_specs.insert(id, std::move(spec));
}

void PluginManager::reset()
{
	auto& self = instance();
	self.deletePlugins();
	self.m_specs.clear();
	self.m_loadOrder.clear();
	self.m_lastErrors.clear();
	self.m_objects.clear();
	self.m_shutdownDone = false;
}

bool PluginManager::validateGraph(QStringList& errors) const
{
	for (auto it = m_specs.cbegin(); it != m_specs.cend(); ++it) {
		for (const QString& e : it.value().errors())
			errors.push_back(QString("Plugin '%1': %2").arg(it.key(), e));
	}
	if (!errors.isEmpty())
		return false;

	for (auto it = m_specs.cbegin(); it != m_specs.cend(); ++it) {
		const QString& id = it.key();
		for (const QString& dep : it.value().dependencies()) {
			if (dep == id)
				errors.push_back(QString("Plugin '%1' depends on itself.").arg(id));
			else if (!m_specs.contains(dep))
				errors.push_back(QString("Plugin '%1' depends on missing plugin '%2'.").arg(id, dep));
		}
	}

	return errors.isEmpty();
}

bool PluginManager::findCycle(QStringList& cycleOut) const
{
	enum class Mark { None, Visiting, Done };
	QHash<QString, Mark> marks;
	QStringList stack;

	std::function<bool(const QString&)> visit = [&](const QString& id) -> bool {
		marks[id] = Mark::Visiting;
		stack.push_back(id);

		QStringList deps = m_specs.value(id).dependencies();
		deps.sort(Qt::CaseSensitive);
		for (const QString& dep : deps) {
			const Mark m = marks.value(dep, Mark::None);
			if (m == Mark::Visiting) {
				cycleOut = stack.mid(stack.indexOf(dep));
				cycleOut.push_back(dep);
				return true;
			}
			if (m == Mark::None && visit(dep))
				return true;
		}

		stack.pop_back();
		marks[id] = Mark::Done;
		return false;
	};

	QStringList ids = m_specs.keys();
	ids.sort(Qt::CaseSensitive);
	for (const QString& id : std::as_const(ids)) {
		if (marks.value(id, Mark::None) == Mark::None && visit(id))
			return true;
	}
	return false;
}

bool PluginManager::computeLoadOrder(QVector<QString>& order, QStringList& errors) const
{
	if (!validateGraph(errors))
		return false;

	// Kahn's algorithm; ties are broken alphabetically so the order is stable.
	QHash<QString, int> pending;
	for (auto it = m_specs.cbegin(); it != m_specs.cend(); ++it)
		pending.insert(it.key(), int(it.value().dependencies().size()));

	order.clear();
	order.reserve(m_specs.size());

	while (!pending.isEmpty()) {
		QStringList ready;
		for (auto it = pending.cbegin(); it != pending.cend(); ++it) {
			if (it.value() == 0)
				ready.push_back(it.key());
		}
		if (ready.isEmpty())
			break;

		ready.sort(Qt::CaseSensitive);
		const QString next = ready.front();
		pending.remove(next);
		order.push_back(next);

		for (auto it = pending.begin(); it != pending.end(); ++it) {
			if (m_specs.value(it.key()).dependencies().contains(next))
				--it.value();
		}
	}

	if (!pending.isEmpty()) {
		QStringList cycle;
		if (findCycle(cycle))
			errors.push_back(QString("Dependency cycle detected: %1").arg(cycle.join(" -> ")));
		else
			errors.push_back("Dependency cycle detected in plugin graph.");
		return false;
	}

	return true;
}

bool PluginManager::loadPlugins(const QStringList& arguments)
{
	auto& self = instance();
	self.m_lastErrors.clear();
	self.m_shutdownDone = false;

	QVector<QString> order;
	QStringList errors;
	if (!self.computeLoadOrder(order, errors)) {
		self.m_lastErrors = std::move(errors);
		return false;
	}
	self.m_loadOrder = order;

	for (const QString& id : std::as_const(self.m_loadOrder)) {
		PluginSpec& spec = self.m_specs[id];

		IPlugin* plugin = spec.instantiate();
		if (!plugin) {
			self.m_lastErrors.push_back(QString("Failed to instantiate plugin '%1':\n%2")
										.arg(id, spec.errorString()));
			return false;
		}
		self.m_plugins.push_back(plugin);

		qCInfo(extensionsystemlog) << "initializing plugin" << id;
		const auto r = plugin->initialize(arguments, self);
		if (!r.ok) {
			spec.addError(r.errors.isEmpty() ? QString("Unknown initialization error.") : r.errorString());
			self.m_lastErrors.push_back(QString("Plugin '%1' initialize() failed:\n%2")
										.arg(id, spec.errorString()));
			return false;
		}

		spec.markInitialized();
	}

	for (const QString& id : std::as_const(self.m_loadOrder)) {
		PluginSpec& spec = self.m_specs[id];
		if (auto* p = spec.plugin()) {
			p->extensionsInitialized(self);
			spec.markRunning();
		}
	}

	emit self.pluginsLoaded();
	return true;
}

void PluginManager::shutdown()
{
	auto& self = instance();
	if (self.m_shutdownDone)
		return;
	self.m_shutdownDone = true;

	QSet<IPlugin*> pendingAsync;
	QEventLoop loop;

	for (auto it = self.m_loadOrder.crbegin(); it != self.m_loadOrder.crend(); ++it) {
		PluginSpec* spec = specById(*it);
		if (!spec || !spec->plugin())
			continue;

		IPlugin* plugin = spec->plugin();
		qCInfo(extensionsystemlog) << "shutting down plugin" << *it;
		if (plugin->aboutToShutdown() == IPlugin::ShutdownFlag::AsynchronousShutdown) {
			pendingAsync.insert(plugin);
			connect(plugin, &IPlugin::asynchronousShutdownFinished, &loop, [&pendingAsync, &loop, plugin] {
				pendingAsync.remove(plugin);
				if (pendingAsync.isEmpty())
					loop.quit();
			});
		}
		spec->markStopped();
	}

	if (!pendingAsync.isEmpty())
		loop.exec();

	self.deletePlugins();
	emit self.shutdownFinished();
}

void PluginManager::deletePlugins()
{
	// Reverse load order so dependents go before the plugins they use.
	for (auto it = m_loadOrder.crbegin(); it != m_loadOrder.crend(); ++it) {
		auto specIt = m_specs.find(*it);
		if (specIt == m_specs.end())
			continue;
		if (IPlugin* p = specIt.value().release()) {
			m_plugins.removeAll(p);
			delete p;
		}
	}
	qDeleteAll(m_plugins);
	m_plugins.clear();
}

void PluginManager::addObject(QObject* obj)
{
	if (!obj)
		qFatal("PluginManager::addObject called with null.");

	auto& self = instance();

	if (self.m_objects.contains(obj))
		qFatal("PluginManager::addObject called with same object twice.");

	self.m_objects.push_back(obj);
}

void PluginManager::removeObject(QObject* obj)
{
	auto& self = instance();
	const auto idx = self.m_objects.indexOf(obj);
	if (idx < 0)
		qFatal("PluginManager::removeObject called with unknown object.");
	self.m_objects.removeAt(idx);
}

QObject* PluginManager::getObject(const QString& objectName)
{
	auto& self = instance();
	for (QObject* o : std::as_const(self.m_objects)) {
		if (o && o->objectName() == objectName)
			return o;
	}
	return nullptr;
}

} // namespace ExtensionSystem
