// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/PluginSpec.hpp"

namespace ExtensionSystem {

IPlugin* PluginSpec::instantiate()
{
	if (m_state == State::Failed)
		return nullptr;

	if (m_plugin)
		return m_plugin.data();

	if (!m_factory) {
		addError(QString("Plugin '%1' has no factory.").arg(m_id));
		return nullptr;
	}

	IPlugin* p = m_factory();
	if (!p) {
		addError(QString("Plugin '%1' factory returned null.").arg(m_id));
		return nullptr;
	}

	p->setObjectName(m_id);
	m_plugin = p;
	m_state = State::Instantiated;
	return p;
}

IPlugin* PluginSpec::release()
{
	IPlugin* p = m_plugin.data();
	m_plugin.clear();
	return p;
}

} // namespace ExtensionSystem
