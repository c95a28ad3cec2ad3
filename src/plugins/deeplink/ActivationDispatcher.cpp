// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "deeplink/ActivationDispatcher.hpp"

#include "deeplink/ActivationScript.hpp"

#include <shell/api/IWindowRegistry.hpp>

namespace DeepLink {

ActivationDispatcher::ActivationDispatcher(Shell::IWindowRegistry* registry, QObject* parent)
	: QObject(parent)
	, m_registry(registry)
{
	setObjectName("DeepLink.ActivationDispatcher");
}

int ActivationDispatcher::dispatch(const QStringList& urls)
{
	if (urls.isEmpty())
		return 0;

	qCInfo(deeplinklog) << "App opened with URLs:" << urls;

	Shell::IShellWindow* window = m_registry ? m_registry->mainWindow() : nullptr;
	if (!window) {
		qCWarning(deeplinklog) << "no main window - dropping" << urls.size() << "activation url(s)";
		return 0;
	}

	window->showAndFocus();

	int delivered = 0;
	for (const QString& url : urls) {
		window->evaluateScript(activationScript(url));
		++delivered;
	}
	return delivered;
}

} // namespace DeepLink
