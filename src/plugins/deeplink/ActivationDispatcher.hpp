// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "deeplink/DeepLinkGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QStringList>

namespace Shell {
class IWindowRegistry;
}

namespace DeepLink {

// Hands activation URLs to the page in the main window.
class DEEPLINK_EXPORT ActivationDispatcher final : public QObject
{
	Q_OBJECT

public:
	explicit ActivationDispatcher(Shell::IWindowRegistry* registry, QObject* parent = nullptr);

public slots:
	// Shows and focuses the main window, then evaluates one activation script per url, in
	// order. A batch that arrives while there is no main window is dropped. Returns the
	// number of scripts evaluated.
	int dispatch(const QStringList& urls);

private:
	QPointer<Shell::IWindowRegistry> m_registry;
};

} // namespace DeepLink
