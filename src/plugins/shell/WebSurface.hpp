// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "shell/ShellGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QUrl>

#include <functional>
#include <memory>

QT_BEGIN_NAMESPACE
class QObject;
class QWidget;
QT_END_NAMESPACE

namespace Shell {

// The web content area of a shell window. The widget is parented to the window; the surface
// object itself is owned by the window.
class SHELL_EXPORT WebSurface
{
public:
	virtual ~WebSurface() = default;

	virtual QWidget* widget() const = 0;

	virtual void load(const QUrl& url) = 0;
	virtual QUrl url() const = 0;

	// Fire-and-forget; results are not reported back.
	virtual void runJavaScript(const QString& script) = 0;

	// Exposes `object` to page scripts as window.<name>.
	virtual void registerObject(const QString& name, QObject* object) = 0;
};

using WebSurfaceFactory = std::function<std::unique_ptr<WebSurface>(QWidget* parent)>;

} // namespace Shell
