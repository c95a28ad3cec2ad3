// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "shell/WebSurface.hpp"

#include <QtCore/QPointer>

QT_BEGIN_NAMESPACE
class QWebChannel;
class QWebEngineView;
QT_END_NAMESPACE

namespace Shell {

// Chromium-backed surface. Objects registered here are reachable from the page through
// window.plutoShell.invoke(name, args).
class SHELL_EXPORT WebEngineSurface final : public WebSurface
{
public:
	explicit WebEngineSurface(QWidget* parent);
	~WebEngineSurface() override;

	QWidget* widget() const override;

	void load(const QUrl& url) override;
	QUrl url() const override;

	void runJavaScript(const QString& script) override;
	void registerObject(const QString& name, QObject* object) override;

	static WebSurfaceFactory factory();

private:
	void installBridgeScript();

	QPointer<QWebEngineView> m_view;
	QPointer<QWebChannel> m_channel;
};

} // namespace Shell
