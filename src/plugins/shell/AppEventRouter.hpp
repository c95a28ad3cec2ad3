// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "shell/ShellGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QStringList>

namespace Shell {

// Translates application-level events into shell lifecycle signals.
//
//   QEvent::Quit                         -> quitRequested()
//   ApplicationStateChange to active     -> reopenRequested()
//   QEvent::FileOpen with a non-file url -> urlsOpened()
//   first event-loop turn after start()  -> ready()
class SHELL_EXPORT AppEventRouter final : public QObject
{
	Q_OBJECT

public:
	// Filters events delivered to `source`, normally the application object.
	explicit AppEventRouter(QObject* source, QObject* parent = nullptr);
	~AppEventRouter() override;

	void start();
	bool isReady() const noexcept { return m_ready; }

signals:
	void ready();
	void quitRequested();
	void reopenRequested();
	void urlsOpened(const QStringList& urls);

protected:
	bool eventFilter(QObject* watched, QEvent* event) override;

private:
	QPointer<QObject> m_source;
	bool m_started = false;
	bool m_ready = false;
};

} // namespace Shell
