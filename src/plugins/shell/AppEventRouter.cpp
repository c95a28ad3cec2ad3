// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "shell/AppEventRouter.hpp"

#include <QtCore/QEvent>
#include <QtCore/QTimer>
#include <QtGui/QFileOpenEvent>

namespace Shell {

AppEventRouter::AppEventRouter(QObject* source, QObject* parent)
	: QObject(parent)
	, m_source(source)
{
	setObjectName("Shell.AppEventRouter");
	if (m_source)
		m_source->installEventFilter(this);
}

AppEventRouter::~AppEventRouter()
{
	if (m_source)
		m_source->removeEventFilter(this);
}

void AppEventRouter::start()
{
	if (m_started)
		return;
	m_started = true;

	QTimer::singleShot(0, this, [this] {
		m_ready = true;
		qCInfo(shelllog) << "App is ready";
		emit ready();
	});
}

bool AppEventRouter::eventFilter(QObject* watched, QEvent* event)
{
	if (watched != m_source)
		return QObject::eventFilter(watched, event);

	switch (event->type()) {
	case QEvent::Quit:
		emit quitRequested();
		break;
	case QEvent::ApplicationStateChange: {
		const auto* change = static_cast<QApplicationStateChangeEvent*>(event);
		if (change->applicationState() == Qt::ApplicationActive)
			emit reopenRequested();
		break;
	}
	case QEvent::FileOpen: {
		const auto* open = static_cast<QFileOpenEvent*>(event);
		const QUrl url = open->url();
		if (url.isValid() && !url.isLocalFile()) {
			// Characters such as '"' and '\\' reach the page as the OS sent them, not percent-encoded.
			emit urlsOpened({url.toString(QUrl::DecodeReserved)});
			return true;
		}
		qCDebug(shelllog) << "ignoring file open request" << open->file();
		break;
	}
	default:
		break;
	}

	return QObject::eventFilter(watched, event);
}

} // namespace Shell
