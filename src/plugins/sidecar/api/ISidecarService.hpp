// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sidecar/SidecarError.hpp"
#include "sidecar/SidecarGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QUrl>

namespace Sidecar {

// Published in the plugin object pool by the Sidecar plugin.
class SIDECAR_EXPORT ISidecarService : public QObject
{
	Q_OBJECT

public:
	enum class Status {
		NotStarted,
		Disabled,   // dev build, an external dev server is used instead
		Failed,
		Running,    // spawned, readiness not yet observed
		Ready,
		TimedOut,   // spawned, the readiness deadline elapsed
		Stopped
	};
	Q_ENUM(Status)

	explicit ISidecarService(QObject* parent = nullptr) : QObject(parent) {}
	~ISidecarService() override = default;

	virtual Status status() const = 0;
	virtual QUrl url() const = 0;
	virtual SidecarError lastError() const = 0;
	virtual qint64 processId() const = 0;

	// True once the window may be pointed at url().
	bool readinessSettled() const
	{
		const Status s = status();
		return s == Status::Ready || s == Status::TimedOut;
	}

signals:
	void statusChanged(Sidecar::ISidecarService::Status status);
};

} // namespace Sidecar
