// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sidecar/ReadinessProbe.hpp"

#include "sidecar/Endpoint.hpp"

#include <QtCore/QDeadlineTimer>
#include <QtCore/QThread>
#include <QtNetwork/QHostAddress>
#include <QtNetwork/QTcpSocket>

#include <algorithm>

namespace Sidecar {

namespace {

bool tryConnect(const QHostAddress& address, quint16 port, std::chrono::milliseconds connectTimeout)
{
	QTcpSocket socket;
	socket.connectToHost(address, port);
	const bool connected = socket.waitForConnected(int(connectTimeout.count()));
	socket.abort();
	return connected;
}

} // namespace

bool waitForServer(QStringView endpoint, std::chrono::milliseconds timeout, const ProbeOptions& options)
{
	const auto parsed = Endpoint::parse(endpoint);
	if (!parsed) {
		qCWarning(sidecarlog) << "readiness probe: invalid endpoint" << endpoint;
		return false;
	}

	const QHostAddress address(parsed->host);
	const QDeadlineTimer deadline(timeout);
	int attempts = 0;

	while (!deadline.hasExpired()) {
		++attempts;
		if (tryConnect(address, parsed->port, options.connectTimeout)) {
			qCDebug(sidecarlog) << "readiness probe:" << parsed->authority()
								<< "accepted after" << attempts << "attempt(s)";
			return true;
		}

		const auto remaining = std::chrono::milliseconds(deadline.remainingTime());
		QThread::msleep(static_cast<unsigned long>(std::min(options.retryDelay, remaining).count()));
	}

	qCDebug(sidecarlog) << "readiness probe:" << parsed->authority() << "gave up after" << attempts
						<< "attempt(s)";
	return false;
}

} // namespace Sidecar
