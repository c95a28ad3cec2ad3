// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sidecar/SidecarGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QStringView>
#include <QtCore/QUrl>

#include <optional>

namespace Sidecar {

// A numeric host and a TCP port. Host names are rejected on purpose: the sidecar only
// ever listens on a loopback literal, and resolving a name would put DNS in the probe loop.
struct SIDECAR_EXPORT Endpoint final {
	QString host;
	quint16 port = 0;

	// "127.0.0.1:3100", or "[::1]:3100" for IPv6 literals.
	QString authority() const;
	QUrl url() const;

	static std::optional<Endpoint> parse(QStringView text);

	friend bool operator==(const Endpoint& a, const Endpoint& b)
	{
		return a.host == b.host && a.port == b.port;
	}
};

} // namespace Sidecar
