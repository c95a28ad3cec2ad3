// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sidecar/SidecarConstants.hpp"
#include "sidecar/SidecarGlobal.hpp"

#include <QtCore/QStringView>

#include <chrono>

namespace Sidecar {

struct ProbeOptions final {
	std::chrono::milliseconds connectTimeout{Constants::PROBE_CONNECT_TIMEOUT_MS};
	std::chrono::milliseconds retryDelay{Constants::PROBE_RETRY_DELAY_MS};
};

// Blocks until a TCP connection to `endpoint` ("host:port") succeeds or `timeout` elapses.
// Nothing is written on the connection; it is aborted as soon as it is established.
// An endpoint that does not parse returns false without attempting anything.
SIDECAR_EXPORT bool waitForServer(QStringView endpoint,
								  std::chrono::milliseconds timeout,
								  const ProbeOptions& options = {});

} // namespace Sidecar
