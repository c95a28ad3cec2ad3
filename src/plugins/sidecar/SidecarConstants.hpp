// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>

namespace Sidecar {
namespace Constants {

// NOTE: the environment variable names and log file names are read by the frontend server
// and by support tooling. Treat them as stable.

inline constexpr char SIDECAR_PLUGIN_ID[] = "Sidecar";

inline constexpr char FRONTEND_HOST[] = "127.0.0.1";
inline constexpr quint16 FRONTEND_PORT = 3100;

// Relative to the project directory (dev builds) or the resource directory (packaged builds).
inline constexpr char SERVER_DIST_DEBUG[] = "../../dist/pluto-duck-frontend-server";
inline constexpr char SERVER_DIST_RESOURCE[] = "dist/pluto-duck-frontend-server";
inline constexpr char SERVER_ENTRY[] = "server.js";

inline constexpr char DEV_DATA_DIR[] = "../../.dev-data";
inline constexpr char TEMP_DATA_DIR[] = "pluto_duck";
inline constexpr char DATA_ROOT_NAME[] = "node-server";
inline constexpr char LOG_DIR_NAME[] = "logs";
inline constexpr char STDOUT_LOG_NAME[] = "node-server-stdout.log";
inline constexpr char STDERR_LOG_NAME[] = "node-server-stderr.log";

inline constexpr char ENV_DATA_ROOT[] = "PLUTODUCK_DATA_DIR__ROOT";
inline constexpr char ENV_HOSTNAME[] = "HOSTNAME";
inline constexpr char ENV_PORT[] = "PORT";

inline constexpr char DEFAULT_RUNTIME[] = "node";

inline constexpr int READINESS_TIMEOUT_MS = 15000;
inline constexpr int PROBE_CONNECT_TIMEOUT_MS = 400;
inline constexpr int PROBE_RETRY_DELAY_MS = 200;

} // namespace Constants
} // namespace Sidecar
