// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sidecar/SidecarContext.hpp"

#include <QtCore/QString>

namespace Sidecar {

struct DataRootResolution final {
	QString path;            // <base>/node-server
	bool logsReady = false;  // <path>/logs exists
	bool usedFallback = false;
};

// <project>/../../.dev-data in dev builds, the app data dir (or <temp>/pluto_duck) otherwise.
SIDECAR_EXPORT QString dataRootBase(const SidecarContext& ctx);

// Resolves <base>/node-server and creates its logs/ directory. Creation failures are logged,
// and a packaged build retries under <temp>/pluto_duck before giving up; the supervisor
// reports the definitive error when it tries to open the log files.
SIDECAR_EXPORT DataRootResolution resolveDataRoot(const SidecarContext& ctx);

} // namespace Sidecar
