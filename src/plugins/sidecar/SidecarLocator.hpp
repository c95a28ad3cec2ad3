// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sidecar/SidecarContext.hpp"
#include "sidecar/SidecarError.hpp"

#include <QtCore/QString>

namespace Sidecar {

// Directory that holds server.js. On failure `outRoot` is left untouched and the error
// names the directory that was probed.
SIDECAR_EXPORT SidecarError locateServerRoot(const SidecarContext& ctx, QString& outRoot);

// Where a packaged build keeps its resources, relative to the running executable.
SIDECAR_EXPORT QString platformResourceDir();

} // namespace Sidecar
