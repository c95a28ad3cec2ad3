// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "shell/ShellGlobal.hpp"

namespace Sidecar {
class ISidecarService;
}

namespace Shell {
class IShellWindow;

namespace WindowNavigator {

// Points `window` at the sidecar once its readiness has settled (ready, or the deadline
// elapsed). A disabled, failed or not yet started sidecar leaves the window on its current
// page. Returns whether a navigation was issued.
SHELL_EXPORT bool navigate(IShellWindow& window, const Sidecar::ISidecarService& sidecar);

} // namespace WindowNavigator
} // namespace Shell
