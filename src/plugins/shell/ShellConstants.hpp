// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtGlobal>

namespace Shell {
namespace Constants {

// NOTE: window ids are used by the deep-link dispatcher to find its target.

inline constexpr char SHELL_PLUGIN_ID[] = "Shell";

inline constexpr char MAIN_WINDOW_ID[] = "main";
inline constexpr char WINDOW_TITLE[] = "Pluto Duck";
inline constexpr char WINDOW_OBJECT_NAME_PREFIX[] = "PlutoDuck.Window.";
inline constexpr int DEFAULT_WINDOW_WIDTH = 1400;
inline constexpr int DEFAULT_WINDOW_HEIGHT = 900;

// Transparent strip kept above the page on macOS so the traffic lights do not overlap content.
inline constexpr int MACOS_TITLEBAR_HEIGHT = 40;
inline constexpr char MACOS_TITLEBAR_OBJECT_NAME[] = "PlutoDuck.TitlebarReserve";

// Page bridge
inline constexpr char BRIDGE_OBJECT_NAME[] = "plutoShell";
inline constexpr char QWEBCHANNEL_JS_RESOURCE[] = ":/qtwebchannel/qwebchannel.js";

inline constexpr char QUIT_ACTION_ID[] = "PlutoDuck.Action.Quit";

} // namespace Constants
} // namespace Shell
