// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtGlobal>

namespace DeepLink {
namespace Constants {

inline constexpr char DEEPLINK_PLUGIN_ID[] = "DeepLink";

// Page-side contract. The web app drains the queue on load and listens for the event afterwards.
inline constexpr char CALLBACK_QUEUE[] = "window.__plutoAuthCallbackQueue";
inline constexpr char CALLBACK_EVENT[] = "pluto-auth-callback";

// Single-instance channel
inline constexpr char INSTANCE_SERVER_PREFIX[] = "plutoduck-shell-";
inline constexpr char INSTANCE_MESSAGE_URLS[] = "urls";
inline constexpr int INSTANCE_CONNECT_TIMEOUT_MS = 300;
inline constexpr int INSTANCE_WRITE_TIMEOUT_MS = 1000;
inline constexpr qint64 INSTANCE_MAX_MESSAGE_BYTES = 64 * 1024;

} // namespace Constants
} // namespace DeepLink
