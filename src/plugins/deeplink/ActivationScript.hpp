// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "deeplink/DeepLinkGlobal.hpp"

#include <QtCore/QString>

namespace DeepLink {

// `text` as a JSON string literal, quotes included.
DEEPLINK_EXPORT QString jsonStringLiteral(const QString& text);

// Script that appends `url` to the page's callback queue and fires the callback event.
// The url is embedded only as a JSON string literal, never as raw script text.
DEEPLINK_EXPORT QString activationScript(const QString& url);

} // namespace DeepLink
