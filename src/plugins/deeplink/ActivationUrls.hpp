// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "deeplink/DeepLinkGlobal.hpp"

#include <QtCore/QStringList>

namespace DeepLink {

// Command-line arguments (program name excluded) that are absolute URLs in one of `schemes`.
// Scheme comparison is case-insensitive; order is preserved.
DEEPLINK_EXPORT QStringList activationUrlsFromArguments(const QStringList& arguments,
														const QStringList& schemes);

} // namespace DeepLink
