// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(DEEPLINK_BUILD_SHARED) && (DEEPLINK_BUILD_SHARED == 1)
#	if defined(DEEPLINK_LIBRARY)
#		define DEEPLINK_EXPORT Q_DECL_EXPORT
#	else
#		define DEEPLINK_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define DEEPLINK_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(deeplinklog)
