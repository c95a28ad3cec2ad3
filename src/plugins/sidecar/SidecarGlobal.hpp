// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(SIDECAR_BUILD_SHARED) && (SIDECAR_BUILD_SHARED == 1)
#	if defined(SIDECAR_LIBRARY)
#		define SIDECAR_EXPORT Q_DECL_EXPORT
#	else
#		define SIDECAR_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define SIDECAR_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(sidecarlog)
