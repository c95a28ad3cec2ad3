// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(EXTENSIONSYSTEM_BUILD_SHARED) && (EXTENSIONSYSTEM_BUILD_SHARED == 1)
#	if defined(EXTENSIONSYSTEM_LIBRARY)
#		define EXTENSIONSYSTEM_EXPORT Q_DECL_EXPORT
#	else
#		define EXTENSIONSYSTEM_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define EXTENSIONSYSTEM_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(extensionsystemlog)
