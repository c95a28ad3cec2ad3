// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(SHELL_BUILD_SHARED) && (SHELL_BUILD_SHARED == 1)
#	if defined(SHELL_LIBRARY)
#		define SHELL_EXPORT Q_DECL_EXPORT
#	else
#		define SHELL_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define SHELL_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(shelllog)
