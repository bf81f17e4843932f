// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(ARCHDIAGRAM_BUILD_SHARED) && (ARCHDIAGRAM_BUILD_SHARED == 1)
#	if defined(ARCHDIAGRAM_LIBRARY)
#		define ARCHDIAGRAM_EXPORT Q_DECL_EXPORT
#	else
#		define ARCHDIAGRAM_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define ARCHDIAGRAM_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(archdiagramlog)
