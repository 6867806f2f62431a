// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(SPOTLIGHT_BUILD_SHARED) && (SPOTLIGHT_BUILD_SHARED == 1)
#	if defined(SPOTLIGHT_LIBRARY)
#		define SPOTLIGHT_EXPORT Q_DECL_EXPORT
#	else
#		define SPOTLIGHT_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define SPOTLIGHT_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(spotlightlog)
