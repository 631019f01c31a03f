// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>

#if defined(NODEEDITORWIDGETS_BUILD_SHARED) && (NODEEDITORWIDGETS_BUILD_SHARED == 1)
#	if defined(NODEEDITORWIDGETS_LIBRARY)
#		define NODEEDITORWIDGETS_EXPORT Q_DECL_EXPORT
#	else
#		define NODEEDITORWIDGETS_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define NODEEDITORWIDGETS_EXPORT
#endif
