// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(NODEEDITOR_BUILD_SHARED) && (NODEEDITOR_BUILD_SHARED == 1)
#	if defined(NODEEDITOR_LIBRARY)
#		define NODEEDITOR_EXPORT Q_DECL_EXPORT
#	else
#		define NODEEDITOR_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define NODEEDITOR_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(nodeeditorlog)
