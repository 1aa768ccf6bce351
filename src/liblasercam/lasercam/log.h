// =====================================================================
//  src/liblasercam/lasercam/log.h — Logging categories
// =====================================================================
//
//  Qt logging categories used by the library.  Enable debug output
//  with QT_LOGGING_RULES="lasercam.*.debug=true".
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_LOG_H
#define LASERCAM_LOG_H

#include "core.h"

#include <QLoggingCategory>

namespace lasercam {

Q_DECLARE_EXPORTED_LOGGING_CATEGORY(lcImport, LASERCAM_EXPORT)
Q_DECLARE_EXPORTED_LOGGING_CATEGORY(lcToolpath, LASERCAM_EXPORT)
Q_DECLARE_EXPORTED_LOGGING_CATEGORY(lcScene, LASERCAM_EXPORT)

}  // namespace lasercam

#endif  // LASERCAM_LOG_H
