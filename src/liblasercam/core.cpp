// =====================================================================
//  src/liblasercam/core.cpp — Library initialization
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "lasercam/core.h"
#include "lasercam/log.h"

namespace lasercam {

Q_LOGGING_CATEGORY(lcImport, "lasercam.import", QtWarningMsg)
Q_LOGGING_CATEGORY(lcToolpath, "lasercam.toolpath", QtWarningMsg)
Q_LOGGING_CATEGORY(lcScene, "lasercam.scene", QtWarningMsg)

const char* version()
{
    return "0.3.0";
}

bool initialize()
{
    // Categories default to warnings; QT_LOGGING_RULES can still
    // raise them to debug without a rebuild.
    return true;
}

void shutdown()
{
}

}  // namespace lasercam
