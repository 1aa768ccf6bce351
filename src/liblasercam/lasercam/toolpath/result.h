// =====================================================================
//  src/liblasercam/lasercam/toolpath/result.h — Emission results
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_TOOLPATH_RESULT_H
#define LASERCAM_TOOLPATH_RESULT_H

#include "program.h"

#include <functional>

namespace lasercam {
namespace toolpath {

/// Outcome of an emission pass
enum class EmitStatus {
    Ok,
    NothingToEmit,  ///< The layer holds no items of its printing method
    Cancelled,      ///< The progress callback asked to stop
    Error
};

/// Counters collected while emitting
struct LASERCAM_EXPORT EmitStats {
    int rowsProcessed = 0;     ///< Scan rows that produced motion
    int rowsSkipped = 0;       ///< Blank scan rows inside the content bounds
    int paths = 0;             ///< Engrave paths (per pass)
    int cuttingMoves = 0;      ///< G1 lines written
    int itemsSkipped = 0;      ///< Items that could not be lowered
};

/// Result of emitting one layer
struct LASERCAM_EXPORT EmitResult {
    bool success = false;
    EmitStatus status = EmitStatus::Error;
    QString errorMessage;
    Program program;
    EmitStats stats;

    /// Program text, empty unless the pass succeeded
    QString toText() const { return success ? program.toText() : QString(); }
};

/// Progress report: (done, total); return false to cancel
using ProgressCallback = std::function<bool(int done, int total)>;

}  // namespace toolpath
}  // namespace lasercam

#endif  // LASERCAM_TOOLPATH_RESULT_H
