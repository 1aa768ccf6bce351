// =====================================================================
//  src/liblasercam/lasercam/toolpath/engrave.h — Vector lowering
// =====================================================================
//
//  Lowers the items of one ENGRAVE layer to a constant-power program:
//  a rapid to each path's first point, then a cut through every
//  following point, repeated once per pass.  Parts are expanded with
//  the curve sampler; groups recurse with their transforms composed.
//  Text and image items cannot be reduced to cuttable paths and only
//  leave a comment.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_TOOLPATH_ENGRAVE_H
#define LASERCAM_TOOLPATH_ENGRAVE_H

#include "result.h"
#include "settings.h"
#include "../scene/item.h"

namespace lasercam {
namespace toolpath {

/// Coordinate decimals of engrave programs
constexpr int ENGRAVE_DECIMALS = 3;

/// Cuttable paths of an item in document coordinates (before flipY)
///
/// Each path has at least 2 finite points.  Text and images yield none.
LASERCAM_EXPORT QVector<QVector<QPointF>> engravePaths(const scene::ItemShape& shape);

/// Emit the ENGRAVE program of one layer
/// @param layer    Layer to lower; only items with its id are used
/// @param items    Scene items (any layer)
/// @param settings Engrave parameters; the layer's power overrides
/// @param progress Called after each item; may cancel
LASERCAM_EXPORT EmitResult emitEngraveInstructions(
    const scene::Layer& layer,
    const QVector<scene::CanvasItem>& items,
    const EngraveSettings& settings,
    const ProgressCallback& progress = {});

}  // namespace toolpath
}  // namespace lasercam

#endif  // LASERCAM_TOOLPATH_ENGRAVE_H
