// =====================================================================
//  src/liblasercam/lasercam/scene/parts.h — Parametric part outlines
// =====================================================================
//
//  Expands a parametric part into the polylines a laser follows.
//  Outlines are in the part's local frame: centered on the part
//  anchor, before rotation.  Inner features (holes, inner rings) come
//  before the outer contour so a cut-through part does not shift
//  before its holes are cut.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_SCENE_PARTS_H
#define LASERCAM_SCENE_PARTS_H

#include "item.h"

namespace lasercam {
namespace scene {

/// One polyline of a part outline
struct LASERCAM_EXPORT PartOutline {
    QVector<QPointF> points;
    bool closed = false;
};

/// Expand a part into local outlines
///
/// Degenerate pieces (zero radius, zero size) are left out, so a part
/// whose parameters are all zero yields an empty list.
LASERCAM_EXPORT QVector<PartOutline> partOutlines(const Part& part);

/// Bounding box of a part's outlines in its local frame
LASERCAM_EXPORT geometry::BoundingBox partBounds(const Part& part);

}  // namespace scene
}  // namespace lasercam

#endif  // LASERCAM_SCENE_PARTS_H
