// =====================================================================
//  src/liblasercam/lasercam/scene/eraser.h — Polyline eraser
// =====================================================================
//
//  Trims drawing polylines against a circular eraser.  Every segment
//  that passes through the circle is cut at the circle boundary and
//  the part inside is discarded, so a polyline can break into several
//  pieces.  Both functions are pure; the caller owns the pointer loop
//  and applies the returned scene.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_SCENE_ERASER_H
#define LASERCAM_SCENE_ERASER_H

#include "scene.h"

namespace lasercam {
namespace scene {

/// Pieces of a polyline left after erasing a circle from it
///
/// Pieces with fewer than 2 points or zero length are dropped.  Returns
/// the polyline unchanged (one piece) when no segment comes within
/// `radius` of `center`.
LASERCAM_EXPORT QVector<QVector<QPointF>> erasePolyline(
    const QVector<QPointF>& points, const QPointF& center, double radius,
    double tolerance = geometry::POINT_TOLERANCE);

/// Erase a circle from every visible top-level drawing of a scene
///
/// Each affected drawing is replaced by one new drawing per surviving
/// piece, re-centered on the piece's bounding-box center, with the
/// original stroke and fill.  A drawing erased completely disappears.
/// When nothing is touched the result carries the input scene unchanged.
LASERCAM_EXPORT SceneEdit eraseAt(const Scene& scene, const QPointF& center, double radius);

}  // namespace scene
}  // namespace lasercam

#endif  // LASERCAM_SCENE_ERASER_H
