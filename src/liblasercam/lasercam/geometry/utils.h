// =====================================================================
//  src/liblasercam/lasercam/geometry/utils.h — Geometry utility functions
// =====================================================================
//
//  Point/vector math, transform composition, bounds, and the distance
//  and crossing queries used by the eraser.  All functions are pure.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_GEOMETRY_UTILS_H
#define LASERCAM_GEOMETRY_UTILS_H

#include "types.h"

#include <QString>

namespace lasercam {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================

/// Compute the dot product of two vectors (as QPointF)
LASERCAM_EXPORT double dot(const QPointF& a, const QPointF& b);

/// Compute the cross product (z-component) of two 2D vectors
LASERCAM_EXPORT double cross(const QPointF& a, const QPointF& b);

/// Compute the length of a vector
LASERCAM_EXPORT double length(const QPointF& v);

/// Euclidean distance between two points
LASERCAM_EXPORT double distance(const QPointF& a, const QPointF& b);

/// Linear interpolation between two points
LASERCAM_EXPORT QPointF lerp(const QPointF& a, const QPointF& b, double t);

/// Rotate a point around a center by angle (degrees)
LASERCAM_EXPORT QPointF rotatePointAround(
    const QPointF& point, const QPointF& center, double angleDegrees);

/// True when both coordinates are finite
LASERCAM_EXPORT bool isFinitePoint(const QPointF& p);

// =====================================================================
//  Transform Composition
// =====================================================================

/// Matrix product a * b (b is applied first)
LASERCAM_EXPORT Transform2D compose(const Transform2D& a, const Transform2D& b);

/// Apply a transform to a point
LASERCAM_EXPORT QPointF apply(const Transform2D& t, const QPointF& p);

/// Local placement of an item: translate(position) * rotate(rotation)
LASERCAM_EXPORT Transform2D placement(const QPointF& position, double rotationDegrees);

// =====================================================================
//  Bounds
// =====================================================================

/// Compute the bounding box of a point sequence (invalid when empty)
LASERCAM_EXPORT BoundingBox boundingBox(const QVector<QPointF>& points);

// =====================================================================
//  Segment Queries
// =====================================================================

/// Project a point onto a segment, returning the clamped parameter t in [0,1]
/// Returns 0 for a zero-length segment.
LASERCAM_EXPORT double projectPointOnSegment(
    const QPointF& point, const QPointF& a, const QPointF& b);

/// Distance from a point to segment ab
///
/// Projects onto the segment and clamps the parameter to [0,1].  A
/// zero-length segment falls back to point distance.
LASERCAM_EXPORT double pointSegmentDistance(
    const QPointF& p, const QPointF& a, const QPointF& b);

/// Locate where segment ab crosses the circle (center, radius)
///
/// Bisects the segment parameter for up to 20 iterations, starting from
/// the endpoint inside the circle toward the one outside, and stops when
/// the distance to the center is within `tolerance` of `radius`.
/// Returns std::nullopt when both endpoints are on the same side of the
/// circle (no crossing in range).
LASERCAM_EXPORT std::optional<QPointF> circleSegmentIntersection(
    const QPointF& center, double radius,
    const QPointF& a, const QPointF& b,
    double tolerance = POINT_TOLERANCE);

// =====================================================================
//  Numeric helpers
// =====================================================================

/// Round to a fixed number of decimals (0.5 rounds away from zero)
LASERCAM_EXPORT double roundTo(double value, int decimals);

/// Format a coordinate the way instruction streams expect: no trailing
/// zeros, no exponent, "-0" normalized to "0"
LASERCAM_EXPORT QString formatNumber(double value, int decimals);

}  // namespace geometry
}  // namespace lasercam

#endif  // LASERCAM_GEOMETRY_UTILS_H
