// =====================================================================
//  src/liblasercam/lasercam/geometry/types.h — Basic geometry types
// =====================================================================
//
//  Fundamental geometric types used throughout liblasercam.
//  These are lightweight value types for arcs, bounds, and transforms.
//  Coordinates are in document units (millimeters on the machine side).
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_GEOMETRY_TYPES_H
#define LASERCAM_GEOMETRY_TYPES_H

#include "../core.h"

#include <QPointF>
#include <QRectF>
#include <QVector>
#include <QtMath>

#include <optional>

namespace lasercam {
namespace geometry {

// =====================================================================
//  Constants
// =====================================================================

/// Default tolerance for geometric comparisons (in mm)
constexpr double DEFAULT_TOLERANCE = 1e-6;

/// Tolerance for circle crossing searches (in mm)
constexpr double POINT_TOLERANCE = 0.5;

// =====================================================================
//  Arc Representation
// =====================================================================

/// Circular arc defined by center, radius, and angles
struct LASERCAM_EXPORT Arc {
    QPointF center;
    double radius = 0.0;
    double startAngle = 0.0;   ///< Start angle in degrees
    double sweepAngle = 360.0; ///< Sweep angle in degrees (positive = CCW)

    /// Get the start point of the arc
    QPointF startPoint() const;

    /// Get the end point of the arc
    QPointF endPoint() const;

    /// Get point at parameter t (0 = start, 1 = end)
    QPointF pointAt(double t) const;

    /// True when the arc has no extent (zero radius or zero sweep)
    bool isDegenerate() const;
};

// =====================================================================
//  Bounding Box
// =====================================================================

/// Axis-aligned bounding box with utility methods
struct LASERCAM_EXPORT BoundingBox {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;
    bool valid = false;

    BoundingBox() = default;
    BoundingBox(double x1, double y1, double x2, double y2);
    explicit BoundingBox(const QPointF& point);

    /// Expand to include a point
    void include(const QPointF& point);

    /// Expand to include another bounding box
    void include(const BoundingBox& other);

    /// Grow every side by a margin
    void expand(double margin);

    /// Get center point
    QPointF center() const;

    /// Get width
    double width() const { return maxX - minX; }

    /// Get height
    double height() const { return maxY - minY; }

    /// True when the box is valid and both extents are positive
    bool hasArea() const;

    /// Convert to QRectF
    QRectF toRect() const;

    /// Check if point is inside (inclusive)
    bool contains(const QPointF& point) const;
};

// =====================================================================
//  Transform
// =====================================================================

/// 2D affine transformation (2x3 matrix, implicit last row 0 0 1)
///
/// Composition follows the vector-graphics convention: in `a * b`
/// the transform `b` is applied first.
struct LASERCAM_EXPORT Transform2D {
    double m11 = 1.0, m12 = 0.0, m13 = 0.0;
    double m21 = 0.0, m22 = 1.0, m23 = 0.0;

    /// Identity transform
    static Transform2D identity();

    /// Build from the SVG matrix(a b c d e f) parameter order
    static Transform2D fromMatrix(double a, double b, double c,
                                  double d, double e, double f);

    /// Translation transform
    static Transform2D translation(double dx, double dy);

    /// Rotation transform (angle in degrees, around origin)
    static Transform2D rotation(double angleDegrees);

    /// Rotation transform (angle in degrees, around center point)
    static Transform2D rotation(double angleDegrees, const QPointF& center);

    /// Scale transform (uniform, around origin)
    static Transform2D scale(double factor);

    /// Scale transform (non-uniform, around origin)
    static Transform2D scale(double sx, double sy);

    /// Skew along X (angle in degrees)
    static Transform2D skewX(double angleDegrees);

    /// Skew along Y (angle in degrees)
    static Transform2D skewY(double angleDegrees);

    /// Apply transform to a point
    QPointF apply(const QPointF& point) const;

    /// Apply transform to multiple points
    QVector<QPointF> apply(const QVector<QPointF>& points) const;

    /// Determinant of the linear part
    double determinant() const;

    /// True when the linear part can be inverted
    bool isInvertible() const;

    /// True when this is (numerically) the identity
    bool isIdentity() const;

    /// Combine with another transform (this * other)
    Transform2D operator*(const Transform2D& other) const;

    bool operator==(const Transform2D& other) const;
    bool operator!=(const Transform2D& other) const { return !(*this == other); }
};

}  // namespace geometry
}  // namespace lasercam

#endif  // LASERCAM_GEOMETRY_TYPES_H
