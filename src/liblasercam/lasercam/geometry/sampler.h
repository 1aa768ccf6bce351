// =====================================================================
//  src/liblasercam/lasercam/geometry/sampler.h — Curve flattening
// =====================================================================
//
//  Converts closed-form curves (circular and elliptical arcs, cubic
//  and quadratic Bezier paths, spline control polygons, polyline
//  bulges) into ordered point sequences.  Sampling is deterministic
//  for a given input and step count.  Degenerate curves produce an
//  empty sequence instead of NaN points.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_GEOMETRY_SAMPLER_H
#define LASERCAM_GEOMETRY_SAMPLER_H

#include "types.h"

#include <QVector>

namespace lasercam {
namespace geometry {

/// Segments used for a full circle or ellipse
constexpr int CIRCLE_SEGMENTS = 64;

/// Minimum number of arc-length steps for a path
constexpr int MIN_PATH_STEPS = 128;

/// Longest contour, in local units, that sampleContour will sample
constexpr double MAX_PATH_LENGTH = 1.0e6;

/// Minimum number of steps for a control-polygon spline
constexpr int MIN_SPLINE_STEPS = 64;

// =====================================================================
//  Arcs and ellipses
// =====================================================================

/// Number of segments for an arc sweep, scaled from CIRCLE_SEGMENTS
LASERCAM_EXPORT int arcSegmentCount(double sweepDegrees,
                                    int segmentsPerCircle = CIRCLE_SEGMENTS);

/// Sample a circular arc into segments+1 points (both ends included)
/// Returns an empty vector for a zero radius or zero sweep.
LASERCAM_EXPORT QVector<QPointF> sampleArc(const Arc& arc,
                                           int segmentsPerCircle = CIRCLE_SEGMENTS);

/// Sample a full circle into segments+1 points starting at angle 0
LASERCAM_EXPORT QVector<QPointF> sampleCircle(const QPointF& center, double radius,
                                              int segments = CIRCLE_SEGMENTS);

/// Sample a full axis-aligned ellipse into segments+1 points
LASERCAM_EXPORT QVector<QPointF> sampleEllipse(const QPointF& center,
                                               double rx, double ry,
                                               int segments = CIRCLE_SEGMENTS);

/// Arc through p1 and p2 described by a polyline bulge (tan(sweep/4))
/// Returns std::nullopt for a zero bulge or coincident endpoints.
LASERCAM_EXPORT std::optional<Arc> bulgeToArc(const QPointF& p1, const QPointF& p2,
                                              double bulge);

// =====================================================================
//  Path segments
// =====================================================================

/// Elliptical arc in center parameterization (angles in degrees)
struct LASERCAM_EXPORT EllipticalArc {
    QPointF center;
    double rx = 0.0;
    double ry = 0.0;
    double rotation = 0.0;     ///< X-axis rotation in degrees
    double startAngle = 0.0;
    double sweepAngle = 0.0;

    QPointF pointAt(double t) const;
};

/// Convert SVG arc endpoint parameters to center parameterization
///
/// Radii that are too small to span the chord are scaled up.  Returns
/// std::nullopt when the endpoints coincide or a radius is zero; the
/// caller then treats the arc as a straight line.
LASERCAM_EXPORT std::optional<EllipticalArc> svgArcToCenter(
    const QPointF& from, double rx, double ry, double rotationDegrees,
    bool largeArc, bool sweep, const QPointF& to);

/// One drawable piece of a path
struct LASERCAM_EXPORT PathSegment {
    enum class Kind { Line, Cubic, Arc };

    Kind kind = Kind::Line;
    QPointF p0, p1, p2, p3;    ///< Line uses p0/p3; Cubic uses all four
    EllipticalArc arc;         ///< Used when kind == Arc

    static PathSegment line(const QPointF& from, const QPointF& to);
    static PathSegment cubic(const QPointF& p0, const QPointF& c1,
                             const QPointF& c2, const QPointF& p3);
    static PathSegment quadratic(const QPointF& p0, const QPointF& c,
                                 const QPointF& p2);
    static PathSegment ellipticalArc(const EllipticalArc& arc);

    /// Point at parameter t in [0,1]
    QPointF pointAt(double t) const;

    /// First and last point
    QPointF start() const { return pointAt(0.0); }
    QPointF end() const { return pointAt(1.0); }
};

/// A connected run of segments (one subpath)
using PathContour = QVector<PathSegment>;

/// Estimate the arc length of a contour (fine polyline approximation)
LASERCAM_EXPORT double contourLength(const PathContour& contour);

/// Sample a contour at max(floor(length), MIN_PATH_STEPS) equal
/// arc-length steps, keeping every segment junction so corners stay
/// sharp, then map each sample through `transform`.
/// Returns an empty vector for a zero-length contour or one longer than
/// MAX_PATH_LENGTH.
LASERCAM_EXPORT QVector<QPointF> sampleContour(
    const PathContour& contour,
    const Transform2D& transform = Transform2D::identity());

// =====================================================================
//  Splines
// =====================================================================

/// Flatten a control polygon by repeated de Casteljau interpolation
/// over max(controlPoints * 8, MIN_SPLINE_STEPS) steps.
/// Returns the input unchanged when it has fewer than 2 points.
LASERCAM_EXPORT QVector<QPointF> sampleControlPolygon(
    const QVector<QPointF>& controlPoints);

}  // namespace geometry
}  // namespace lasercam

#endif  // LASERCAM_GEOMETRY_SAMPLER_H
