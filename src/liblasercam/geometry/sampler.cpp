// =====================================================================
//  src/liblasercam/geometry/sampler.cpp — Curve flattening
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/geometry/sampler.h>
#include <lasercam/geometry/utils.h>
#include <lasercam/log.h>

#include <algorithm>
#include <cmath>

namespace lasercam {
namespace geometry {

namespace {

/// Pieces per curved segment when measuring length
constexpr int FINE_STEPS = 64;

/// A dense polyline with cumulative lengths
struct FinePath {
    QVector<QPointF> points;
    QVector<double> lengths;       ///< Cumulative length at each point
    QVector<double> junctions;     ///< Cumulative length at segment ends
};

FinePath flatten(const PathContour& contour)
{
    FinePath fine;
    if (contour.isEmpty()) {
        return fine;
    }

    fine.points.append(contour.first().start());
    fine.lengths.append(0.0);

    for (const PathSegment& seg : contour) {
        int steps = seg.kind == PathSegment::Kind::Line ? 1 : FINE_STEPS;
        for (int i = 1; i <= steps; ++i) {
            QPointF p = seg.pointAt(static_cast<double>(i) / steps);
            double len = fine.lengths.last() + distance(fine.points.last(), p);
            fine.points.append(p);
            fine.lengths.append(len);
        }
        fine.junctions.append(fine.lengths.last());
    }
    return fine;
}

/// Point at cumulative length `s` along a dense polyline
QPointF pointAtLength(const FinePath& fine, double s, int& cursor)
{
    int last = fine.points.size() - 1;
    while (cursor < last - 1 && fine.lengths[cursor + 1] < s) {
        ++cursor;
    }
    double l0 = fine.lengths[cursor];
    double l1 = fine.lengths[cursor + 1];
    double span = l1 - l0;
    double t = span > DEFAULT_TOLERANCE ? (s - l0) / span : 0.0;
    return lerp(fine.points[cursor], fine.points[cursor + 1], qBound(0.0, t, 1.0));
}

}  // anonymous namespace

// =====================================================================
//  Arcs and ellipses
// =====================================================================

int arcSegmentCount(double sweepDegrees, int segmentsPerCircle)
{
    int segments = static_cast<int>(
        std::ceil(segmentsPerCircle * qAbs(sweepDegrees) / 360.0));
    return qMax(4, segments);
}

QVector<QPointF> sampleArc(const Arc& arc, int segmentsPerCircle)
{
    QVector<QPointF> points;
    if (arc.isDegenerate()) {
        return points;
    }

    int segments = arcSegmentCount(arc.sweepAngle, segmentsPerCircle);
    points.reserve(segments + 1);
    for (int i = 0; i <= segments; ++i) {
        points.append(arc.pointAt(static_cast<double>(i) / segments));
    }
    return points;
}

QVector<QPointF> sampleCircle(const QPointF& center, double radius, int segments)
{
    Arc arc;
    arc.center = center;
    arc.radius = radius;
    arc.startAngle = 0.0;
    arc.sweepAngle = 360.0;
    return sampleArc(arc, segments);
}

QVector<QPointF> sampleEllipse(const QPointF& center, double rx, double ry, int segments)
{
    QVector<QPointF> points;
    if (!(rx > DEFAULT_TOLERANCE) || !(ry > DEFAULT_TOLERANCE) || segments < 1) {
        return points;
    }

    points.reserve(segments + 1);
    for (int i = 0; i <= segments; ++i) {
        double angle = 2.0 * M_PI * i / segments;
        points.append(center + QPointF(rx * qCos(angle), ry * qSin(angle)));
    }
    return points;
}

std::optional<Arc> bulgeToArc(const QPointF& p1, const QPointF& p2, double bulge)
{
    double chord = distance(p1, p2);
    if (qAbs(bulge) < DEFAULT_TOLERANCE || chord < DEFAULT_TOLERANCE) {
        return std::nullopt;
    }

    // Included angle is 4*atan(bulge); positive bulge turns CCW
    double theta = 4.0 * qAtan(bulge);
    double radius = chord / (2.0 * qSin(qAbs(theta) / 2.0));

    // Distance from chord midpoint to center, signed by the bulge side
    double sagitta = radius * qCos(theta / 2.0);
    QPointF mid = (p1 + p2) / 2.0;
    QPointF dir = (p2 - p1) / chord;
    QPointF normal(-dir.y(), dir.x());
    double side = bulge > 0 ? 1.0 : -1.0;
    QPointF center = mid + normal * (side * sagitta);

    Arc arc;
    arc.center = center;
    arc.radius = radius;
    arc.startAngle = qRadiansToDegrees(qAtan2(p1.y() - center.y(), p1.x() - center.x()));
    arc.sweepAngle = qRadiansToDegrees(theta);
    return arc;
}

// =====================================================================
//  Path segments
// =====================================================================

QPointF EllipticalArc::pointAt(double t) const
{
    double angle = qDegreesToRadians(startAngle + t * sweepAngle);
    double phi = qDegreesToRadians(rotation);
    double ex = rx * qCos(angle);
    double ey = ry * qSin(angle);
    return center + QPointF(qCos(phi) * ex - qSin(phi) * ey,
                            qSin(phi) * ex + qCos(phi) * ey);
}

std::optional<EllipticalArc> svgArcToCenter(
    const QPointF& from, double rx, double ry, double rotationDegrees,
    bool largeArc, bool sweep, const QPointF& to)
{
    if (qAbs(from.x() - to.x()) < 1e-10 && qAbs(from.y() - to.y()) < 1e-10) {
        return std::nullopt;
    }

    rx = qAbs(rx);
    ry = qAbs(ry);
    if (rx < 1e-10 || ry < 1e-10) {
        return std::nullopt;
    }

    double phiRad = qDegreesToRadians(rotationDegrees);
    double cosPhi = qCos(phiRad);
    double sinPhi = qSin(phiRad);

    // Step 1: endpoint midpoint in the rotated frame
    double dx = (from.x() - to.x()) / 2.0;
    double dy = (from.y() - to.y()) / 2.0;
    double x1p = cosPhi * dx + sinPhi * dy;
    double y1p = -sinPhi * dx + cosPhi * dy;

    // Step 2: scale radii up if they cannot span the chord
    double x1pSq = x1p * x1p;
    double y1pSq = y1p * y1p;
    double lambda = x1pSq / (rx * rx) + y1pSq / (ry * ry);
    if (lambda > 1.0) {
        double sqrtLambda = qSqrt(lambda);
        rx *= sqrtLambda;
        ry *= sqrtLambda;
    }
    double rxSq = rx * rx;
    double rySq = ry * ry;

    double num = rxSq * rySq - rxSq * y1pSq - rySq * x1pSq;
    double denom = rxSq * y1pSq + rySq * x1pSq;
    double sq = denom > 0.0 ? qMax(0.0, num / denom) : 0.0;
    double coef = qSqrt(sq) * ((largeArc == sweep) ? -1.0 : 1.0);

    double cxp = coef * rx * y1p / ry;
    double cyp = -coef * ry * x1p / rx;

    // Step 3: center in user space
    double mx = (from.x() + to.x()) / 2.0;
    double my = (from.y() + to.y()) / 2.0;

    // Step 4: angles
    auto angle = [](double ux, double uy, double vx, double vy) {
        double d = ux * vx + uy * vy;
        double len = qSqrt(ux * ux + uy * uy) * qSqrt(vx * vx + vy * vy);
        double ang = qAcos(qBound(-1.0, d / len, 1.0));
        if (ux * vy - uy * vx < 0) ang = -ang;
        return ang;
    };

    double ux = (x1p - cxp) / rx;
    double uy = (y1p - cyp) / ry;
    double vx = (-x1p - cxp) / rx;
    double vy = (-y1p - cyp) / ry;

    EllipticalArc arc;
    arc.center = QPointF(cosPhi * cxp - sinPhi * cyp + mx,
                         sinPhi * cxp + cosPhi * cyp + my);
    arc.rx = rx;
    arc.ry = ry;
    arc.rotation = rotationDegrees;
    arc.startAngle = qRadiansToDegrees(angle(1, 0, ux, uy));
    arc.sweepAngle = qRadiansToDegrees(angle(ux, uy, vx, vy));

    if (!sweep && arc.sweepAngle > 0) {
        arc.sweepAngle -= 360;
    } else if (sweep && arc.sweepAngle < 0) {
        arc.sweepAngle += 360;
    }
    return arc;
}

PathSegment PathSegment::line(const QPointF& from, const QPointF& to)
{
    PathSegment seg;
    seg.kind = Kind::Line;
    seg.p0 = from;
    seg.p3 = to;
    return seg;
}

PathSegment PathSegment::cubic(const QPointF& p0, const QPointF& c1,
                               const QPointF& c2, const QPointF& p3)
{
    PathSegment seg;
    seg.kind = Kind::Cubic;
    seg.p0 = p0;
    seg.p1 = c1;
    seg.p2 = c2;
    seg.p3 = p3;
    return seg;
}

PathSegment PathSegment::quadratic(const QPointF& p0, const QPointF& c, const QPointF& p2)
{
    // Degree elevation to a cubic
    QPointF c1 = p0 + 2.0 / 3.0 * (c - p0);
    QPointF c2 = p2 + 2.0 / 3.0 * (c - p2);
    return cubic(p0, c1, c2, p2);
}

PathSegment PathSegment::ellipticalArc(const EllipticalArc& arc)
{
    PathSegment seg;
    seg.kind = Kind::Arc;
    seg.arc = arc;
    seg.p0 = arc.pointAt(0.0);
    seg.p3 = arc.pointAt(1.0);
    return seg;
}

QPointF PathSegment::pointAt(double t) const
{
    switch (kind) {
    case Kind::Line:
        return lerp(p0, p3, t);
    case Kind::Cubic: {
        double mt = 1.0 - t;
        double a = mt * mt * mt;
        double b = 3.0 * mt * mt * t;
        double c = 3.0 * mt * t * t;
        double d = t * t * t;
        return p0 * a + p1 * b + p2 * c + p3 * d;
    }
    case Kind::Arc:
        return arc.pointAt(t);
    }
    return p0;
}

double contourLength(const PathContour& contour)
{
    FinePath fine = flatten(contour);
    return fine.lengths.isEmpty() ? 0.0 : fine.lengths.last();
}

QVector<QPointF> sampleContour(const PathContour& contour, const Transform2D& transform)
{
    QVector<QPointF> result;
    FinePath fine = flatten(contour);
    if (fine.points.size() < 2) {
        return result;
    }

    double total = fine.lengths.last();
    if (!(total > DEFAULT_TOLERANCE) || !std::isfinite(total)) {
        return result;
    }
    if (total > MAX_PATH_LENGTH) {
        qCWarning(lcImport) << "Skipping contour of length" << total
                            << "beyond" << MAX_PATH_LENGTH;
        return result;
    }

    int steps = qMax(static_cast<int>(std::floor(total)), MIN_PATH_STEPS);

    // Merge the uniform stations with segment junctions
    QVector<double> stations;
    stations.reserve(steps + 1 + fine.junctions.size());
    for (int i = 0; i <= steps; ++i) {
        stations.append(total * i / steps);
    }
    for (double j : fine.junctions) {
        stations.append(j);
    }
    std::sort(stations.begin(), stations.end());

    int cursor = 0;
    double previous = -1.0;
    result.reserve(stations.size());
    for (double s : stations) {
        if (s - previous < DEFAULT_TOLERANCE) {
            continue;
        }
        previous = s;
        result.append(transform.apply(pointAtLength(fine, s, cursor)));
    }
    return result;
}

// =====================================================================
//  Splines
// =====================================================================

QVector<QPointF> sampleControlPolygon(const QVector<QPointF>& controlPoints)
{
    if (controlPoints.size() < 2) {
        return controlPoints;
    }

    int steps = qMax(controlPoints.size() * 8, MIN_SPLINE_STEPS);
    QVector<QPointF> result;
    result.reserve(steps + 1);

    QVector<QPointF> work(controlPoints.size());
    for (int i = 0; i <= steps; ++i) {
        double t = static_cast<double>(i) / steps;
        work = controlPoints;
        for (int level = work.size() - 1; level > 0; --level) {
            for (int k = 0; k < level; ++k) {
                work[k] = lerp(work[k], work[k + 1], t);
            }
        }
        result.append(work.first());
    }
    return result;
}

}  // namespace geometry
}  // namespace lasercam
