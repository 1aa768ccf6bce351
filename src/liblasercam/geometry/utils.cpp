// =====================================================================
//  src/liblasercam/geometry/utils.cpp — Geometry utility functions
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/geometry/utils.h>

#include <QString>

#include <cmath>

namespace lasercam {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================

double dot(const QPointF& a, const QPointF& b)
{
    return a.x() * b.x() + a.y() * b.y();
}

double cross(const QPointF& a, const QPointF& b)
{
    return a.x() * b.y() - a.y() * b.x();
}

double length(const QPointF& v)
{
    return qSqrt(v.x() * v.x() + v.y() * v.y());
}

double distance(const QPointF& a, const QPointF& b)
{
    return length(b - a);
}

QPointF lerp(const QPointF& a, const QPointF& b, double t)
{
    return QPointF(
        a.x() + t * (b.x() - a.x()),
        a.y() + t * (b.y() - a.y())
    );
}

QPointF rotatePointAround(const QPointF& point, const QPointF& center, double angleDegrees)
{
    if (angleDegrees == 0.0) {
        return point;
    }

    double rad = qDegreesToRadians(angleDegrees);
    double c = qCos(rad);
    double s = qSin(rad);
    QPointF rel = point - center;
    return center + QPointF(rel.x() * c - rel.y() * s,
                            rel.x() * s + rel.y() * c);
}

bool isFinitePoint(const QPointF& p)
{
    return qIsFinite(p.x()) && qIsFinite(p.y());
}

// =====================================================================
//  Transform Composition
// =====================================================================

Transform2D compose(const Transform2D& a, const Transform2D& b)
{
    return a * b;
}

QPointF apply(const Transform2D& t, const QPointF& p)
{
    return t.apply(p);
}

Transform2D placement(const QPointF& position, double rotationDegrees)
{
    Transform2D t = Transform2D::translation(position.x(), position.y());
    if (rotationDegrees != 0.0) {
        t = t * Transform2D::rotation(rotationDegrees);
    }
    return t;
}

// =====================================================================
//  Bounds
// =====================================================================

BoundingBox boundingBox(const QVector<QPointF>& points)
{
    BoundingBox bbox;
    for (const QPointF& p : points) {
        bbox.include(p);
    }
    return bbox;
}

// =====================================================================
//  Segment Queries
// =====================================================================

double projectPointOnSegment(const QPointF& point, const QPointF& a, const QPointF& b)
{
    QPointF ab = b - a;
    double lenSq = dot(ab, ab);
    if (lenSq < DEFAULT_TOLERANCE * DEFAULT_TOLERANCE) {
        return 0.0;
    }
    return qBound(0.0, dot(point - a, ab) / lenSq, 1.0);
}

double pointSegmentDistance(const QPointF& p, const QPointF& a, const QPointF& b)
{
    if (a == b) {
        return distance(p, a);
    }
    double t = projectPointOnSegment(p, a, b);
    return distance(p, lerp(a, b, t));
}

std::optional<QPointF> circleSegmentIntersection(
    const QPointF& center, double radius,
    const QPointF& a, const QPointF& b,
    double tolerance)
{
    double da = distance(center, a) - radius;
    double db = distance(center, b) - radius;

    if (qAbs(da) < tolerance) return a;
    if (qAbs(db) < tolerance) return b;

    // Both ends on the same side: no crossing in [0,1]
    if ((da < 0) == (db < 0)) {
        return std::nullopt;
    }

    // tIn always maps inside the circle, tOut outside
    double tIn = da < 0 ? 0.0 : 1.0;
    double tOut = da < 0 ? 1.0 : 0.0;

    for (int i = 0; i < 20; ++i) {
        double mid = (tIn + tOut) / 2.0;
        QPointF p = lerp(a, b, mid);
        double d = distance(center, p);
        if (qAbs(d - radius) < tolerance) {
            return p;
        }
        if (d > radius) {
            tOut = mid;
        } else {
            tIn = mid;
        }
    }

    return lerp(a, b, tOut);
}

// =====================================================================
//  Numeric helpers
// =====================================================================

double roundTo(double value, int decimals)
{
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

QString formatNumber(double value, int decimals)
{
    double rounded = roundTo(value, decimals);
    if (rounded == 0.0) {
        return QStringLiteral("0");
    }

    QString text = QString::number(rounded, 'f', decimals);
    if (text.contains(QLatin1Char('.'))) {
        while (text.endsWith(QLatin1Char('0'))) {
            text.chop(1);
        }
        if (text.endsWith(QLatin1Char('.'))) {
            text.chop(1);
        }
    }
    return text;
}

}  // namespace geometry
}  // namespace lasercam
