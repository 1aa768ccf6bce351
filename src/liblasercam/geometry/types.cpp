// =====================================================================
//  src/liblasercam/geometry/types.cpp — Basic geometry types implementation
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/geometry/types.h>

namespace lasercam {
namespace geometry {

// =====================================================================
//  Arc Implementation
// =====================================================================

QPointF Arc::startPoint() const
{
    return pointAt(0.0);
}

QPointF Arc::endPoint() const
{
    return pointAt(1.0);
}

QPointF Arc::pointAt(double t) const
{
    double rad = qDegreesToRadians(startAngle + t * sweepAngle);
    return center + QPointF(radius * qCos(rad), radius * qSin(rad));
}

bool Arc::isDegenerate() const
{
    return !(radius > DEFAULT_TOLERANCE) || qAbs(sweepAngle) < DEFAULT_TOLERANCE ||
           !qIsFinite(radius) || !qIsFinite(sweepAngle);
}

// =====================================================================
//  BoundingBox Implementation
// =====================================================================

BoundingBox::BoundingBox(double x1, double y1, double x2, double y2)
    : minX(qMin(x1, x2))
    , minY(qMin(y1, y2))
    , maxX(qMax(x1, x2))
    , maxY(qMax(y1, y2))
    , valid(true)
{
}

BoundingBox::BoundingBox(const QPointF& point)
    : minX(point.x())
    , minY(point.y())
    , maxX(point.x())
    , maxY(point.y())
    , valid(true)
{
}

void BoundingBox::include(const QPointF& point)
{
    if (!valid) {
        minX = maxX = point.x();
        minY = maxY = point.y();
        valid = true;
    } else {
        minX = qMin(minX, point.x());
        minY = qMin(minY, point.y());
        maxX = qMax(maxX, point.x());
        maxY = qMax(maxY, point.y());
    }
}

void BoundingBox::include(const BoundingBox& other)
{
    if (!other.valid) return;

    if (!valid) {
        *this = other;
    } else {
        minX = qMin(minX, other.minX);
        minY = qMin(minY, other.minY);
        maxX = qMax(maxX, other.maxX);
        maxY = qMax(maxY, other.maxY);
    }
}

void BoundingBox::expand(double margin)
{
    if (!valid) return;
    minX -= margin;
    minY -= margin;
    maxX += margin;
    maxY += margin;
}

QPointF BoundingBox::center() const
{
    return QPointF((minX + maxX) / 2.0, (minY + maxY) / 2.0);
}

bool BoundingBox::hasArea() const
{
    return valid && width() > DEFAULT_TOLERANCE && height() > DEFAULT_TOLERANCE;
}

QRectF BoundingBox::toRect() const
{
    return QRectF(minX, minY, maxX - minX, maxY - minY);
}

bool BoundingBox::contains(const QPointF& point) const
{
    if (!valid) return false;
    return point.x() >= minX && point.x() <= maxX &&
           point.y() >= minY && point.y() <= maxY;
}

// =====================================================================
//  Transform2D Implementation
// =====================================================================

Transform2D Transform2D::identity()
{
    return Transform2D();
}

Transform2D Transform2D::fromMatrix(double a, double b, double c,
                                    double d, double e, double f)
{
    // SVG column order: x' = a*x + c*y + e, y' = b*x + d*y + f
    Transform2D t;
    t.m11 = a;
    t.m12 = c;
    t.m13 = e;
    t.m21 = b;
    t.m22 = d;
    t.m23 = f;
    return t;
}

Transform2D Transform2D::translation(double dx, double dy)
{
    Transform2D t;
    t.m13 = dx;
    t.m23 = dy;
    return t;
}

Transform2D Transform2D::rotation(double angleDegrees)
{
    double rad = qDegreesToRadians(angleDegrees);
    double c = qCos(rad);
    double s = qSin(rad);

    Transform2D t;
    t.m11 = c;
    t.m12 = -s;
    t.m21 = s;
    t.m22 = c;
    return t;
}

Transform2D Transform2D::rotation(double angleDegrees, const QPointF& center)
{
    // Translate to origin, rotate, translate back
    Transform2D t1 = translation(-center.x(), -center.y());
    Transform2D r = rotation(angleDegrees);
    Transform2D t2 = translation(center.x(), center.y());
    return t2 * r * t1;
}

Transform2D Transform2D::scale(double factor)
{
    return scale(factor, factor);
}

Transform2D Transform2D::scale(double sx, double sy)
{
    Transform2D t;
    t.m11 = sx;
    t.m22 = sy;
    return t;
}

Transform2D Transform2D::skewX(double angleDegrees)
{
    Transform2D t;
    t.m12 = qTan(qDegreesToRadians(angleDegrees));
    return t;
}

Transform2D Transform2D::skewY(double angleDegrees)
{
    Transform2D t;
    t.m21 = qTan(qDegreesToRadians(angleDegrees));
    return t;
}

QPointF Transform2D::apply(const QPointF& point) const
{
    return QPointF(
        m11 * point.x() + m12 * point.y() + m13,
        m21 * point.x() + m22 * point.y() + m23
    );
}

QVector<QPointF> Transform2D::apply(const QVector<QPointF>& points) const
{
    QVector<QPointF> result;
    result.reserve(points.size());
    for (const QPointF& p : points) {
        result.append(apply(p));
    }
    return result;
}

double Transform2D::determinant() const
{
    return m11 * m22 - m12 * m21;
}

bool Transform2D::isInvertible() const
{
    return qAbs(determinant()) > DEFAULT_TOLERANCE;
}

bool Transform2D::isIdentity() const
{
    return *this == Transform2D();
}

Transform2D Transform2D::operator*(const Transform2D& other) const
{
    Transform2D result;
    result.m11 = m11 * other.m11 + m12 * other.m21;
    result.m12 = m11 * other.m12 + m12 * other.m22;
    result.m13 = m11 * other.m13 + m12 * other.m23 + m13;
    result.m21 = m21 * other.m11 + m22 * other.m21;
    result.m22 = m21 * other.m12 + m22 * other.m22;
    result.m23 = m21 * other.m13 + m22 * other.m23 + m23;
    return result;
}

bool Transform2D::operator==(const Transform2D& other) const
{
    auto near = [](double a, double b) { return qAbs(a - b) < DEFAULT_TOLERANCE; };
    return near(m11, other.m11) && near(m12, other.m12) && near(m13, other.m13) &&
           near(m21, other.m21) && near(m22, other.m22) && near(m23, other.m23);
}

}  // namespace geometry
}  // namespace lasercam
