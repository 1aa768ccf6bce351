// =====================================================================
//  src/liblasercam/scene/parts.cpp — Parametric part outlines
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/scene/parts.h>
#include <lasercam/geometry/sampler.h>
#include <lasercam/geometry/utils.h>
#include <lasercam/log.h>

namespace lasercam {
namespace scene {

namespace {

void addClosed(QVector<PartOutline>& outlines, QVector<QPointF> points)
{
    if (points.size() < 2) return;
    if (points.first() != points.last()) {
        points.append(points.first());
    }
    outlines.append(PartOutline{points, true});
}

void addOpen(QVector<PartOutline>& outlines, const QVector<QPointF>& points)
{
    if (points.size() < 2) return;
    outlines.append(PartOutline{points, false});
}

void addCircle(QVector<PartOutline>& outlines, const QPointF& center, double radius)
{
    QVector<QPointF> points = geometry::sampleCircle(center, radius);
    if (points.isEmpty()) {
        qCDebug(lcScene) << "Skipping zero-radius circle at" << center;
        return;
    }
    outlines.append(PartOutline{points, true});
}

/// Axis-aligned rectangle centered on the origin, starting top-left
QVector<QPointF> rectangle(double width, double height)
{
    double w2 = width / 2.0;
    double h2 = height / 2.0;
    return {QPointF(-w2, -h2), QPointF(w2, -h2), QPointF(w2, h2), QPointF(-w2, h2)};
}

}  // anonymous namespace

QVector<PartOutline> partOutlines(const Part& part)
{
    QVector<PartOutline> outlines;
    auto p = [&part](const char* name) { return part.parameter(QString::fromLatin1(name)); };

    switch (part.type) {
    case PartType::Rectangle: {
        double w = p("width");
        double h = p("height");
        if (w > 0 && h > 0) addClosed(outlines, rectangle(w, h));
        break;
    }

    case PartType::Circle:
        addCircle(outlines, QPointF(0, 0), p("radius"));
        break;

    case PartType::Line: {
        double l2 = p("length") / 2.0;
        if (l2 > 0) addOpen(outlines, {QPointF(-l2, 0), QPointF(l2, 0)});
        break;
    }

    case PartType::Flange: {
        double boltRadius = p("boltCircleDiameter") / 2.0;
        int holeCount = qMax(0, qRound(p("boltHoleCount")));

        addCircle(outlines, QPointF(0, 0), p("innerDiameter") / 2.0);
        for (int i = 0; i < holeCount; ++i) {
            // First hole at the top
            double angle = static_cast<double>(i) / holeCount * 2.0 * M_PI - M_PI / 2.0;
            addCircle(outlines, QPointF(boltRadius * qCos(angle), boltRadius * qSin(angle)),
                      p("boltHoleDiameter") / 2.0);
        }
        addCircle(outlines, QPointF(0, 0), p("outerDiameter") / 2.0);
        break;
    }

    case PartType::Torus:
        addCircle(outlines, QPointF(0, 0), p("outerRadius"));
        addCircle(outlines, QPointF(0, 0), p("innerRadius"));
        break;

    case PartType::LBracket: {
        double w2 = p("width") / 2.0;
        double h2 = p("height") / 2.0;
        double t = p("thickness");
        addClosed(outlines, {
            QPointF(-w2, -h2),
            QPointF(w2, -h2),
            QPointF(w2, -h2 + t),
            QPointF(-w2 + t, -h2 + t),
            QPointF(-w2 + t, h2),
            QPointF(-w2, h2),
        });
        break;
    }

    case PartType::UChannel: {
        double w2 = p("width") / 2.0;
        double h2 = p("height") / 2.0;
        double t = p("thickness");
        addClosed(outlines, {
            QPointF(-w2, -h2),
            QPointF(w2, -h2),
            QPointF(w2, h2),
            QPointF(w2 - t, h2),
            QPointF(w2 - t, -h2 + t),
            QPointF(-w2 + t, -h2 + t),
            QPointF(-w2 + t, h2),
            QPointF(-w2, h2),
        });
        break;
    }

    case PartType::RectangleWithHoles: {
        double w = p("width");
        double h = p("height");
        double w2 = w / 2.0;
        double h2 = h / 2.0;
        double mx = p("horizontalMargin");
        double my = p("verticalMargin");
        double r = p("holeRadius");

        addCircle(outlines, QPointF(-w2 + mx, h2 - my), r);
        addCircle(outlines, QPointF(w2 - mx, h2 - my), r);
        addCircle(outlines, QPointF(w2 - mx, -h2 + my), r);
        addCircle(outlines, QPointF(-w2 + mx, -h2 + my), r);
        if (w > 0 && h > 0) addClosed(outlines, rectangle(w, h));
        break;
    }

    case PartType::CircleWithHoles: {
        double radius = p("radius");
        double holeCircle = radius * 0.7;
        int holeCount = qMax(0, qRound(p("holeCount")));

        for (int i = 0; i < holeCount; ++i) {
            double angle = static_cast<double>(i) / holeCount * 2.0 * M_PI;
            addCircle(outlines, QPointF(holeCircle * qCos(angle), holeCircle * qSin(angle)),
                      p("holeRadius"));
        }
        addCircle(outlines, QPointF(0, 0), radius);
        break;
    }

    case PartType::EquilateralTriangle: {
        double side = p("sideLength");
        double h = side * qSqrt(3.0) / 2.0;
        if (side > 0) {
            addClosed(outlines, {
                QPointF(-side / 2.0, -h / 3.0),
                QPointF(side / 2.0, -h / 3.0),
                QPointF(0, 2.0 * h / 3.0),
            });
        }
        break;
    }

    case PartType::IsoscelesRightTriangle: {
        double c2 = p("cathetus") / 2.0;
        if (c2 > 0) {
            addClosed(outlines, {
                QPointF(-c2, c2),
                QPointF(c2, c2),
                QPointF(-c2, -c2),     // Right angle
            });
        }
        break;
    }

    case PartType::Sector: {
        geometry::Arc arc;
        arc.radius = p("radius");
        arc.startAngle = p("startAngle");
        arc.sweepAngle = p("sweepAngle");

        QVector<QPointF> arcPoints = geometry::sampleArc(arc);
        if (arcPoints.isEmpty()) break;

        // Center -> arc -> center
        QVector<QPointF> points;
        points.append(QPointF(0, 0));
        points += arcPoints;
        addClosed(outlines, points);
        break;
    }

    case PartType::Arc: {
        geometry::Arc arc;
        arc.radius = p("radius");
        arc.startAngle = p("startAngle");
        arc.sweepAngle = p("sweepAngle");
        addOpen(outlines, geometry::sampleArc(arc));
        break;
    }

    case PartType::Polyline: {
        double seg1 = p("seg1");
        double seg2 = p("seg2");
        double seg3 = p("seg3");
        double turn = qDegreesToRadians(p("angle") + 180.0);
        double hx = seg2 * qCos(turn) / 2.0;
        double hy = seg2 * qSin(turn) / 2.0;

        // The middle segment is centered on the anchor
        addOpen(outlines, {
            QPointF(-seg1 - hx, -hy),
            QPointF(-hx, -hy),
            QPointF(0, 0),
            QPointF(hx, hy),
            QPointF(seg3 + hx, hy),
        });
        break;
    }
    }

    return outlines;
}

geometry::BoundingBox partBounds(const Part& part)
{
    geometry::BoundingBox bbox;
    for (const PartOutline& outline : partOutlines(part)) {
        bbox.include(geometry::boundingBox(outline.points));
    }
    return bbox;
}

}  // namespace scene
}  // namespace lasercam
