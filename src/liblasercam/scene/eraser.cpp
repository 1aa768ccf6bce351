// =====================================================================
//  src/liblasercam/scene/eraser.cpp — Polyline eraser
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/scene/eraser.h>
#include <lasercam/geometry/utils.h>
#include <lasercam/log.h>

namespace lasercam {
namespace scene {

using geometry::circleSegmentIntersection;
using geometry::distance;

namespace {

/// Total length of a polyline
double polylineLength(const QVector<QPointF>& points)
{
    double len = 0.0;
    for (int i = 1; i < points.size(); ++i) {
        len += distance(points[i - 1], points[i]);
    }
    return len;
}

/// True when any segment comes within radius of the center
bool touches(const QVector<QPointF>& points, const QPointF& center, double radius)
{
    if (points.size() == 1) {
        return distance(points.first(), center) < radius;
    }
    for (int i = 1; i < points.size(); ++i) {
        if (geometry::pointSegmentDistance(center, points[i - 1], points[i]) < radius) {
            return true;
        }
    }
    return false;
}

}  // anonymous namespace

QVector<QVector<QPointF>> erasePolyline(const QVector<QPointF>& points, const QPointF& center,
                                        double radius, double tolerance)
{
    QVector<QVector<QPointF>> pieces;
    if (points.isEmpty()) {
        return pieces;
    }
    if (!touches(points, center, radius)) {
        if (points.size() >= 2) pieces.append(points);
        return pieces;
    }

    QVector<QPointF> current;
    auto inside = [&](const QPointF& p) { return distance(p, center) < radius; };
    auto crossing = [&](const QPointF& a, const QPointF& b, const QPointF& fallback) {
        return circleSegmentIntersection(center, radius, a, b, tolerance).value_or(fallback);
    };
    auto closePiece = [&]() {
        if (current.size() >= 2 && polylineLength(current) > geometry::DEFAULT_TOLERANCE) {
            pieces.append(current);
        }
        current.clear();
    };

    if (!inside(points.first())) {
        current.append(points.first());
    }

    for (int i = 1; i < points.size(); ++i) {
        const QPointF& a = points[i - 1];
        const QPointF& b = points[i];
        bool aIn = inside(a);
        bool bIn = inside(b);

        if (!aIn && !bIn) {
            if (geometry::pointSegmentDistance(center, a, b) < radius) {
                // Passes through: split at the point closest to the center,
                // which lies inside, and cut on both sides of it
                QPointF mid = geometry::lerp(a, b, geometry::projectPointOnSegment(center, a, b));
                current.append(crossing(a, mid, a));
                closePiece();
                current.append(crossing(mid, b, b));
            }
            current.append(b);
        } else if (!aIn && bIn) {
            current.append(crossing(a, b, a));
            closePiece();
        } else if (aIn && !bIn) {
            current.append(crossing(a, b, b));
            current.append(b);
        }
        // Both inside: the whole segment is erased
    }
    closePiece();

    return pieces;
}

SceneEdit eraseAt(const Scene& scene, const QPointF& center, double radius)
{
    Scene current = scene;
    bool changed = false;
    QStringList created;

    for (const CanvasItem& item : scene.items()) {
        const auto* drawing = std::get_if<Drawing>(&item.shape);
        if (!drawing) continue;

        const Layer* layer = scene.layer(item.layerId);
        if (layer && !layer->isVisible) continue;

        QVector<QPointF> absolute = drawing->absolutePoints();
        if (!touches(absolute, center, radius)) continue;

        QVector<ItemShape> replacements;
        for (const QVector<QPointF>& piece : erasePolyline(absolute, center, radius)) {
            importer::Polyline centered = importer::Polyline::fromAbsolute(piece, false);

            Drawing survivor;
            survivor.points = centered.points;
            survivor.x = centered.origin.x();
            survivor.y = centered.origin.y();
            survivor.color = drawing->color;
            survivor.strokeWidth = drawing->strokeWidth;
            survivor.fillColor = drawing->fillColor;
            replacements.append(survivor);
        }

        SceneEdit step = current.replaceItems(QStringList{item.id}, replacements, item.layerId);
        if (!step.success) {
            return step;
        }
        current = step.scene;
        created += step.createdIds;
        changed = true;

        qCDebug(lcScene) << "Eraser split" << item.id << "into" << replacements.size() << "pieces";
    }

    SceneEdit edit;
    edit.success = true;
    edit.scene = changed ? current : scene;
    edit.createdIds = created;
    return edit;
}

}  // namespace scene
}  // namespace lasercam
