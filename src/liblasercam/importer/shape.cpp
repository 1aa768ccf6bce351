// =====================================================================
//  src/liblasercam/importer/shape.cpp — Canonical import records
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/importer/shape.h>
#include <lasercam/geometry/utils.h>
#include <lasercam/log.h>

namespace lasercam {
namespace importer {

// =====================================================================
//  Polyline
// =====================================================================

QVector<QPointF> Polyline::absolutePoints() const
{
    QVector<QPointF> result;
    result.reserve(points.size());
    for (const QPointF& p : points) {
        result.append(origin + p);
    }
    return result;
}

geometry::BoundingBox Polyline::bounds() const
{
    return geometry::boundingBox(absolutePoints());
}

Polyline Polyline::fromAbsolute(const QVector<QPointF>& absolute, bool closed)
{
    Polyline poly;
    poly.closed = closed;

    geometry::BoundingBox bbox = geometry::boundingBox(absolute);
    poly.origin = bbox.valid ? bbox.center() : QPointF();
    poly.points.reserve(absolute.size());
    for (const QPointF& p : absolute) {
        poly.points.append(p - poly.origin);
    }
    return poly;
}

// =====================================================================
//  Record queries
// =====================================================================

geometry::BoundingBox shapeBounds(const ShapeRecord& shape)
{
    if (const auto* poly = std::get_if<Polyline>(&shape)) {
        return poly->bounds();
    }

    const Group& group = std::get<Group>(shape);
    geometry::BoundingBox bbox;
    for (const ShapeRecord& child : group.children) {
        geometry::BoundingBox childBox = shapeBounds(child);
        if (!childBox.valid) continue;
        childBox.minX += group.originX;
        childBox.maxX += group.originX;
        childBox.minY += group.originY;
        childBox.maxY += group.originY;
        bbox.include(childBox);
    }
    return bbox;
}

int polylineCount(const ShapeRecord& shape)
{
    if (std::holds_alternative<Polyline>(shape)) {
        return 1;
    }
    int count = 0;
    for (const ShapeRecord& child : std::get<Group>(shape).children) {
        count += polylineCount(child);
    }
    return count;
}

int pointCount(const ShapeRecord& shape)
{
    if (const auto* poly = std::get_if<Polyline>(&shape)) {
        return poly->points.size();
    }
    int count = 0;
    for (const ShapeRecord& child : std::get<Group>(shape).children) {
        count += pointCount(child);
    }
    return count;
}

// =====================================================================
//  ImportResult
// =====================================================================

QStringList ImportResult::warningMessages() const
{
    QStringList messages;
    for (const UnsupportedEntityWarning& w : warnings) {
        messages.append(QStringLiteral("%1 x%2").arg(w.kind).arg(w.count));
    }
    return messages;
}

void ImportResult::addWarning(const QString& kind)
{
    for (UnsupportedEntityWarning& w : warnings) {
        if (w.kind == kind) {
            ++w.count;
            return;
        }
    }
    warnings.append(UnsupportedEntityWarning{kind, 1});
}

ImportResult importFailure(const QString& message)
{
    ImportResult result;
    result.success = false;
    result.status = ImportStatus::ParseError;
    result.errorMessage = message;
    return result;
}

ImportResult normalizeShapes(const QVector<Polyline>& polylines, const QString& emptyMessage)
{
    ImportResult result;

    if (polylines.isEmpty()) {
        result.success = false;
        result.status = ImportStatus::EmptyResult;
        result.errorMessage = emptyMessage;
        return result;
    }

    result.success = true;
    result.status = ImportStatus::Ok;

    if (polylines.size() == 1) {
        result.shapes.append(polylines.first());
        result.bounds = polylines.first().bounds();
        return result;
    }

    // Union of the stroke-inflated child boxes
    geometry::BoundingBox unionBox;
    for (const Polyline& poly : polylines) {
        geometry::BoundingBox childBox = poly.bounds();
        childBox.expand(poly.strokeWidth / 2.0);
        unionBox.include(childBox);
    }

    Group group;
    QPointF center = unionBox.center();
    group.originX = center.x();
    group.originY = center.y();
    group.width = unionBox.width();
    group.height = unionBox.height();
    group.children.reserve(polylines.size());

    for (const Polyline& poly : polylines) {
        Polyline child = poly;
        child.origin = poly.origin - center;
        group.children.push_back(child);
    }

    qCDebug(lcImport) << "Grouped" << polylines.size() << "shapes around" << center;

    result.shapes.append(group);
    result.bounds = unionBox;
    return result;
}

}  // namespace importer
}  // namespace lasercam
