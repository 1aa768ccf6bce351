// =====================================================================
//  src/liblasercam/lasercam/importer/shape.h — Canonical import records
// =====================================================================
//
//  Every importer produces ShapeRecords: a polyline or a group of
//  records.  Records are produced once per import call and never
//  mutated afterwards; the scene converts them into canvas items with
//  fresh identities.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_IMPORTER_SHAPE_H
#define LASERCAM_IMPORTER_SHAPE_H

#include "../geometry/types.h"

#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>
#include <variant>
#include <vector>

namespace lasercam {
namespace importer {

/// Stroke color used when a source declares none
constexpr const char* DEFAULT_STROKE_COLOR = "#2563eb";

/// Open or closed polyline in document units
///
/// `points` are stored relative to `origin`, which is the center of the
/// polyline's own bounding box (or, inside a group, that center relative
/// to the group origin).
struct LASERCAM_EXPORT Polyline {
    QVector<QPointF> points;
    QPointF origin;
    bool closed = false;
    QString strokeColor = QString::fromLatin1(DEFAULT_STROKE_COLOR);
    double strokeWidth = 0.0;
    std::optional<QString> fillColor;

    /// Points in the coordinate frame `origin` is expressed in
    QVector<QPointF> absolutePoints() const;

    /// Bounds of absolutePoints()
    geometry::BoundingBox bounds() const;

    /// Build from absolute points, centering on their bounding box
    static Polyline fromAbsolute(const QVector<QPointF>& absolute, bool closed);
};

struct Group;

/// Tagged union of import output
using ShapeRecord = std::variant<Polyline, Group>;

/// Several shapes imported together
///
/// Children are positioned relative to (originX, originY), the center of
/// the union of their bounding boxes.
struct LASERCAM_EXPORT Group {
    std::vector<ShapeRecord> children;
    double originX = 0.0;
    double originY = 0.0;
    double width = 0.0;
    double height = 0.0;
    double rotation = 0.0;
};

/// Bounds of a record in its parent frame
LASERCAM_EXPORT geometry::BoundingBox shapeBounds(const ShapeRecord& shape);

/// Number of polylines in a record, counting through groups
LASERCAM_EXPORT int polylineCount(const ShapeRecord& shape);

/// Total number of points in a record, counting through groups
LASERCAM_EXPORT int pointCount(const ShapeRecord& shape);

// =====================================================================
//  Import results
// =====================================================================

/// Outcome of an import call
enum class ImportStatus {
    Ok,             ///< At least one shape was produced
    ParseError,     ///< Source is malformed; no shapes are returned
    EmptyResult     ///< Source parsed but contained nothing usable
};

/// A recognized entity kind that the importer does not convert
struct LASERCAM_EXPORT UnsupportedEntityWarning {
    QString kind;
    int count = 0;
};

/// Result of an import
struct LASERCAM_EXPORT ImportResult {
    bool success = false;
    ImportStatus status = ImportStatus::ParseError;
    QVector<ShapeRecord> shapes;
    QString errorMessage;
    QVector<UnsupportedEntityWarning> warnings;
    geometry::BoundingBox bounds;      ///< Bounds of imported geometry

    /// Human readable form of the warnings ("ELLIPSE x2", ...)
    QStringList warningMessages() const;

    /// Add one occurrence of an unsupported kind
    void addWarning(const QString& kind);
};

/// Build a failed result
LASERCAM_EXPORT ImportResult importFailure(const QString& message);

/// Apply the grouping policy to a list of absolute-coordinate polylines
///
/// Zero polylines produce an EmptyResult.  A single polyline is returned
/// unwrapped.  More than one is merged into one Group whose origin is the
/// center of the union bounding box, each box grown by half of the
/// polyline's stroke width; children keep their own center as origin,
/// re-expressed relative to the group origin.
LASERCAM_EXPORT ImportResult normalizeShapes(const QVector<Polyline>& polylines,
                                             const QString& emptyMessage);

}  // namespace importer
}  // namespace lasercam

#endif  // LASERCAM_IMPORTER_SHAPE_H
