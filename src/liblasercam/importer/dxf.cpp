// =====================================================================
//  src/liblasercam/importer/dxf.cpp — DXF import
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/importer/dxf.h>
#include <lasercam/geometry/sampler.h>
#include <lasercam/geometry/utils.h>
#include <lasercam/log.h>

#include <QFile>

namespace lasercam {
namespace importer {

namespace {

/// DXF group code and value pair
struct DXFPair {
    int code;
    QString value;
};

/// Read next group code/value pair from DXF content
bool readDXFPair(const QStringList& lines, int& lineIndex, DXFPair& pair)
{
    if (lineIndex + 1 >= lines.size()) return false;

    bool ok;
    pair.code = lines[lineIndex].trimmed().toInt(&ok);
    if (!ok) return false;

    pair.value = lines[lineIndex + 1].trimmed();
    lineIndex += 2;
    return true;
}

/// Collect the pairs of one entity, stopping before the next 0 code
QVector<DXFPair> readEntityPairs(const QStringList& lines, int& lineIndex)
{
    QVector<DXFPair> pairs;
    DXFPair pair;

    while (lineIndex < lines.size()) {
        int savedIndex = lineIndex;
        if (!readDXFPair(lines, lineIndex, pair)) break;

        if (pair.code == 0) {
            lineIndex = savedIndex;  // Restore so caller sees the 0 code
            break;
        }
        pairs.append(pair);
    }
    return pairs;
}

/// First value for a group code, or a default
double valueOf(const QVector<DXFPair>& pairs, int code, double fallback = 0.0)
{
    for (const DXFPair& p : pairs) {
        if (p.code == code) return p.value.toDouble();
    }
    return fallback;
}

/// A polyline in raw DXF coordinates, before flipping and scaling
struct RawShape {
    QVector<QPointF> points;
    bool closed = false;
    int colorIndex = 0;
};

/// Parse a LINE entity
std::optional<RawShape> parseDXFLine(const QVector<DXFPair>& pairs)
{
    RawShape shape;
    QPointF p1(valueOf(pairs, 10), valueOf(pairs, 20));
    QPointF p2(valueOf(pairs, 11), valueOf(pairs, 21));
    if (geometry::distance(p1, p2) < geometry::DEFAULT_TOLERANCE) {
        return std::nullopt;
    }
    shape.points = {p1, p2};
    return shape;
}

/// Parse a CIRCLE entity
std::optional<RawShape> parseDXFCircle(const QVector<DXFPair>& pairs)
{
    RawShape shape;
    shape.points = geometry::sampleCircle(QPointF(valueOf(pairs, 10), valueOf(pairs, 20)),
                                          valueOf(pairs, 40));
    if (shape.points.isEmpty()) {
        return std::nullopt;
    }
    shape.closed = true;
    return shape;
}

/// Parse an ARC entity (angles CCW in degrees)
std::optional<RawShape> parseDXFArc(const QVector<DXFPair>& pairs)
{
    geometry::Arc arc;
    arc.center = QPointF(valueOf(pairs, 10), valueOf(pairs, 20));
    arc.radius = valueOf(pairs, 40);
    arc.startAngle = valueOf(pairs, 50);

    double sweep = valueOf(pairs, 51) - arc.startAngle;
    if (sweep <= 0) sweep += 360.0;
    arc.sweepAngle = sweep;

    RawShape shape;
    shape.points = geometry::sampleArc(arc);
    if (shape.points.isEmpty()) {
        return std::nullopt;
    }
    return shape;
}

/// Parse a LWPOLYLINE entity, flattening bulged segments
std::optional<RawShape> parseDXFLWPolyline(const QVector<DXFPair>& pairs)
{
    QVector<QPointF> vertices;
    QVector<double> bulges;
    bool closed = false;

    double currentX = 0, currentY = 0, currentBulge = 0;
    bool hasVertex = false;

    for (const DXFPair& pair : pairs) {
        switch (pair.code) {
        case 70:  // Flags
            closed = (pair.value.toInt() & 1) != 0;
            break;
        case 10:  // X coordinate
            if (hasVertex) {
                vertices.append(QPointF(currentX, currentY));
                bulges.append(currentBulge);
                currentBulge = 0;
            }
            currentX = pair.value.toDouble();
            hasVertex = true;
            break;
        case 20:  // Y coordinate
            currentY = pair.value.toDouble();
            break;
        case 42:  // Bulge
            currentBulge = pair.value.toDouble();
            break;
        }
    }

    // Add last vertex
    if (hasVertex) {
        vertices.append(QPointF(currentX, currentY));
        bulges.append(currentBulge);
    }

    if (vertices.size() < 2) return std::nullopt;

    RawShape shape;
    shape.closed = closed;
    shape.points.append(vertices.first());

    int numSegments = closed ? vertices.size() : vertices.size() - 1;
    for (int i = 0; i < numSegments; ++i) {
        QPointF p1 = vertices[i];
        QPointF p2 = vertices[(i + 1) % vertices.size()];

        std::optional<geometry::Arc> arc = geometry::bulgeToArc(p1, p2, bulges[i]);
        if (arc) {
            QVector<QPointF> arcPoints = geometry::sampleArc(*arc);
            for (int k = 1; k < arcPoints.size(); ++k) {
                shape.points.append(arcPoints[k]);
            }
            // Land exactly on the next vertex
            if (!arcPoints.isEmpty()) shape.points.last() = p2;
        } else {
            shape.points.append(p2);
        }
    }
    return shape;
}

/// Parse a SPLINE entity (control points, or fit points when there are none)
std::optional<RawShape> parseDXFSpline(const QVector<DXFPair>& pairs)
{
    QVector<QPointF> controlPoints;
    QVector<QPointF> fitPoints;
    bool closed = false;
    double pendingX = 0;

    for (const DXFPair& pair : pairs) {
        switch (pair.code) {
        case 70:
            closed = (pair.value.toInt() & 1) != 0;
            break;
        case 10:
        case 11:
            pendingX = pair.value.toDouble();
            break;
        case 20:
            controlPoints.append(QPointF(pendingX, pair.value.toDouble()));
            break;
        case 21:
            fitPoints.append(QPointF(pendingX, pair.value.toDouble()));
            break;
        }
    }

    const QVector<QPointF>& source = controlPoints.isEmpty() ? fitPoints : controlPoints;
    if (source.size() < 2) return std::nullopt;

    RawShape shape;
    shape.points = geometry::sampleControlPolygon(source);
    shape.closed = closed;
    return shape;
}

/// Read $EXTMIN/$EXTMAX from the HEADER section
geometry::BoundingBox readExtents(const QStringList& lines)
{
    geometry::BoundingBox extents;
    std::optional<QPointF> extMin, extMax;
    DXFPair pair;
    int lineIndex = 0;
    QString variable;
    double x = 0;

    while (readDXFPair(lines, lineIndex, pair)) {
        if (pair.code == 0 && pair.value == QLatin1String("ENDSEC") && !variable.isEmpty()) {
            break;
        }
        if (pair.code == 9) {
            variable = pair.value;
        } else if (pair.code == 10) {
            x = pair.value.toDouble();
        } else if (pair.code == 20) {
            if (variable == QLatin1String("$EXTMIN")) extMin = QPointF(x, pair.value.toDouble());
            if (variable == QLatin1String("$EXTMAX")) extMax = QPointF(x, pair.value.toDouble());
        }
    }

    if (extMin && extMax && extMax->x() > extMin->x() && extMax->y() > extMin->y()) {
        extents.include(*extMin);
        extents.include(*extMax);
    }
    return extents;
}

/// Whether a value parses as the type its group code implies
///
/// Codes 10-59 carry reals (coordinates, radii, angles); 60-79 and
/// 90-99 carry integers (color, flags, counts).
bool isValidGroupValue(int code, const QString& value)
{
    bool ok = true;
    if (code >= 10 && code <= 59) {
        value.toDouble(&ok);
    } else if ((code >= 60 && code <= 79) || (code >= 90 && code <= 99)) {
        value.toInt(&ok);
    }
    return ok;
}

/// Entity kinds that belong to a preceding POLYLINE
bool isSubEntity(const QString& type)
{
    return type == QLatin1String("VERTEX") || type == QLatin1String("SEQEND");
}

}  // anonymous namespace

QString aciColor(int colorIndex)
{
    switch (colorIndex) {
    case 1: return QStringLiteral("#ff0000");  // Red
    case 2: return QStringLiteral("#ffff00");  // Yellow
    case 3: return QStringLiteral("#00ff00");  // Green
    case 4: return QStringLiteral("#00ffff");  // Cyan
    case 5: return QStringLiteral("#0000ff");  // Blue
    case 6: return QStringLiteral("#ff00ff");  // Magenta
    case 7: return QStringLiteral("#ffffff");  // White/Black
    default: return QStringLiteral("#ffffff");
    }
}

ImportResult importDXFString(const QString& dxfContent, const DXFImportOptions& options)
{
    if (dxfContent.trimmed().isEmpty()) {
        return importFailure(QStringLiteral("Empty DXF content"));
    }

    // Split into lines, accepting both line ending styles
    QString text = dxfContent;
    text.replace(QLatin1String("\r\n"), QLatin1String("\n"));
    text.replace(QLatin1Char('\r'), QLatin1Char('\n'));
    QStringList lines = text.split(QLatin1Char('\n'));
    while (!lines.isEmpty() && lines.last().trimmed().isEmpty()) {
        lines.removeLast();
    }

    if (lines.size() % 2 != 0) {
        return importFailure(QStringLiteral("Truncated DXF: odd number of lines (%1)")
                                 .arg(lines.size()));
    }
    for (int i = 0; i < lines.size(); i += 2) {
        bool ok = false;
        const int code = lines[i].trimmed().toInt(&ok);
        if (!ok) {
            return importFailure(QStringLiteral("Invalid group code \"%1\" at line %2")
                                     .arg(lines[i].trimmed()).arg(i + 1));
        }
        if (!isValidGroupValue(code, lines[i + 1].trimmed())) {
            return importFailure(QStringLiteral("Invalid value \"%1\" for group code %2 at line %3")
                                     .arg(lines[i + 1].trimmed()).arg(code).arg(i + 2));
        }
    }

    // Find the ENTITIES section
    int lineIndex = 0;
    bool inEntities = false;
    DXFPair pair;
    while (readDXFPair(lines, lineIndex, pair)) {
        if (pair.code == 0 && pair.value == QLatin1String("SECTION")) {
            DXFPair namePair;
            if (readDXFPair(lines, lineIndex, namePair) && namePair.code == 2 &&
                namePair.value == QLatin1String("ENTITIES")) {
                inEntities = true;
                break;
            }
        }
    }
    if (!inEntities) {
        return importFailure(QStringLiteral("DXF has no ENTITIES section"));
    }

    ImportResult result;
    QVector<RawShape> shapes;

    while (lineIndex < lines.size()) {
        if (!readDXFPair(lines, lineIndex, pair)) break;
        if (pair.code != 0) continue;
        if (pair.value == QLatin1String("ENDSEC") || pair.value == QLatin1String("EOF")) break;

        const QString type = pair.value;
        QVector<DXFPair> pairs = readEntityPairs(lines, lineIndex);

        std::optional<RawShape> shape;
        if (type == QLatin1String("LINE")) {
            shape = parseDXFLine(pairs);
        } else if (type == QLatin1String("CIRCLE")) {
            shape = parseDXFCircle(pairs);
        } else if (type == QLatin1String("ARC")) {
            shape = parseDXFArc(pairs);
        } else if (type == QLatin1String("LWPOLYLINE")) {
            shape = parseDXFLWPolyline(pairs);
        } else if (type == QLatin1String("SPLINE")) {
            shape = parseDXFSpline(pairs);
        } else {
            if (!isSubEntity(type)) {
                qCDebug(lcImport) << "Skipping unsupported DXF entity" << type;
                result.addWarning(type);
            }
            continue;
        }

        if (!shape) {
            qCDebug(lcImport) << "Skipping degenerate DXF" << type;
            continue;
        }
        shape->colorIndex = static_cast<int>(valueOf(pairs, 62, 0));
        shapes.append(*shape);
    }

    // Mirror about the drawing extents into the Y-down editing frame
    geometry::BoundingBox extents = readExtents(lines);
    if (!extents.valid) {
        for (const RawShape& s : shapes) {
            extents.include(geometry::boundingBox(s.points));
        }
    }
    double flipSum = extents.valid ? extents.minY + extents.maxY : 0.0;

    QVector<Polyline> polylines;
    for (const RawShape& s : shapes) {
        QVector<QPointF> absolute;
        absolute.reserve(s.points.size());
        for (const QPointF& p : s.points) {
            double y = options.flipY ? flipSum - p.y() : p.y();
            absolute.append(QPointF(p.x() * options.scale + options.offset.x(),
                                    y * options.scale + options.offset.y()));
        }

        Polyline poly = Polyline::fromAbsolute(absolute, s.closed);
        poly.strokeColor = aciColor(s.colorIndex);
        poly.strokeWidth = 2.0;
        polylines.append(poly);
    }

    ImportResult imported = normalizeShapes(polylines,
                                            QStringLiteral("DXF contains no supported entities"));
    imported.warnings = result.warnings;

    qCDebug(lcImport) << "DXF import produced" << polylines.size() << "polylines,"
                      << result.warnings.size() << "unsupported kinds";
    return imported;
}

ImportResult importDXFFile(const QString& filePath, const DXFImportOptions& options)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return importFailure(QStringLiteral("Cannot open file: %1").arg(filePath));
    }

    QString content = QString::fromUtf8(file.readAll());
    file.close();

    return importDXFString(content, options);
}

}  // namespace importer
}  // namespace lasercam
