// =====================================================================
//  src/liblasercam/importer/hpgl.cpp — HP-GL plotter import
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/importer/hpgl.h>
#include <lasercam/geometry/utils.h>
#include <lasercam/log.h>

#include <QFile>
#include <QRegularExpression>

namespace lasercam {
namespace importer {

namespace {

/// Stroke color of plotter strokes
const char* HPGL_STROKE_COLOR = "#eab308";

/// One PU / PD / PA command with its coordinate pairs
struct HPGLCommand {
    QString type;
    QVector<QPointF> points;
};

/// Tokenize commands; returns false on a non-numeric argument
bool tokenize(const QString& content, QVector<HPGLCommand>& commands, QString& error)
{
    static const QRegularExpression re(QStringLiteral("(PU|PD|PA)([^;]*);"),
                                       QRegularExpression::CaseInsensitiveOption);

    QRegularExpressionMatchIterator it = re.globalMatch(content);
    while (it.hasNext()) {
        QRegularExpressionMatch match = it.next();

        HPGLCommand cmd;
        cmd.type = match.captured(1).toUpper();

        QVector<double> values;
        const QStringList parts = match.captured(2).split(QLatin1Char(','));
        for (const QString& part : parts) {
            QString token = part.trimmed();
            if (token.isEmpty()) continue;
            bool ok = false;
            double v = token.toDouble(&ok);
            if (!ok || !qIsFinite(v)) {
                error = QStringLiteral("Invalid %1 argument \"%2\"").arg(cmd.type, token);
                return false;
            }
            values.append(v);
        }

        // A trailing odd value has no partner and is ignored
        for (int i = 0; i + 1 < values.size(); i += 2) {
            cmd.points.append(QPointF(values[i], values[i + 1]));
        }
        commands.append(cmd);
    }
    return true;
}

}  // anonymous namespace

ImportResult importHPGLString(const QString& hpglContent, const HPGLImportOptions& options)
{
    QVector<HPGLCommand> commands;
    QString error;
    if (!tokenize(hpglContent, commands, error)) {
        qCWarning(lcImport) << "HP-GL import failed:" << error;
        return importFailure(error);
    }

    QVector<QVector<QPointF>> runs;
    QVector<QPointF> current;
    QPointF position(0, 0);
    bool penDown = false;

    auto finishCurrent = [&]() {
        if (current.size() > 1) {
            runs.append(current);
        }
        current.clear();
    };

    for (const HPGLCommand& cmd : commands) {
        if (cmd.type == QLatin1String("PU")) {
            finishCurrent();
            penDown = false;
            for (const QPointF& p : cmd.points) {
                position = p;
            }
        } else if (cmd.type == QLatin1String("PD")) {
            finishCurrent();
            penDown = true;
            current.append(position);
            for (const QPointF& p : cmd.points) {
                position = p;
                current.append(position);
            }
        } else {
            for (const QPointF& p : cmd.points) {
                position = p;
                if (penDown) {
                    current.append(position);
                }
            }
        }
    }
    finishCurrent();

    // Plotter units to document units
    geometry::Transform2D mapping = geometry::Transform2D::scale(options.unitScale);

    if (options.fitCanvas && !runs.isEmpty()) {
        geometry::BoundingBox bbox;
        for (const QVector<QPointF>& run : runs) {
            bbox.include(geometry::boundingBox(run));
        }

        if (bbox.hasArea()) {
            double targetW = options.fitCanvas->width() - options.padding * 2;
            double targetH = options.fitCanvas->height() - options.padding * 2;
            double factor = qMin(targetW / bbox.width(), targetH / bbox.height());
            double offsetX = (options.fitCanvas->width() - bbox.width() * factor) / 2.0;
            double offsetY = (options.fitCanvas->height() - bbox.height() * factor) / 2.0;

            // x' = (x - minX) * f + offsetX, y' = (maxY - y) * f + offsetY
            mapping = geometry::Transform2D::translation(offsetX, offsetY) *
                      geometry::Transform2D::scale(factor, -factor) *
                      geometry::Transform2D::translation(-bbox.minX, -bbox.maxY);
        } else {
            qCDebug(lcImport) << "HP-GL drawing has no area; not fitting to canvas";
        }
    }

    QVector<Polyline> polylines;
    for (const QVector<QPointF>& run : runs) {
        Polyline poly = Polyline::fromAbsolute(mapping.apply(run), false);
        poly.strokeColor = QString::fromLatin1(HPGL_STROKE_COLOR);
        poly.strokeWidth = 2.0;
        polylines.append(poly);
    }

    qCDebug(lcImport) << "HP-GL import:" << commands.size() << "commands,"
                      << polylines.size() << "polylines";

    return normalizeShapes(polylines, QStringLiteral("No pen-down strokes found"));
}

ImportResult importHPGLFile(const QString& filePath, const HPGLImportOptions& options)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return importFailure(QStringLiteral("Cannot open file: %1").arg(filePath));
    }

    QString content = QString::fromLatin1(file.readAll());
    file.close();

    return importHPGLString(content, options);
}

}  // namespace importer
}  // namespace lasercam
