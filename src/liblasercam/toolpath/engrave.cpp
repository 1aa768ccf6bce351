// =====================================================================
//  src/liblasercam/toolpath/engrave.cpp — Vector lowering
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/toolpath/engrave.h>
#include <lasercam/toolpath/coalescer.h>
#include <lasercam/scene/parts.h>
#include <lasercam/geometry/utils.h>
#include <lasercam/log.h>

namespace lasercam {
namespace toolpath {

using geometry::Transform2D;
using geometry::formatNumber;

namespace {

/// Keep a path only when it has at least 2 points and none is NaN/inf
void appendPath(QVector<QVector<QPointF>>& paths, const QVector<QPointF>& points)
{
    if (points.size() < 2) {
        return;
    }
    for (const QPointF& p : points) {
        if (!geometry::isFinitePoint(p)) {
            qCDebug(lcToolpath) << "Skipping path with non-finite coordinates";
            return;
        }
    }
    paths.append(points);
}

void collectPaths(const scene::ItemShape& shape, const Transform2D& parent,
                  QVector<QVector<QPointF>>& paths)
{
    const Transform2D world = parent * scene::localTransform(shape);

    if (const auto* drawing = std::get_if<scene::Drawing>(&shape)) {
        appendPath(paths, world.apply(drawing->points));
    } else if (const auto* part = std::get_if<scene::Part>(&shape)) {
        for (const scene::PartOutline& outline : scene::partOutlines(*part)) {
            appendPath(paths, world.apply(outline.points));
        }
    } else if (const auto* group = std::get_if<scene::GroupObject>(&shape)) {
        for (const scene::CanvasItem& child : group->children) {
            collectPaths(child.shape, world, paths);
        }
    }
    // Text and images have no cuttable outline
}

QString objectComment(const scene::ItemShape& shape)
{
    scene::CanvasItem probe;
    probe.shape = shape;
    QPointF at = probe.position();
    return QStringLiteral("Object: %1 at (%2, %3)")
        .arg(scene::itemKindName(shape),
             formatNumber(at.x(), ENGRAVE_DECIMALS),
             formatNumber(at.y(), ENGRAVE_DECIMALS));
}

void writeHeader(Program& program, const scene::Layer& layer, int itemCount,
                 const EngraveSettings& settings)
{
    program.addComment(QStringLiteral("Engrave layer: %1").arg(layer.name));
    program.addComment(QStringLiteral("Objects: %1").arg(itemCount));
    program.addComment(QStringLiteral("Power: %1% (%2 scale), Feed: %3 mm/min, Travel: %4 mm/min, Passes: %5")
                           .arg(settings.power)
                           .arg(powerScaleName(settings.powerScale))
                           .arg(formatNumber(settings.feedRate, 0),
                                formatNumber(settings.travelSpeed, 0))
                           .arg(settings.passes));
    if (settings.flipY && settings.canvasHeight > 0.0) {
        program.addComment(QStringLiteral("Y axis flipped about canvas height %1 mm")
                               .arg(formatNumber(settings.canvasHeight, ENGRAVE_DECIMALS)));
    }
    program.addComment(QString());
    program.addCommand(QStringLiteral("G90 ; Absolute positioning"));
    program.addCommand(QStringLiteral("G21 ; Units in millimeters"));
    program.addCommand(QStringLiteral("G0 X0 Y0 F%1 ; Move to origin")
                           .arg(formatNumber(settings.travelSpeed, 0)));
    program.addCommand(QStringLiteral("M3 ; Enable laser (constant power mode)"));
    program.addBlank();
}

void writeFooter(Program& program, double travelSpeed)
{
    program.addCommand(QStringLiteral("M5 ; Disable laser"));
    program.addCommand(QStringLiteral("G0 X0 Y0 F%1 ; Return to origin")
                           .arg(formatNumber(travelSpeed, 0)));
    program.addCommand(QStringLiteral("M2 ; End program"));
}

}  // anonymous namespace

QVector<QVector<QPointF>> engravePaths(const scene::ItemShape& shape)
{
    QVector<QVector<QPointF>> paths;
    collectPaths(shape, Transform2D::identity(), paths);
    return paths;
}

EmitResult emitEngraveInstructions(const scene::Layer& layer,
                                   const QVector<scene::CanvasItem>& items,
                                   const EngraveSettings& baseSettings,
                                   const ProgressCallback& progress)
{
    EmitResult result;
    result.program = Program(ENGRAVE_DECIMALS);

    if (layer.printingMethod != scene::PrintingMethod::Engrave) {
        result.status = EmitStatus::Error;
        result.errorMessage = QStringLiteral("Layer %1 is not an engrave layer").arg(layer.name);
        return result;
    }

    QVector<scene::CanvasItem> layerItems;
    for (const scene::CanvasItem& item : items) {
        if (item.layerId == layer.id) {
            layerItems.append(item);
        }
    }
    if (layerItems.isEmpty()) {
        result.status = EmitStatus::NothingToEmit;
        result.errorMessage = QStringLiteral("Layer %1 has no items").arg(layer.name);
        qCDebug(lcToolpath) << result.errorMessage;
        return result;
    }

    const EngraveSettings settings = baseSettings.withLayer(layer);
    const int power = scalePower(settings.power, settings.powerScale);
    const int passes = qMax(1, settings.passes);

    // Editing convention (Y down) to machine convention (Y up)
    Transform2D machine = Transform2D::identity();
    if (settings.flipY && settings.canvasHeight > 0.0) {
        machine = Transform2D::translation(0.0, settings.canvasHeight) *
                  Transform2D::scale(1.0, -1.0);
    }

    Program& program = result.program;
    writeHeader(program, layer, layerItems.size(), settings);

    InstructionCoalescer coalescer(program);

    for (int i = 0; i < layerItems.size(); ++i) {
        const scene::CanvasItem& item = layerItems[i];
        program.addComment(objectComment(item.shape));

        switch (item.kind()) {
        case scene::ItemKind::Text:
            break;
        case scene::ItemKind::Image:
            program.addComment(QStringLiteral("Skipped: images are lowered by the scan pass"));
            ++result.stats.itemsSkipped;
            break;
        case scene::ItemKind::Part:
        case scene::ItemKind::Drawing:
        case scene::ItemKind::Group: {
            const QVector<QVector<QPointF>> paths = engravePaths(item.shape);
            if (paths.isEmpty()) {
                qCDebug(lcToolpath) << "Item" << item.id << "has no cuttable path";
                ++result.stats.itemsSkipped;
            }
            for (const QVector<QPointF>& path : paths) {
                const QVector<QPointF> mapped = machine.apply(path);
                for (int pass = 0; pass < passes; ++pass) {
                    coalescer.moveTo(mapped.first().x(), mapped.first().y(), 0, settings.travelSpeed);
                    for (int p = 1; p < mapped.size(); ++p) {
                        coalescer.moveTo(mapped[p].x(), mapped[p].y(), power, settings.feedRate);
                    }
                    ++result.stats.paths;
                }
            }
            coalescer.flush();
            break;
        }
        }

        program.addBlank();

        if (progress && !progress(i + 1, layerItems.size())) {
            result.status = EmitStatus::Cancelled;
            result.errorMessage = QStringLiteral("Cancelled");
            return result;
        }
    }

    writeFooter(program, settings.travelSpeed);

    result.stats.cuttingMoves = program.cutCount();
    result.success = true;
    result.status = EmitStatus::Ok;

    qCDebug(lcToolpath) << "Engrave layer" << layer.name << ":" << result.stats.paths
                        << "paths," << result.stats.cuttingMoves << "cutting moves";
    return result;
}

}  // namespace toolpath
}  // namespace lasercam
