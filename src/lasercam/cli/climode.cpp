// =====================================================================
//  src/lasercam/cli/climode.cpp — Command-line mode
// =====================================================================
//
//  Each run* method performs one command and returns the process exit
//  code.  Diagnostics go to stderr, progress and summaries to stdout.
//
// =====================================================================

#include "climode.h"

#include <lasercam/core.h>
#include <lasercam/importer/importer.h>
#include <lasercam/scene/parts.h>

#include <QFileInfo>
#include <QImage>

#include <iostream>

namespace lasercam {

namespace {

std::string boundsText(const geometry::BoundingBox& b)
{
    if (!b.valid) {
        return "(empty)";
    }
    return QStringLiteral("[%1, %2] - [%3, %4]")
        .arg(geometry::formatNumber(b.minX, 3), geometry::formatNumber(b.minY, 3),
             geometry::formatNumber(b.maxX, 3), geometry::formatNumber(b.maxY, 3))
        .toStdString();
}

void printRecord(const importer::ShapeRecord& record, int depth)
{
    const std::string indent(static_cast<size_t>(depth) * 2 + 2, ' ');

    if (const auto* poly = std::get_if<importer::Polyline>(&record)) {
        std::cout << indent << "Polyline: " << poly->points.size() << " points"
                  << (poly->closed ? ", closed" : "")
                  << ", stroke " << poly->strokeColor.toStdString()
                  << ", bounds " << boundsText(poly->bounds()) << std::endl;
        return;
    }

    const auto& group = std::get<importer::Group>(record);
    std::cout << indent << "Group: " << group.children.size() << " children, origin ("
              << geometry::formatNumber(group.originX, 3).toStdString() << ", "
              << geometry::formatNumber(group.originY, 3).toStdString() << "), size "
              << geometry::formatNumber(group.width, 3).toStdString() << " x "
              << geometry::formatNumber(group.height, 3).toStdString() << std::endl;
    for (const importer::ShapeRecord& child : group.children) {
        printRecord(child, depth + 1);
    }
}

/// Print import warnings and report failures; returns true when usable
bool checkImport(const importer::ImportResult& result, const QString& input, int* exitCode)
{
    for (const QString& warning : result.warningMessages()) {
        std::cerr << "Warning: unsupported entity " << warning.toStdString() << std::endl;
    }

    if (result.success) {
        return true;
    }

    if (result.status == importer::ImportStatus::EmptyResult) {
        std::cerr << "Nothing to import from " << input.toStdString() << ": "
                  << result.errorMessage.toStdString() << std::endl;
        *exitCode = ExitNothingToEmit;
    } else {
        std::cerr << "Error reading " << input.toStdString() << ": "
                  << result.errorMessage.toStdString() << std::endl;
        *exitCode = ExitError;
    }
    return false;
}

}  // anonymous namespace

CliMode::CliMode(const toolpath::MachineProfile& profile)
    : m_profile(profile)
{
}

// ---- import ----------------------------------------------------------

int CliMode::runImport(const QString& input)
{
    std::cout << "Importing: " << input.toStdString() << std::endl;

    importer::ImportResult result = importer::importFile(input);
    int exitCode = ExitOk;
    if (!checkImport(result, input, &exitCode)) {
        return exitCode;
    }

    int polylines = 0;
    int points = 0;
    for (const importer::ShapeRecord& record : result.shapes) {
        polylines += importer::polylineCount(record);
        points += importer::pointCount(record);
    }

    std::cout << "Shapes: " << result.shapes.size()
              << " (" << polylines << " polylines, " << points << " points)" << std::endl;
    std::cout << "Bounds: " << boundsText(result.bounds) << std::endl;
    for (const importer::ShapeRecord& record : result.shapes) {
        printRecord(record, 0);
    }
    return ExitOk;
}

// ---- engrave ---------------------------------------------------------

int CliMode::runEngrave(const QString& input, const QString& output)
{
    if (!output.isEmpty()) {
        std::cout << "Engraving: " << input.toStdString() << std::endl;
    }

    importer::ImportResult result = importer::importFile(input);
    int exitCode = ExitOk;
    if (!checkImport(result, input, &exitCode)) {
        return exitCode;
    }

    scene::SceneEdit edit = scene::Scene().addShapes(result.shapes);
    if (!edit.success) {
        std::cerr << "Error: " << edit.errorMessage.toStdString() << std::endl;
        return ExitError;
    }

    const scene::Layer* layer = edit.scene.firstLayerFor(scene::PrintingMethod::Engrave);
    if (!layer) {
        std::cerr << "Nothing to engrave in " << input.toStdString() << std::endl;
        return ExitNothingToEmit;
    }

    return emitAndWrite(edit.scene, layer->id, m_profile, output);
}

// ---- scan ------------------------------------------------------------

int CliMode::runScan(const QString& image, double widthMm, double heightMm,
                     const QString& output)
{
    if (!output.isEmpty()) {
        std::cout << "Scanning: " << image.toStdString() << std::endl;
    }

    QImage pixels(image);
    if (pixels.isNull()) {
        std::cerr << "Error: cannot read image " << image.toStdString() << std::endl;
        return ExitError;
    }

    const double density = m_profile.scan.lineDensity;
    if (density <= 0.0) {
        std::cerr << "Error: line density must be positive" << std::endl;
        return ExitError;
    }
    if (widthMm <= 0.0) widthMm = pixels.width() / density;
    if (heightMm <= 0.0) heightMm = pixels.height() / density;

    scene::ImageObject object;
    object.x = widthMm / 2.0;
    object.y = heightMm / 2.0;
    object.width = widthMm;
    object.height = heightMm;
    object.pixels = pixels;

    scene::SceneEdit edit = scene::Scene().addItem(object);
    if (!edit.success) {
        std::cerr << "Error: " << edit.errorMessage.toStdString() << std::endl;
        return ExitError;
    }

    // The platform is exactly the image
    toolpath::MachineProfile profile = m_profile;
    profile.platformSize = QSizeF(widthMm, heightMm);

    const scene::Layer* layer = edit.scene.firstLayerFor(scene::PrintingMethod::Scan);
    return emitAndWrite(edit.scene, layer->id, profile, output);
}

// ---- part ------------------------------------------------------------

int CliMode::runPart(const QString& typeName, const QStringList& assignments,
                     const QString& output)
{
    std::optional<scene::PartType> type = scene::partTypeFromName(typeName);
    if (!type) {
        std::cerr << "Error: unknown part type " << typeName.toStdString() << std::endl;
        std::cerr << "  Known types:";
        for (scene::PartType t : scene::allPartTypes()) {
            std::cerr << ' ' << scene::partTypeName(t).toStdString();
        }
        std::cerr << std::endl;
        return ExitError;
    }

    scene::Part part;
    part.type = *type;
    part.parameters = scene::defaultParameters(*type);

    std::optional<double> x;
    std::optional<double> y;
    for (const QString& assignment : assignments) {
        const int eq = assignment.indexOf(QLatin1Char('='));
        bool ok = false;
        const QString key = assignment.left(eq).trimmed();
        const double value = eq > 0 ? assignment.mid(eq + 1).toDouble(&ok) : 0.0;
        if (!ok) {
            std::cerr << "Error: expected key=value, got " << assignment.toStdString() << std::endl;
            return ExitError;
        }

        if (key == QLatin1String("x")) {
            x = value;
        } else if (key == QLatin1String("y")) {
            y = value;
        } else if (key == QLatin1String("rotation")) {
            part.rotation = value;
        } else if (part.parameters.contains(key)) {
            part.parameters[key] = value;
        } else {
            std::cerr << "Error: " << scene::partTypeName(*type).toStdString()
                      << " has no parameter " << key.toStdString() << std::endl;
            return ExitError;
        }
    }

    // Default placement puts the part's lower-left corner at the origin
    const geometry::BoundingBox local = scene::partBounds(part);
    part.x = x.value_or(local.valid ? -local.minX : 0.0);
    part.y = y.value_or(local.valid ? -local.minY : 0.0);

    scene::SceneEdit edit = scene::Scene().addItem(part);
    if (!edit.success) {
        std::cerr << "Error: " << edit.errorMessage.toStdString() << std::endl;
        return ExitError;
    }

    const scene::Layer* layer = edit.scene.firstLayerFor(scene::PrintingMethod::Engrave);
    return emitAndWrite(edit.scene, layer->id, m_profile, output);
}

// ---- Output ----------------------------------------------------------

int CliMode::emitAndWrite(const scene::Scene& scene, const QString& layerId,
                          const toolpath::MachineProfile& profile,
                          const QString& output)
{
    // Without an output file the program itself goes to stdout
    const bool report = !output.isEmpty();
    int lastDecile = -1;
    auto progress = [report, &lastDecile](int done, int total) {
        if (!report) return true;
        const int decile = total > 0 ? done * 10 / total : 10;
        if (decile != lastDecile) {
            lastDecile = decile;
            std::cout << "  " << decile * 10 << "% (" << done << "/" << total << ")" << std::endl;
        }
        return true;
    };

    toolpath::EmitResult result = toolpath::emitLayer(scene, layerId, profile, nullptr, progress);

    if (result.status == toolpath::EmitStatus::NothingToEmit) {
        std::cerr << "Nothing to emit: " << result.errorMessage.toStdString() << std::endl;
        return ExitNothingToEmit;
    }
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage.toStdString() << std::endl;
        return ExitError;
    }

    const QString text = result.toText();
    if (output.isEmpty()) {
        std::cout << text.toStdString();
        return ExitOk;
    }

    toolpath::FileOutputSink sink;
    if (!sink.persist(output, text.toUtf8())) {
        std::cerr << "Error writing output: " << sink.errorString().toStdString() << std::endl;
        return ExitError;
    }

    std::cout << "Done. Wrote " << result.program.lines().size() << " lines ("
              << result.stats.cuttingMoves << " cutting moves) to "
              << QFileInfo(output).fileName().toStdString() << std::endl;
    return ExitOk;
}

}  // namespace lasercam
