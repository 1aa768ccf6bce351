// =====================================================================
//  src/liblasercam/lasercam/importer/svg.h — SVG import
// =====================================================================
//
//  Walks an SVG document and converts its drawable elements (path,
//  rect, circle, ellipse, line, polyline, polygon) into polylines in
//  document units.  Structural and non-visual elements are skipped
//  together with their children.
//
//  Only filled paths are imported: a path whose effective fill is
//  missing or "none" is construction geometry and is dropped.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_IMPORTER_SVG_H
#define LASERCAM_IMPORTER_SVG_H

#include "shape.h"
#include "../geometry/sampler.h"

namespace lasercam {
namespace importer {

/// Options for SVG import
struct SVGImportOptions {
    double scale = 1.0;                ///< Extra scale on top of the document scale
    QPointF offset = QPointF(0, 0);    ///< Offset applied after scaling
};

/// One subpath of SVG path data
struct LASERCAM_EXPORT SVGSubpath {
    geometry::PathContour segments;
    bool closed = false;
};

/// Parse the "d" attribute of a path element into subpaths
/// @param svgPathData Path data (M L H V C S Q T A Z, absolute or relative)
/// @param ok Set to false when a command or number cannot be parsed
/// @return Subpaths split at every move command
LASERCAM_EXPORT QVector<SVGSubpath> parseSVGPathData(const QString& svgPathData,
                                                     bool* ok = nullptr);

/// Parse a transform attribute into one matrix
///
/// The list is composed left to right, so the rightmost entry is applied
/// to the geometry first.  Returns std::nullopt for malformed input.
LASERCAM_EXPORT std::optional<geometry::Transform2D> parseSVGTransform(const QString& text);

/// Import shapes from SVG document content
/// @param svgContent SVG document as string
/// @param options Import options
/// @return Import result with shapes
LASERCAM_EXPORT ImportResult importSVGString(
    const QString& svgContent,
    const SVGImportOptions& options = {});

/// Import shapes from an SVG file
LASERCAM_EXPORT ImportResult importSVGFile(
    const QString& filePath,
    const SVGImportOptions& options = {});

}  // namespace importer
}  // namespace lasercam

#endif  // LASERCAM_IMPORTER_SVG_H
