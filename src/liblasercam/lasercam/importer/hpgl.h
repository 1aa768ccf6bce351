// =====================================================================
//  src/liblasercam/lasercam/importer/hpgl.h — HP-GL plotter import
// =====================================================================
//
//  Understands the pen commands PU (pen up), PD (pen down) and PA
//  (plot absolute).  Each pen-down run becomes one polyline.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_IMPORTER_HPGL_H
#define LASERCAM_IMPORTER_HPGL_H

#include "shape.h"

#include <QSizeF>

namespace lasercam {
namespace importer {

/// Size of one HP-GL plotter unit in millimeters
constexpr double HPGL_PLOTTER_UNIT_MM = 0.025;

/// Options for HP-GL import
struct HPGLImportOptions {
    double unitScale = 1.0;            ///< Millimeters per plotter unit
    /// When set, scale uniformly into this canvas (Y mirrored, centered)
    std::optional<QSizeF> fitCanvas;
    double padding = 20.0;             ///< Margin kept free when fitting
};

/// Import shapes from HP-GL command text
/// @param hpglContent Commands such as "PU0,0;PD10,0,10,10;PU;"
/// @param options Import options
/// @return Import result with shapes
LASERCAM_EXPORT ImportResult importHPGLString(
    const QString& hpglContent,
    const HPGLImportOptions& options = {});

/// Import shapes from an HP-GL (.plt / .hpgl) file
LASERCAM_EXPORT ImportResult importHPGLFile(
    const QString& filePath,
    const HPGLImportOptions& options = {});

}  // namespace importer
}  // namespace lasercam

#endif  // LASERCAM_IMPORTER_HPGL_H
