// =====================================================================
//  src/liblasercam/lasercam/importer/dxf.h — DXF import
// =====================================================================
//
//  Reads the ENTITIES section of an ASCII DXF file.  LINE, LWPOLYLINE,
//  CIRCLE, ARC and SPLINE entities become polylines; every other entity
//  kind is skipped and reported as an UnsupportedEntityWarning.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_IMPORTER_DXF_H
#define LASERCAM_IMPORTER_DXF_H

#include "shape.h"

namespace lasercam {
namespace importer {

/// Options for DXF import
struct DXFImportOptions {
    double scale = 1.0;                ///< Scale factor (1.0 = 1 DXF unit = 1mm)
    QPointF offset = QPointF(0, 0);    ///< Offset to apply to all points
    bool flipY = true;                 ///< Mirror Y about the drawing extents (DXF Y grows up)
};

/// CSS color for an AutoCAD color index (1..7; anything else is white)
LASERCAM_EXPORT QString aciColor(int colorIndex);

/// Import shapes from DXF string content
/// @param dxfContent DXF document as string
/// @param options Import options
/// @return Import result with shapes
LASERCAM_EXPORT ImportResult importDXFString(
    const QString& dxfContent,
    const DXFImportOptions& options = {});

/// Import shapes from a DXF file
LASERCAM_EXPORT ImportResult importDXFFile(
    const QString& filePath,
    const DXFImportOptions& options = {});

}  // namespace importer
}  // namespace lasercam

#endif  // LASERCAM_IMPORTER_DXF_H
