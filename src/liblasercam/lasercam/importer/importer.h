// =====================================================================
//  src/liblasercam/lasercam/importer/importer.h — Import dispatch
// =====================================================================
//
//  Picks the SVG, DXF or HP-GL importer from a file extension.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_IMPORTER_IMPORTER_H
#define LASERCAM_IMPORTER_IMPORTER_H

#include "dxf.h"
#include "hpgl.h"
#include "svg.h"

namespace lasercam {
namespace importer {

/// Exchange formats the importers understand
enum class SourceFormat {
    Unknown,
    SVG,
    DXF,
    HPGL
};

/// Format implied by a file name (".svg", ".dxf", ".plt", ".hpgl")
LASERCAM_EXPORT SourceFormat formatForPath(const QString& filePath);

/// Import a file with the importer matching its extension
/// An unknown extension is reported as a ParseError.
LASERCAM_EXPORT ImportResult importFile(const QString& filePath);

}  // namespace importer
}  // namespace lasercam

#endif  // LASERCAM_IMPORTER_IMPORTER_H
