// =====================================================================
//  src/liblasercam/importer/importer.cpp — Import dispatch
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/importer/importer.h>
#include <lasercam/log.h>

#include <QFileInfo>

namespace lasercam {
namespace importer {

SourceFormat formatForPath(const QString& filePath)
{
    const QString suffix = QFileInfo(filePath).suffix().toLower();

    if (suffix == QLatin1String("svg")) return SourceFormat::SVG;
    if (suffix == QLatin1String("dxf")) return SourceFormat::DXF;
    if (suffix == QLatin1String("plt") || suffix == QLatin1String("hpgl") ||
        suffix == QLatin1String("hgl")) {
        return SourceFormat::HPGL;
    }
    return SourceFormat::Unknown;
}

ImportResult importFile(const QString& filePath)
{
    switch (formatForPath(filePath)) {
    case SourceFormat::SVG:
        return importSVGFile(filePath);
    case SourceFormat::DXF:
        return importDXFFile(filePath);
    case SourceFormat::HPGL:
        return importHPGLFile(filePath);
    case SourceFormat::Unknown:
        break;
    }

    qCWarning(lcImport) << "No importer for" << filePath;
    return importFailure(QStringLiteral("Unsupported file type: %1").arg(filePath));
}

}  // namespace importer
}  // namespace lasercam
