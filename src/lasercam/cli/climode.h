// =====================================================================
//  src/lasercam/cli/climode.h — Command-line mode
// =====================================================================
//
//  Single-command operation: import summaries and G-code emission for
//  vector files, bitmaps and parametric parts.  Uses liblasercam
//  directly.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_CLIMODE_H
#define LASERCAM_CLIMODE_H

#include <lasercam/toolpath/emitter.h>

#include <QString>
#include <QStringList>

namespace lasercam {

/// Process exit codes
enum CliExitCode {
    ExitOk            = 0,
    ExitError         = 1,
    ExitNothingToEmit = 2
};

class CliMode {
public:
    explicit CliMode(const toolpath::MachineProfile& profile);

    /// Print a summary of the shapes a vector file imports to.
    int runImport(const QString& input);

    /// Import a vector file and emit its ENGRAVE layer.
    int runEngrave(const QString& input, const QString& output);

    /// Place a bitmap of widthMm x heightMm on the platform and emit the
    /// SCAN layer.  Zero sizes are derived from the pixel size and the
    /// line density.
    int runScan(const QString& image, double widthMm, double heightMm,
                const QString& output);

    /// Emit one parametric part.  `assignments` are "key=value" pairs
    /// naming part parameters, or x / y / rotation.
    int runPart(const QString& typeName, const QStringList& assignments,
                const QString& output);

private:
    int emitAndWrite(const scene::Scene& scene, const QString& layerId,
                     const toolpath::MachineProfile& profile,
                     const QString& output);

    toolpath::MachineProfile m_profile;
};

}  // namespace lasercam

#endif  // LASERCAM_CLIMODE_H
