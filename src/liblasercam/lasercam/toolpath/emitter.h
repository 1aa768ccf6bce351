// =====================================================================
//  src/liblasercam/lasercam/toolpath/emitter.h — Layer emission
// =====================================================================
//
//  Picks the lowering pass for a scene layer from its printing method.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_TOOLPATH_EMITTER_H
#define LASERCAM_TOOLPATH_EMITTER_H

#include "engrave.h"
#include "scan.h"
#include "../scene/scene.h"

namespace lasercam {
namespace toolpath {

/// Emit one layer of a scene
///
/// SCAN layers use the profile's platform size as the document size.
/// Hidden layers and unknown ids report NothingToEmit.  The scene is a
/// value, so the pass reads a stable snapshot.
LASERCAM_EXPORT EmitResult emitLayer(const scene::Scene& scene,
                                     const QString& layerId,
                                     const MachineProfile& profile,
                                     const CanvasSizeProvider* canvas = nullptr,
                                     const ProgressCallback& progress = {});

/// Human-readable status name ("ok", "nothing to emit", ...)
LASERCAM_EXPORT QString emitStatusName(EmitStatus status);

}  // namespace toolpath
}  // namespace lasercam

#endif  // LASERCAM_TOOLPATH_EMITTER_H
