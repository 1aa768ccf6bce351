// =====================================================================
//  src/liblasercam/toolpath/emitter.cpp — Layer emission
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/toolpath/emitter.h>
#include <lasercam/log.h>

namespace lasercam {
namespace toolpath {

EmitResult emitLayer(const scene::Scene& scene,
                     const QString& layerId,
                     const MachineProfile& profile,
                     const CanvasSizeProvider* canvas,
                     const ProgressCallback& progress)
{
    const scene::Layer* layer = scene.layer(layerId);
    if (!layer || !layer->isVisible) {
        EmitResult result;
        result.status = EmitStatus::NothingToEmit;
        result.errorMessage = layer ? QStringLiteral("Layer %1 is hidden").arg(layer->name)
                                    : QStringLiteral("No layer %1").arg(layerId);
        qCDebug(lcToolpath) << result.errorMessage;
        return result;
    }

    switch (layer->printingMethod) {
    case scene::PrintingMethod::Scan:
        return emitScanInstructions(*layer, scene.items(),
                                    profile.platformSize.width(),
                                    profile.platformSize.height(),
                                    profile.scan, canvas, progress);
    case scene::PrintingMethod::Engrave:
        return emitEngraveInstructions(*layer, scene.items(), profile.engrave, progress);
    }

    EmitResult result;
    result.errorMessage = QStringLiteral("Unknown printing method");
    return result;
}

QString emitStatusName(EmitStatus status)
{
    switch (status) {
    case EmitStatus::Ok:            return QStringLiteral("ok");
    case EmitStatus::NothingToEmit: return QStringLiteral("nothing to emit");
    case EmitStatus::Cancelled:     return QStringLiteral("cancelled");
    case EmitStatus::Error:         return QStringLiteral("error");
    }
    return QString();
}

}  // namespace toolpath
}  // namespace lasercam
