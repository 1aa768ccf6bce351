// =====================================================================
//  src/liblasercam/lasercam/scene/layer.h — Layers
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_SCENE_LAYER_H
#define LASERCAM_SCENE_LAYER_H

#include "item.h"

namespace lasercam {
namespace scene {

/// A named group of items sharing one printing method
///
/// The raster parameters are only meaningful on SCAN layers; unset
/// values fall back to the emitter defaults.
struct LASERCAM_EXPORT Layer {
    QString id;
    QString name;
    bool isVisible = true;
    PrintingMethod printingMethod = PrintingMethod::Engrave;
    std::optional<double> lineDensity;        ///< Lines per mm
    std::optional<bool> halftone;
    std::optional<double> overscanDistance;   ///< mm beyond content per row
    std::optional<int> power;                 ///< Percent
    std::optional<int> minPower;
    std::optional<int> maxPower;

    /// Layer created on demand for SCAN items ("Scan layer")
    static Layer defaultScanLayer(const QString& id);

    /// Layer created on demand for ENGRAVE items ("Cut layer")
    static Layer defaultEngraveLayer(const QString& id);
};

}  // namespace scene
}  // namespace lasercam

#endif  // LASERCAM_SCENE_LAYER_H
