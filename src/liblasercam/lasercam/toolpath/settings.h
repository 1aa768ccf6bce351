// =====================================================================
//  src/liblasercam/lasercam/toolpath/settings.h — Emitter settings
// =====================================================================
//
//  Scan and engrave parameters plus the machine profile that carries
//  their defaults on disk as JSON.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_TOOLPATH_SETTINGS_H
#define LASERCAM_TOOLPATH_SETTINGS_H

#include "../scene/layer.h"

#include <QJsonObject>
#include <QSizeF>

namespace lasercam {
namespace toolpath {

/// How a power percentage is written into S words
enum class PowerScale {
    Percent,    ///< S0..100
    Byte        ///< S0..255
};

/// "percent" / "byte"
LASERCAM_EXPORT QString powerScaleName(PowerScale scale);

/// Parse "percent" / "byte" (case-insensitive)
LASERCAM_EXPORT std::optional<PowerScale> powerScaleFromName(const QString& name);

/// Convert a power percentage to the value written after S
LASERCAM_EXPORT int scalePower(int percent, PowerScale scale);

/// Raster (SCAN) lowering parameters
struct LASERCAM_EXPORT ScanSettings {
    double lineDensity = 10.0;       ///< Lines per mm (row and pixel pitch 1/lineDensity)
    bool halftone = false;
    bool negativeImage = false;
    bool hFlipped = false;
    bool vFlipped = false;
    int minPower = 0;                ///< Percent
    int maxPower = 100;              ///< Percent
    double burnSpeed = 1000.0;       ///< mm/min
    double travelSpeed = 6000.0;     ///< mm/min
    double overscanDistance = 3.0;   ///< mm
    PowerScale powerScale = PowerScale::Percent;

    /// These settings with the raster parameters a layer sets
    ScanSettings withLayer(const scene::Layer& layer) const;
};

/// Vector (ENGRAVE) lowering parameters
struct LASERCAM_EXPORT EngraveSettings {
    double feedRate = 1000.0;        ///< mm/min
    double travelSpeed = 3000.0;     ///< mm/min
    int power = 50;                  ///< Percent
    int passes = 1;
    bool flipY = false;              ///< Map y to canvasHeight - y
    double canvasHeight = 0.0;
    PowerScale powerScale = PowerScale::Percent;

    /// These settings with the power a layer sets
    EngraveSettings withLayer(const scene::Layer& layer) const;
};

/// Defaults for one machine
struct LASERCAM_EXPORT MachineProfile {
    QString name = QStringLiteral("Default laser");
    QSizeF platformSize = QSizeF(400.0, 400.0);   ///< mm
    ScanSettings scan;
    EngraveSettings engrave;
};

// ---- JSON ----------------------------------------------------------
//
// Unknown keys are ignored and missing keys keep the defaults above.

LASERCAM_EXPORT QJsonObject machineProfileToJson(const MachineProfile& profile);

LASERCAM_EXPORT MachineProfile machineProfileFromJson(const QJsonObject& obj);

/// Read a profile file
/// @return false with a message in errorMsg when the file cannot be
///         read or is not a JSON object
LASERCAM_EXPORT bool loadMachineProfile(const QString& path, MachineProfile& profile,
                                        QString* errorMsg = nullptr);

/// Write a profile file (indented JSON)
LASERCAM_EXPORT bool saveMachineProfile(const QString& path, const MachineProfile& profile,
                                        QString* errorMsg = nullptr);

}  // namespace toolpath
}  // namespace lasercam

#endif  // LASERCAM_TOOLPATH_SETTINGS_H
