// =====================================================================
//  src/liblasercam/toolpath/settings.cpp — Emitter settings
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/toolpath/settings.h>
#include <lasercam/log.h>

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QtMath>

namespace lasercam {
namespace toolpath {

QString powerScaleName(PowerScale scale)
{
    switch (scale) {
    case PowerScale::Percent: return QStringLiteral("percent");
    case PowerScale::Byte:    return QStringLiteral("byte");
    }
    return QString();
}

std::optional<PowerScale> powerScaleFromName(const QString& name)
{
    const QString lower = name.trimmed().toLower();
    if (lower == QLatin1String("percent")) return PowerScale::Percent;
    if (lower == QLatin1String("byte")) return PowerScale::Byte;
    return std::nullopt;
}

int scalePower(int percent, PowerScale scale)
{
    int clamped = qBound(0, percent, 100);
    if (scale == PowerScale::Byte) {
        return qRound(clamped * 2.55);
    }
    return clamped;
}

ScanSettings ScanSettings::withLayer(const scene::Layer& layer) const
{
    ScanSettings merged = *this;
    if (layer.lineDensity && *layer.lineDensity > 0.0) merged.lineDensity = *layer.lineDensity;
    if (layer.halftone) merged.halftone = *layer.halftone;
    if (layer.overscanDistance) merged.overscanDistance = *layer.overscanDistance;
    if (layer.minPower) merged.minPower = *layer.minPower;
    if (layer.maxPower) merged.maxPower = *layer.maxPower;
    return merged;
}

EngraveSettings EngraveSettings::withLayer(const scene::Layer& layer) const
{
    EngraveSettings merged = *this;
    if (layer.power) merged.power = *layer.power;
    return merged;
}

// =====================================================================
//  Serialization
// =====================================================================

namespace {

QJsonObject scanToJson(const ScanSettings& scan)
{
    QJsonObject obj;
    obj["lineDensity"] = scan.lineDensity;
    obj["halftone"] = scan.halftone;
    obj["negativeImage"] = scan.negativeImage;
    obj["hFlipped"] = scan.hFlipped;
    obj["vFlipped"] = scan.vFlipped;
    obj["minPower"] = scan.minPower;
    obj["maxPower"] = scan.maxPower;
    obj["burnSpeed"] = scan.burnSpeed;
    obj["travelSpeed"] = scan.travelSpeed;
    obj["overscanDistance"] = scan.overscanDistance;
    obj["powerScale"] = powerScaleName(scan.powerScale);
    return obj;
}

ScanSettings scanFromJson(const QJsonObject& obj)
{
    ScanSettings scan;
    scan.lineDensity = obj["lineDensity"].toDouble(scan.lineDensity);
    scan.halftone = obj["halftone"].toBool(scan.halftone);
    scan.negativeImage = obj["negativeImage"].toBool(scan.negativeImage);
    scan.hFlipped = obj["hFlipped"].toBool(scan.hFlipped);
    scan.vFlipped = obj["vFlipped"].toBool(scan.vFlipped);
    scan.minPower = obj["minPower"].toInt(scan.minPower);
    scan.maxPower = obj["maxPower"].toInt(scan.maxPower);
    scan.burnSpeed = obj["burnSpeed"].toDouble(scan.burnSpeed);
    scan.travelSpeed = obj["travelSpeed"].toDouble(scan.travelSpeed);
    scan.overscanDistance = obj["overscanDistance"].toDouble(scan.overscanDistance);
    scan.powerScale = powerScaleFromName(obj["powerScale"].toString()).value_or(scan.powerScale);
    return scan;
}

QJsonObject engraveToJson(const EngraveSettings& engrave)
{
    QJsonObject obj;
    obj["feedRate"] = engrave.feedRate;
    obj["travelSpeed"] = engrave.travelSpeed;
    obj["power"] = engrave.power;
    obj["passes"] = engrave.passes;
    obj["flipY"] = engrave.flipY;
    obj["canvasHeight"] = engrave.canvasHeight;
    obj["powerScale"] = powerScaleName(engrave.powerScale);
    return obj;
}

EngraveSettings engraveFromJson(const QJsonObject& obj)
{
    EngraveSettings engrave;
    engrave.feedRate = obj["feedRate"].toDouble(engrave.feedRate);
    engrave.travelSpeed = obj["travelSpeed"].toDouble(engrave.travelSpeed);
    engrave.power = obj["power"].toInt(engrave.power);
    engrave.passes = obj["passes"].toInt(engrave.passes);
    engrave.flipY = obj["flipY"].toBool(engrave.flipY);
    engrave.canvasHeight = obj["canvasHeight"].toDouble(engrave.canvasHeight);
    engrave.powerScale = powerScaleFromName(obj["powerScale"].toString()).value_or(engrave.powerScale);
    return engrave;
}

}  // anonymous namespace

QJsonObject machineProfileToJson(const MachineProfile& profile)
{
    QJsonObject obj;
    obj["name"] = profile.name;
    obj["platformWidth"] = profile.platformSize.width();
    obj["platformHeight"] = profile.platformSize.height();
    obj["scan"] = scanToJson(profile.scan);
    obj["engrave"] = engraveToJson(profile.engrave);
    return obj;
}

MachineProfile machineProfileFromJson(const QJsonObject& obj)
{
    MachineProfile profile;
    profile.name = obj["name"].toString(profile.name);
    profile.platformSize = QSizeF(obj["platformWidth"].toDouble(profile.platformSize.width()),
                                  obj["platformHeight"].toDouble(profile.platformSize.height()));
    profile.scan = scanFromJson(obj["scan"].toObject());
    profile.engrave = engraveFromJson(obj["engrave"].toObject());
    return profile;
}

bool loadMachineProfile(const QString& path, MachineProfile& profile, QString* errorMsg)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to read profile: %1").arg(file.errorString());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMsg) *errorMsg = QStringLiteral("Invalid profile JSON: %1").arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        if (errorMsg) *errorMsg = QStringLiteral("Invalid profile JSON: top level is not an object");
        return false;
    }

    profile = machineProfileFromJson(doc.object());
    qCDebug(lcToolpath) << "Loaded machine profile" << profile.name << "from" << path;
    return true;
}

bool saveMachineProfile(const QString& path, const MachineProfile& profile, QString* errorMsg)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to write profile: %1").arg(file.errorString());
        return false;
    }

    QJsonDocument doc(machineProfileToJson(profile));
    if (file.write(doc.toJson(QJsonDocument::Indented)) < 0) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to write profile: %1").arg(file.errorString());
        return false;
    }
    return true;
}

}  // namespace toolpath
}  // namespace lasercam
