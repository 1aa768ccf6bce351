// =====================================================================
//  src/lasercam/main.cpp — LaserCAM command-line entry point
// =====================================================================
//
//  Usage:
//
//    lasercam [options] import  <file>
//    lasercam [options] engrave <file>          [-o out.gcode]
//    lasercam [options] scan    <image>         [--width mm --height mm] [-o out.gcode]
//    lasercam [options] part    <TYPE> [key=value ...] [-o out.gcode]
//
//  Settings come from the built-in defaults, then --config, then the
//  individual flags.  --write-config saves the resulting profile.
//
//  Exit status: 0 success, 1 error, 2 nothing to emit.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/core.h>
#include <lasercam/toolpath/settings.h>

#include "cli/climode.h"

#include <QCoreApplication>
#include <QString>
#include <QStringList>

#include <iostream>
#include <optional>

// ---- Helper: parse flags ---------------------------------------------

struct StartupFlags {
    QString command;
    QStringList arguments;        // Positional arguments after the command
    QString outputPath;           // -o <file>
    QString configPath;           // --config <profile.json>
    QString writeConfigPath;      // --write-config <file>

    bool help     = false;
    bool flipY    = false;
    bool halftone = false;
    bool negative = false;

    std::optional<double> width;
    std::optional<double> height;
    std::optional<double> canvasHeight;
    std::optional<double> feed;
    std::optional<double> density;
    std::optional<double> overscan;
    std::optional<int> power;
    std::optional<int> passes;

    QString error;
};

static StartupFlags parseFlags(int argc, char* argv[])
{
    StartupFlags flags;

    auto value = [&](int& i, const QString& name) -> QString {
        if (i + 1 >= argc) {
            flags.error = QStringLiteral("%1 needs a value").arg(name);
            return QString();
        }
        return QString::fromLocal8Bit(argv[++i]);
    };
    auto number = [&](int& i, const QString& name) -> std::optional<double> {
        QString text = value(i, name);
        if (!flags.error.isEmpty()) return std::nullopt;
        bool ok = false;
        double v = text.toDouble(&ok);
        if (!ok) {
            flags.error = QStringLiteral("%1 expects a number, got \"%2\"").arg(name, text);
            return std::nullopt;
        }
        return v;
    };
    auto integer = [&](int& i, const QString& name) -> std::optional<int> {
        QString text = value(i, name);
        if (!flags.error.isEmpty()) return std::nullopt;
        bool ok = false;
        int v = text.toInt(&ok);
        if (!ok) {
            flags.error = QStringLiteral("%1 expects an integer, got \"%2\"").arg(name, text);
            return std::nullopt;
        }
        return v;
    };

    for (int i = 1; i < argc && flags.error.isEmpty(); ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == QLatin1String("-h") || arg == QLatin1String("--help")) {
            flags.help = true;
        }
        else if (arg == QLatin1String("-o")) {
            flags.outputPath = value(i, arg);
        }
        else if (arg == QLatin1String("--config")) {
            flags.configPath = value(i, arg);
        }
        else if (arg == QLatin1String("--write-config")) {
            flags.writeConfigPath = value(i, arg);
        }
        else if (arg == QLatin1String("--flip-y")) {
            flags.flipY = true;
        }
        else if (arg == QLatin1String("--halftone")) {
            flags.halftone = true;
        }
        else if (arg == QLatin1String("--negative")) {
            flags.negative = true;
        }
        else if (arg == QLatin1String("--width")) {
            flags.width = number(i, arg);
        }
        else if (arg == QLatin1String("--height")) {
            flags.height = number(i, arg);
        }
        else if (arg == QLatin1String("--canvas-height")) {
            flags.canvasHeight = number(i, arg);
        }
        else if (arg == QLatin1String("--feed")) {
            flags.feed = number(i, arg);
        }
        else if (arg == QLatin1String("--density")) {
            flags.density = number(i, arg);
        }
        else if (arg == QLatin1String("--overscan")) {
            flags.overscan = number(i, arg);
        }
        else if (arg == QLatin1String("--power")) {
            flags.power = integer(i, arg);
        }
        else if (arg == QLatin1String("--passes")) {
            flags.passes = integer(i, arg);
        }
        else if (arg.startsWith(QLatin1Char('-')) && arg.size() > 1) {
            flags.error = QStringLiteral("Unknown option %1").arg(arg);
        }
        else if (flags.command.isEmpty()) {
            flags.command = arg;
        }
        else {
            flags.arguments.append(arg);
        }
    }

    return flags;
}

// ---- Helper: profile overrides ---------------------------------------

static void applyOverrides(const StartupFlags& flags, lasercam::toolpath::MachineProfile& profile)
{
    if (flags.power) {
        profile.engrave.power = *flags.power;
        profile.scan.maxPower = *flags.power;
    }
    if (flags.feed) {
        profile.engrave.feedRate = *flags.feed;
        profile.scan.burnSpeed = *flags.feed;
    }
    if (flags.passes) profile.engrave.passes = *flags.passes;
    if (flags.density) profile.scan.lineDensity = *flags.density;
    if (flags.overscan) profile.scan.overscanDistance = *flags.overscan;
    if (flags.halftone) profile.scan.halftone = true;
    if (flags.negative) profile.scan.negativeImage = true;

    if (flags.flipY) {
        profile.engrave.flipY = true;
        profile.engrave.canvasHeight = flags.canvasHeight.value_or(profile.platformSize.height());
    } else if (flags.canvasHeight) {
        profile.engrave.canvasHeight = *flags.canvasHeight;
    }
}

static void printUsage()
{
    std::cout
        << "Usage: lasercam [options] <command> ...\n"
        << "\n"
        << "Commands:\n"
        << "  import <file>                     Summarize an SVG, DXF or HP-GL file\n"
        << "  engrave <file>                    Emit the engrave program of a vector file\n"
        << "  scan <image>                      Emit the scan program of a bitmap\n"
        << "  part <TYPE> [key=value ...]       Emit the engrave program of a part\n"
        << "\n"
        << "Options:\n"
        << "  -o <file>                         Output file (default: stdout)\n"
        << "  --config <profile.json>           Machine profile\n"
        << "  --write-config <file>             Save the effective profile\n"
        << "  --flip-y                          Mirror Y into machine coordinates\n"
        << "  --canvas-height <mm>              Height used by --flip-y\n"
        << "  --power <percent>                 Engrave power / scan maximum power\n"
        << "  --feed <mm/min>                   Engrave feed / scan burn speed\n"
        << "  --passes <n>                      Engrave passes\n"
        << "  --density <lines/mm>              Scan line density\n"
        << "  --halftone                        Scan in halftone mode\n"
        << "  --negative                        Invert the scanned image\n"
        << "  --overscan <mm>                   Scan overscan distance\n"
        << "  --width <mm> / --height <mm>      Scanned image size\n"
        << std::endl;
}

// ---- main ------------------------------------------------------------

int main(int argc, char* argv[])
{
    StartupFlags flags = parseFlags(argc, argv);

    // Image format plugins are located through the application object
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("LaserCAM"));
    app.setApplicationVersion(QString::fromLatin1(lasercam::version()));

    if (!flags.error.isEmpty()) {
        std::cerr << "Error: " << flags.error.toStdString() << std::endl;
        printUsage();
        return lasercam::ExitError;
    }
    if (flags.help || (flags.command.isEmpty() && flags.writeConfigPath.isEmpty())) {
        printUsage();
        return flags.help ? lasercam::ExitOk : lasercam::ExitError;
    }

    if (!lasercam::initialize()) {
        std::cerr << "Fatal: failed to initialize LaserCAM core library."
                  << std::endl;
        return lasercam::ExitError;
    }

    lasercam::toolpath::MachineProfile profile;
    if (!flags.configPath.isEmpty()) {
        QString errorMsg;
        if (!lasercam::toolpath::loadMachineProfile(flags.configPath, profile, &errorMsg)) {
            std::cerr << "Error: " << errorMsg.toStdString() << std::endl;
            lasercam::shutdown();
            return lasercam::ExitError;
        }
    }
    applyOverrides(flags, profile);

    if (!flags.writeConfigPath.isEmpty()) {
        QString errorMsg;
        if (!lasercam::toolpath::saveMachineProfile(flags.writeConfigPath, profile, &errorMsg)) {
            std::cerr << "Error: " << errorMsg.toStdString() << std::endl;
            lasercam::shutdown();
            return lasercam::ExitError;
        }
        std::cout << "Wrote profile to " << flags.writeConfigPath.toStdString() << std::endl;
        if (flags.command.isEmpty()) {
            lasercam::shutdown();
            return lasercam::ExitOk;
        }
    }

    lasercam::CliMode cli(profile);

    int result = lasercam::ExitError;
    const QString& command = flags.command;
    const QStringList& args = flags.arguments;

    if (command == QLatin1String("import") && args.size() == 1) {
        result = cli.runImport(args.first());
    } else if (command == QLatin1String("engrave") && args.size() == 1) {
        result = cli.runEngrave(args.first(), flags.outputPath);
    } else if (command == QLatin1String("scan") && args.size() == 1) {
        result = cli.runScan(args.first(), flags.width.value_or(0.0),
                             flags.height.value_or(0.0), flags.outputPath);
    } else if (command == QLatin1String("part") && !args.isEmpty()) {
        result = cli.runPart(args.first(), args.mid(1), flags.outputPath);
    } else {
        std::cerr << "Error: unknown command or wrong arguments: "
                  << command.toStdString() << std::endl;
        printUsage();
    }

    lasercam::shutdown();
    return result;
}
