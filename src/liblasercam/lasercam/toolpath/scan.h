// =====================================================================
//  src/liblasercam/lasercam/toolpath/scan.h — Raster lowering
// =====================================================================
//
//  Lowers the bitmap items of one SCAN layer to a variable-power
//  raster program.
//
//  The items are painted onto a white platform raster whose pixel
//  pitch equals the row spacing (1 / lineDensity mm).  Every pixel is
//  reduced to a luma value, optionally flipped and dithered, and the
//  rows that hold content are swept bottom-up in alternating direction.
//  Each swept row starts and ends `overscanDistance` beyond its content
//  so the head reaches speed before the first burnt pixel.
//
//  Power mapping per pixel:
//
//    halftone           luma < 128  -> maxPower, else 0
//    min == max         luma < 127  -> maxPower, else 0
//    otherwise          round(min + (1 - luma/255) * (max - min))
//
//  The emitter works one row at a time so a host can keep its UI
//  responsive between rows.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_TOOLPATH_SCAN_H
#define LASERCAM_TOOLPATH_SCAN_H

#include "coalescer.h"
#include "host.h"
#include "result.h"
#include "settings.h"
#include "../scene/item.h"

#include <QImage>

namespace lasercam {
namespace toolpath {

/// Coordinate decimals of scan programs
constexpr int SCAN_DECIMALS = 2;

/// Halftone on/off boundary
constexpr int HALFTONE_THRESHOLD = 128;

/// On/off boundary when minPower equals maxPower
constexpr int SINGLE_POWER_THRESHOLD = 127;

/// Pixels at or above this luma are background: they bound no content
/// and are never darkened by error diffusion
constexpr int CONTENT_THRESHOLD = 220;

/// Runs of zero-power pixels longer than this are crossed with a rapid
constexpr int BLANK_RUN_PIXELS = 3;

/// Grid of 8-bit luma values, row 0 at the top
struct LASERCAM_EXPORT LumaGrid {
    int width = 0;
    int height = 0;
    QVector<int> values;

    LumaGrid() = default;
    LumaGrid(int w, int h, int fill = 255);

    bool isEmpty() const { return width <= 0 || height <= 0; }
    int at(int x, int y) const { return values[y * width + x]; }
    void set(int x, int y, int luma) { values[y * width + x] = luma; }
};

/// Laser power (percent) for one pixel luma
LASERCAM_EXPORT int scanPower(int luma, const ScanSettings& settings);

/// Luma of a color
///
/// The pixel is composited on white, decoded from sRGB, reduced to
/// linear luminance (0.2126 R + 0.7152 G + 0.0722 B), inverted in
/// linear light for a negative, and encoded back to sRGB.
LASERCAM_EXPORT int pixelLuma(QRgb pixel, bool negative = false);

/// Luma of every pixel of an image
LASERCAM_EXPORT LumaGrid lumaFromImage(const QImage& image, bool negative = false);

/// Apply flips and, in halftone mode, error diffusion
LASERCAM_EXPORT LumaGrid prepareLuma(const LumaGrid& grid, const ScanSettings& settings);

/// Error diffusion to pure black / white
///
/// Uses the 3 x 5 kernel [[0,0,0,7,5],[3,5,7,5,3],[1,3,5,3,1]] / 48.
/// Pixels at or above CONTENT_THRESHOLD keep white and receive no error.
LASERCAM_EXPORT LumaGrid halftoneDither(const LumaGrid& grid);

/// Paint the SCAN items of a layer onto a white platform raster
/// @param pixelSize  Platform raster size in pixels
/// @param scale      Pixels per canvas unit
LASERCAM_EXPORT QImage renderPlatform(const QVector<scene::CanvasItem>& images,
                                      const QSize& pixelSize, const QSizeF& scale);

/// Row-at-a-time raster emitter
class LASERCAM_EXPORT ScanEmitter {
public:
    /// Render the layer's images onto a platform of documentSize (mm)
    /// @param canvas Size of the canvas item coordinates refer to; when
    ///               null, item coordinates are document millimeters
    ScanEmitter(const scene::Layer& layer,
                const QVector<scene::CanvasItem>& items,
                const QSizeF& documentSize,
                const ScanSettings& settings,
                const CanvasSizeProvider* canvas = nullptr);

    /// Emit from a ready luma grid (row 0 at the top of the platform)
    ScanEmitter(const scene::Layer& layer,
                const LumaGrid& luma,
                const ScanSettings& settings);

    ScanEmitter(const ScanEmitter&) = delete;
    ScanEmitter& operator=(const ScanEmitter&) = delete;

    /// Status so far: NothingToEmit / Error are final
    EmitStatus status() const { return m_status; }

    /// Rows between the lowest and highest content row
    int rowCount() const;

    /// Rows handled so far
    int rowsDone() const { return m_nextRow - m_minRow; }

    /// Emit the next row; returns false when no rows remain
    bool emitNextRow();

    /// Emit the remaining rows and the program footer
    EmitResult finish();

private:
    void start(const LumaGrid& luma, int imageCount);
    void writeHeader(int imageCount);
    void writeContentSummary();
    void emitRow(int row);
    int powerAt(int x, int row) const;
    bool isContent(int x, int row) const;

    scene::Layer m_layer;
    ScanSettings m_settings;
    EmitStatus m_status = EmitStatus::Ok;
    QString m_errorMessage;

    LumaGrid m_grid;
    double m_pitch = 0.1;

    int m_minRow = 0;
    int m_maxRow = -1;
    int m_minCol = 0;
    int m_maxCol = -1;
    int m_nextRow = 0;

    Program m_program;
    InstructionCoalescer m_coalescer;
    EmitStats m_stats;
    bool m_finished = false;
};

/// Emit the SCAN program of one layer
/// @param progress Called after each row with (rows done, row count);
///                 returning false cancels the pass
LASERCAM_EXPORT EmitResult emitScanInstructions(
    const scene::Layer& layer,
    const QVector<scene::CanvasItem>& items,
    double documentWidth,
    double documentHeight,
    const ScanSettings& settings,
    const CanvasSizeProvider* canvas = nullptr,
    const ProgressCallback& progress = {});

}  // namespace toolpath
}  // namespace lasercam

#endif  // LASERCAM_TOOLPATH_SCAN_H
