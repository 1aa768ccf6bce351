// =====================================================================
//  src/liblasercam/toolpath/scan.cpp — Raster lowering
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/toolpath/scan.h>
#include <lasercam/geometry/utils.h>
#include <lasercam/log.h>

#include <QPainter>
#include <QtMath>

#include <cmath>

namespace lasercam {
namespace toolpath {

using geometry::formatNumber;

namespace {

double srgbToLinear(double channel)
{
    double c = channel / 255.0;
    return c < 0.04045 ? c / 12.92 : std::pow((c + 0.055) / 1.055, 2.4);
}

int linearToSrgb(double l)
{
    double encoded = l > 0.0031308 ? 1.055 * std::pow(l, 1.0 / 2.4) - 0.055 : 12.92 * l;
    return qBound(0, qRound(encoded * 255.0), 255);
}

/// Composite one channel over white
double overWhite(int channel, int alpha)
{
    return channel * (alpha / 255.0) + 255.0 * (1.0 - alpha / 255.0);
}

}  // anonymous namespace

// =====================================================================
//  Luma
// =====================================================================

LumaGrid::LumaGrid(int w, int h, int fill)
    : width(qMax(0, w))
    , height(qMax(0, h))
    , values(width * height, fill)
{
}

int scanPower(int luma, const ScanSettings& settings)
{
    if (settings.halftone) {
        return luma < HALFTONE_THRESHOLD ? settings.maxPower : 0;
    }
    if (settings.minPower == settings.maxPower) {
        return luma < SINGLE_POWER_THRESHOLD ? settings.maxPower : 0;
    }
    return qRound(settings.minPower +
                  (1.0 - luma / 255.0) * (settings.maxPower - settings.minPower));
}

int pixelLuma(QRgb pixel, bool negative)
{
    const int alpha = qAlpha(pixel);
    double l = 0.2126 * srgbToLinear(overWhite(qRed(pixel), alpha)) +
               0.7152 * srgbToLinear(overWhite(qGreen(pixel), alpha)) +
               0.0722 * srgbToLinear(overWhite(qBlue(pixel), alpha));
    return linearToSrgb(negative ? 1.0 - l : l);
}

LumaGrid lumaFromImage(const QImage& image, bool negative)
{
    if (image.isNull()) {
        return LumaGrid();
    }

    const QImage argb = image.convertToFormat(QImage::Format_ARGB32);
    LumaGrid grid(argb.width(), argb.height());
    for (int y = 0; y < argb.height(); ++y) {
        const QRgb* line = reinterpret_cast<const QRgb*>(argb.constScanLine(y));
        for (int x = 0; x < argb.width(); ++x) {
            grid.set(x, y, pixelLuma(line[x], negative));
        }
    }
    return grid;
}

LumaGrid halftoneDither(const LumaGrid& grid)
{
    static const int KERNEL[3][5] = {
        {0, 0, 0, 7, 5},
        {3, 5, 7, 5, 3},
        {1, 3, 5, 3, 1},
    };

    const int w = grid.width;
    const int h = grid.height;
    LumaGrid result(w, h);

    QVector<double> working(grid.values.size());
    QVector<bool> protectedWhite(grid.values.size());
    for (int i = 0; i < grid.values.size(); ++i) {
        working[i] = grid.values[i];
        protectedWhite[i] = grid.values[i] >= CONTENT_THRESHOLD;
    }

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const int i = y * w + x;
            const double c = working[i];
            const int quantized = c < HALFTONE_THRESHOLD ? 0 : 255;
            result.values[i] = quantized;

            const double error = c - quantized;
            if (error == 0.0) continue;

            for (int ky = 0; ky < 3; ++ky) {
                const int ty = y + ky;
                if (ty >= h) continue;
                for (int kx = 0; kx < 5; ++kx) {
                    const int weight = KERNEL[ky][kx];
                    if (weight == 0) continue;
                    const int tx = x + kx - 2;
                    if (tx < 0 || tx >= w) continue;
                    const int target = ty * w + tx;
                    if (protectedWhite[target]) continue;
                    working[target] = qBound(0.0, working[target] + error * weight / 48.0, 255.0);
                }
            }
        }
    }

    for (int i = 0; i < result.values.size(); ++i) {
        if (protectedWhite[i]) {
            result.values[i] = 255;
        }
    }
    return result;
}

LumaGrid prepareLuma(const LumaGrid& grid, const ScanSettings& settings)
{
    LumaGrid out = grid;

    if (settings.hFlipped) {
        for (int y = 0; y < out.height; ++y) {
            for (int x = 0; x < out.width / 2; ++x) {
                const int a = out.at(x, y);
                out.set(x, y, out.at(out.width - 1 - x, y));
                out.set(out.width - 1 - x, y, a);
            }
        }
    }
    if (settings.vFlipped) {
        for (int y = 0; y < out.height / 2; ++y) {
            for (int x = 0; x < out.width; ++x) {
                const int a = out.at(x, y);
                out.set(x, y, out.at(x, out.height - 1 - y));
                out.set(x, out.height - 1 - y, a);
            }
        }
    }

    if (settings.halftone) {
        out = halftoneDither(out);
    }
    return out;
}

// =====================================================================
//  Platform raster
// =====================================================================

QImage renderPlatform(const QVector<scene::CanvasItem>& images,
                      const QSize& pixelSize, const QSizeF& scale)
{
    QImage platform(pixelSize, QImage::Format_RGB32);
    platform.fill(Qt::white);

    QPainter painter(&platform);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.setRenderHint(QPainter::Antialiasing, true);

    for (const scene::CanvasItem& item : images) {
        const auto* image = std::get_if<scene::ImageObject>(&item.shape);
        if (!image || image->pixels.isNull()) continue;

        // Item position is the image center in canvas units
        painter.save();
        painter.translate(image->x * scale.width(), image->y * scale.height());
        painter.scale(scale.width(), scale.height());
        painter.rotate(image->rotation);
        painter.drawImage(QRectF(-image->width / 2.0, -image->height / 2.0,
                                 image->width, image->height),
                          image->pixels);
        painter.restore();
    }

    painter.end();
    return platform;
}

// =====================================================================
//  ScanEmitter
// =====================================================================

ScanEmitter::ScanEmitter(const scene::Layer& layer,
                         const QVector<scene::CanvasItem>& items,
                         const QSizeF& documentSize,
                         const ScanSettings& settings,
                         const CanvasSizeProvider* canvas)
    : m_layer(layer)
    , m_settings(settings.withLayer(layer))
    , m_program(SCAN_DECIMALS)
    , m_coalescer(m_program)
{
    if (layer.printingMethod != scene::PrintingMethod::Scan) {
        m_status = EmitStatus::Error;
        m_errorMessage = QStringLiteral("Layer %1 is not a scan layer").arg(layer.name);
        return;
    }

    QVector<scene::CanvasItem> images;
    for (const scene::CanvasItem& item : items) {
        if (item.layerId != layer.id) continue;
        const auto* image = std::get_if<scene::ImageObject>(&item.shape);
        if (!image) continue;
        if (image->pixels.isNull() || image->width <= 0.0 || image->height <= 0.0) {
            qCWarning(lcToolpath) << "Skipping image" << item.id << "without pixels or size";
            ++m_stats.itemsSkipped;
            continue;
        }
        images.append(item);
    }
    if (images.isEmpty()) {
        m_status = EmitStatus::NothingToEmit;
        m_errorMessage = QStringLiteral("Layer %1 has no images").arg(layer.name);
        return;
    }

    const QSize pixelSize(qRound(documentSize.width() * m_settings.lineDensity),
                          qRound(documentSize.height() * m_settings.lineDensity));
    if (pixelSize.width() <= 0 || pixelSize.height() <= 0) {
        m_status = EmitStatus::Error;
        m_errorMessage = QStringLiteral("Platform of %1 x %2 mm has no pixels at %3 lines/mm")
                             .arg(documentSize.width())
                             .arg(documentSize.height())
                             .arg(m_settings.lineDensity);
        return;
    }

    QSizeF canvasSize = canvas ? canvas->canvasSize() : documentSize;
    if (canvasSize.width() <= 0.0 || canvasSize.height() <= 0.0) {
        qCWarning(lcToolpath) << "Ignoring empty canvas size" << canvasSize;
        canvasSize = documentSize;
    }
    const QSizeF scale(pixelSize.width() / canvasSize.width(),
                       pixelSize.height() / canvasSize.height());

    const QImage platform = renderPlatform(images, pixelSize, scale);
    start(lumaFromImage(platform, m_settings.negativeImage), images.size());
}

ScanEmitter::ScanEmitter(const scene::Layer& layer,
                         const LumaGrid& luma,
                         const ScanSettings& settings)
    : m_layer(layer)
    , m_settings(settings.withLayer(layer))
    , m_program(SCAN_DECIMALS)
    , m_coalescer(m_program)
{
    if (luma.isEmpty()) {
        m_status = EmitStatus::NothingToEmit;
        m_errorMessage = QStringLiteral("Empty raster");
        return;
    }
    start(luma, 1);
}

void ScanEmitter::start(const LumaGrid& luma, int imageCount)
{
    m_grid = prepareLuma(luma, m_settings);
    m_pitch = 1.0 / m_settings.lineDensity;

    // Content bounds in machine rows (row 0 at the bottom)
    m_minRow = m_grid.height;
    m_maxRow = -1;
    m_minCol = m_grid.width;
    m_maxCol = -1;
    for (int row = 0; row < m_grid.height; ++row) {
        for (int x = 0; x < m_grid.width; ++x) {
            if (!isContent(x, row)) continue;
            m_minRow = qMin(m_minRow, row);
            m_maxRow = qMax(m_maxRow, row);
            m_minCol = qMin(m_minCol, x);
            m_maxCol = qMax(m_maxCol, x);
        }
    }
    if (m_maxRow < 0) {
        m_minRow = 0;
    }
    m_nextRow = m_minRow;

    writeHeader(imageCount);
    if (m_maxRow < 0) {
        m_program.addComment(QStringLiteral("No content found in layer"));
    } else {
        writeContentSummary();
    }
}

int ScanEmitter::rowCount() const
{
    if (m_status != EmitStatus::Ok || m_maxRow < m_minRow) {
        return 0;
    }
    return m_maxRow - m_minRow + 1;
}

bool ScanEmitter::isContent(int x, int row) const
{
    return m_grid.at(x, m_grid.height - 1 - row) < CONTENT_THRESHOLD;
}

int ScanEmitter::powerAt(int x, int row) const
{
    return scanPower(m_grid.at(x, m_grid.height - 1 - row), m_settings);
}

void ScanEmitter::writeHeader(int imageCount)
{
    const ScanSettings& s = m_settings;
    m_program.addComment(QStringLiteral("Platform Scan G-Code"));
    m_program.addComment(QStringLiteral("Layer: %1").arg(m_layer.name));
    m_program.addComment(QStringLiteral("Image Count: %1").arg(imageCount));
    m_program.addComment(QStringLiteral("Platform Size: %1x%2 mm")
                             .arg(formatNumber(m_grid.width * m_pitch, SCAN_DECIMALS),
                                  formatNumber(m_grid.height * m_pitch, SCAN_DECIMALS)));
    m_program.addComment(QStringLiteral("Resolution: %1 lines/mm (%2x%3 pixels)")
                             .arg(formatNumber(s.lineDensity, 3))
                             .arg(m_grid.width)
                             .arg(m_grid.height));
    m_program.addComment(QStringLiteral("Mode: %1")
                             .arg(s.halftone ? QStringLiteral("Halftone") : QStringLiteral("Greyscale")));
    m_program.addComment(QStringLiteral("Power Range: [%1, %2] (%3 scale)")
                             .arg(s.minPower)
                             .arg(s.maxPower)
                             .arg(powerScaleName(s.powerScale)));
    m_program.addComment(QStringLiteral("Speed: Burn=%1 mm/min, Travel=%2 mm/min")
                             .arg(formatNumber(s.burnSpeed, 0), formatNumber(s.travelSpeed, 0)));
    m_program.addComment(QString());
    m_program.addCommand(QStringLiteral("G90 ; Absolute positioning"));
    m_program.addCommand(QStringLiteral("G21 ; Units in millimeters"));
    m_program.addCommand(QStringLiteral("G0 X0 Y0 F%1 ; Move to origin")
                             .arg(formatNumber(s.travelSpeed, 0)));
    m_program.addCommand(QStringLiteral("M4 ; Enable laser (variable power mode)"));
    m_program.addBlank();
}

void ScanEmitter::writeContentSummary()
{
    const double overscan = m_settings.overscanDistance;
    m_program.addComment(QStringLiteral("Overscan: %1 mm (%2 pixels)")
                             .arg(formatNumber(overscan, SCAN_DECIMALS))
                             .arg(qCeil(overscan / m_pitch)));
    m_program.addComment(QStringLiteral("Content bounds: X[%1, %2] Y[%3, %4] mm")
                             .arg(formatNumber(m_minCol * m_pitch, SCAN_DECIMALS),
                                  formatNumber(m_maxCol * m_pitch, SCAN_DECIMALS),
                                  formatNumber(m_minRow * m_pitch, SCAN_DECIMALS),
                                  formatNumber(m_maxRow * m_pitch, SCAN_DECIMALS)));
    m_program.addComment(QStringLiteral("Scan rows: %1 of %2")
                             .arg(m_maxRow - m_minRow + 1)
                             .arg(m_grid.height));
    m_program.addBlank();
}

bool ScanEmitter::emitNextRow()
{
    if (m_status != EmitStatus::Ok || m_finished || m_nextRow > m_maxRow) {
        return false;
    }
    emitRow(m_nextRow);
    ++m_nextRow;
    return true;
}

void ScanEmitter::emitRow(int row)
{
    const ScanSettings& s = m_settings;
    const bool reverse = row % 2 != 0;
    const double y = row * m_pitch;

    int rowMin = m_grid.width;
    int rowMax = -1;
    for (int x = m_minCol; x <= m_maxCol; ++x) {
        if (isContent(x, row)) {
            rowMin = qMin(rowMin, x);
            rowMax = qMax(rowMax, x);
        }
    }
    if (rowMax < 0) {
        ++m_stats.rowsSkipped;
        return;
    }

    const double contentStart = rowMin * m_pitch;
    const double contentEnd = rowMax * m_pitch;
    const int overscanPixels = qCeil(s.overscanDistance / m_pitch);
    const int scanStart = qMax(0, rowMin - overscanPixels);
    const int scanEnd = qMin(m_grid.width - 1, rowMax + overscanPixels);

    // Column of the n-th pixel in sweep order
    auto column = [&](int n) { return reverse ? scanEnd - (n - scanStart) : n; };
    auto scaled = [&](int percent) { return scalePower(percent, s.powerScale); };

    // Lead-in: overscan, (halftone) half overscan, content edge
    m_coalescer.moveTo(reverse ? contentEnd + s.overscanDistance : contentStart - s.overscanDistance,
                       y, 0, s.travelSpeed);
    m_coalescer.flush();
    if (s.halftone && s.overscanDistance > 0.0) {
        m_coalescer.moveTo(reverse ? contentEnd + s.overscanDistance * 0.5
                                   : contentStart - s.overscanDistance * 0.5,
                           std::nullopt, 0, s.travelSpeed);
    }
    m_coalescer.moveTo(reverse ? contentEnd : contentStart, std::nullopt, 0, s.travelSpeed);

    int n = scanStart;
    while (n <= scanEnd) {
        const int ix = column(n);
        const int power = powerAt(ix, row);

        if (power > 0) {
            m_coalescer.moveTo(ix * m_pitch, std::nullopt, scaled(power), s.burnSpeed);
            ++n;
            continue;
        }

        int blankEnd = n;
        while (blankEnd <= scanEnd && powerAt(column(blankEnd), row) <= 0) {
            ++blankEnd;
        }

        if (blankEnd - n > BLANK_RUN_PIXELS) {
            m_coalescer.moveTo(column(blankEnd - 1) * m_pitch, std::nullopt, 0, s.travelSpeed);
            n = blankEnd;
        } else {
            m_coalescer.moveTo(ix * m_pitch, std::nullopt, 0, s.burnSpeed);
            ++n;
        }
    }

    // Lead-out past the far content edge
    m_coalescer.moveTo(reverse ? contentStart - s.overscanDistance : contentEnd + s.overscanDistance,
                       std::nullopt, 0, s.travelSpeed);
    m_coalescer.flush();
    m_program.addBlank();

    ++m_stats.rowsProcessed;
}

EmitResult ScanEmitter::finish()
{
    EmitResult result;
    result.status = m_status;
    result.errorMessage = m_errorMessage;
    result.stats = m_stats;

    if (m_status != EmitStatus::Ok) {
        qCDebug(lcToolpath) << "Scan layer" << m_layer.name << "not emitted:" << m_errorMessage;
        return result;
    }

    if (!m_finished) {
        while (emitNextRow()) {
        }
        m_coalescer.flush();

        m_program.addCommand(QStringLiteral("M5 ; Disable laser"));
        m_program.addCommand(QStringLiteral("G0 X0 Y0 F%1 ; Return to origin")
                                 .arg(formatNumber(m_settings.travelSpeed, 0)));
        m_program.addBlank();
        m_program.addComment(QStringLiteral("Processed %1 rows, skipped %2 blank rows")
                                 .arg(m_stats.rowsProcessed)
                                 .arg(m_stats.rowsSkipped));
        m_program.addCommand(QStringLiteral("M2 ; End program"));
        m_stats.cuttingMoves = m_program.cutCount();
        m_finished = true;

        qCDebug(lcToolpath) << "Scan layer" << m_layer.name << ":" << m_stats.rowsProcessed
                            << "rows," << m_stats.cuttingMoves << "cutting moves";
    }

    result.success = true;
    result.program = m_program;
    result.stats = m_stats;
    return result;
}

// =====================================================================
//  Entry point
// =====================================================================

EmitResult emitScanInstructions(const scene::Layer& layer,
                                const QVector<scene::CanvasItem>& items,
                                double documentWidth,
                                double documentHeight,
                                const ScanSettings& settings,
                                const CanvasSizeProvider* canvas,
                                const ProgressCallback& progress)
{
    ScanEmitter emitter(layer, items, QSizeF(documentWidth, documentHeight), settings, canvas);

    const int total = emitter.rowCount();
    while (emitter.emitNextRow()) {
        if (progress && !progress(emitter.rowsDone(), total)) {
            EmitResult cancelled;
            cancelled.status = EmitStatus::Cancelled;
            cancelled.errorMessage = QStringLiteral("Cancelled");
            qCDebug(lcToolpath) << "Scan of layer" << layer.name << "cancelled after"
                                << emitter.rowsDone() << "of" << total << "rows";
            return cancelled;
        }
    }
    return emitter.finish();
}

}  // namespace toolpath
}  // namespace lasercam
