// =====================================================================
//  tests/scan_test.cpp — Raster scan lowering
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/toolpath/scan.h>
#include <lasercam/toolpath/emitter.h>
#include <lasercam/scene/scene.h>

#include <gtest/gtest.h>

using namespace lasercam;
using namespace lasercam::toolpath;

namespace {

scene::Layer scanLayer()
{
    scene::Layer layer;
    layer.id = QStringLiteral("layer_1");
    layer.name = QStringLiteral("Photos");
    layer.printingMethod = scene::PrintingMethod::Scan;
    return layer;
}

/// One machine millimeter per pixel, no overscan, full greyscale range
ScanSettings unitSettings()
{
    ScanSettings settings;
    settings.lineDensity = 1.0;
    settings.overscanDistance = 0.0;
    settings.minPower = 0;
    settings.maxPower = 100;
    return settings;
}

/// Single-row grid with black pixels at the given columns
LumaGrid rowGrid(int width, const QVector<int>& black)
{
    LumaGrid grid(width, 1);
    for (int x : black) {
        grid.set(x, 0, 0);
    }
    return grid;
}

scene::Scene sceneWithImage(const QColor& color)
{
    scene::ImageObject image;
    image.pixels = QImage(10, 10, QImage::Format_RGB32);
    image.pixels.fill(color);
    image.width = 10;
    image.height = 10;
    image.x = 5;
    image.y = 5;
    scene::SceneEdit edit = scene::Scene().addItem(image);
    EXPECT_TRUE(edit.success);
    return edit.scene;
}

}  // anonymous namespace

TEST(ScanPower, HalftoneThreshold)
{
    ScanSettings settings;
    settings.halftone = true;
    settings.maxPower = 80;
    EXPECT_EQ(scanPower(127, settings), 80);
    EXPECT_EQ(scanPower(128, settings), 0);
}

TEST(ScanPower, SinglePowerThreshold)
{
    ScanSettings settings;
    settings.minPower = 60;
    settings.maxPower = 60;
    EXPECT_EQ(scanPower(126, settings), 60);
    EXPECT_EQ(scanPower(127, settings), 0);
}

TEST(ScanPower, GreyscaleIsLinearInLuma)
{
    ScanSettings settings;
    settings.minPower = 10;
    settings.maxPower = 90;
    EXPECT_EQ(scanPower(0, settings), 90);
    EXPECT_EQ(scanPower(255, settings), 10);
    EXPECT_EQ(scanPower(51, settings), 74);
}

TEST(ScanLuma, PixelLuma)
{
    EXPECT_EQ(pixelLuma(qRgb(0, 0, 0)), 0);
    EXPECT_EQ(pixelLuma(qRgb(255, 255, 255)), 255);
    EXPECT_EQ(pixelLuma(qRgb(0, 0, 0), true), 255);
    // Transparent pixels read as the white platform
    EXPECT_EQ(pixelLuma(qRgba(0, 0, 0, 0)), 255);
}

TEST(ScanLuma, FlipsAndHalftone)
{
    LumaGrid grid(3, 2);
    grid.set(0, 0, 10);

    ScanSettings settings;
    settings.hFlipped = true;
    settings.vFlipped = true;
    LumaGrid flipped = prepareLuma(grid, settings);
    EXPECT_EQ(flipped.at(2, 1), 10);
    EXPECT_EQ(flipped.at(0, 0), 255);

    LumaGrid grey(8, 8, 100);
    LumaGrid dithered = halftoneDither(grey);
    int black = 0;
    for (int v : dithered.values) {
        EXPECT_TRUE(v == 0 || v == 255);
        if (v == 0) ++black;
    }
    EXPECT_GT(black, 0);
    EXPECT_LT(black, 64);
}

TEST(ScanEmitter, BlackRunBecomesOneCut)
{
    ScanEmitter emitter(scanLayer(), rowGrid(10, {2, 3, 4, 5}), unitSettings());
    ASSERT_EQ(emitter.status(), EmitStatus::Ok);
    EXPECT_EQ(emitter.rowCount(), 1);

    EmitResult result = emitter.finish();
    ASSERT_TRUE(result.success);

    QVector<Instruction> motions = result.program.motions();
    ASSERT_EQ(motions.size(), 2);
    EXPECT_EQ(Program::formatMotion(motions[0], SCAN_DECIMALS), QStringLiteral("G0 X2 Y0 F6000"));
    EXPECT_EQ(Program::formatMotion(motions[1], SCAN_DECIMALS), QStringLiteral("G1 X5 S100 F1000"));
    EXPECT_EQ(result.stats.rowsProcessed, 1);
    EXPECT_EQ(result.stats.cuttingMoves, 1);
}

TEST(ScanEmitter, LongBlankRunIsCrossedAtTravelSpeed)
{
    EmitResult result = ScanEmitter(scanLayer(), rowGrid(10, {0, 1, 8, 9}), unitSettings()).finish();
    ASSERT_TRUE(result.success);

    QVector<Instruction> motions = result.program.motions();
    ASSERT_EQ(motions.size(), 4);
    EXPECT_EQ(Program::formatMotion(motions[1], SCAN_DECIMALS), QStringLiteral("G1 X1 S100 F1000"));
    EXPECT_EQ(Program::formatMotion(motions[2], SCAN_DECIMALS), QStringLiteral("G0 X7 F6000"));
    EXPECT_EQ(Program::formatMotion(motions[3], SCAN_DECIMALS), QStringLiteral("G1 X9 S100 F1000"));
}

TEST(ScanEmitter, ShortBlankRunKeepsBurnSpeed)
{
    EmitResult result = ScanEmitter(scanLayer(), rowGrid(6, {0, 1, 4, 5}), unitSettings()).finish();
    ASSERT_TRUE(result.success);

    QVector<Instruction> motions = result.program.motions();
    ASSERT_EQ(motions.size(), 4);
    EXPECT_EQ(Program::formatMotion(motions[2], SCAN_DECIMALS), QStringLiteral("G0 X3"));
    EXPECT_EQ(Program::formatMotion(motions[3], SCAN_DECIMALS), QStringLiteral("G1 X5 S100"));
}

TEST(ScanEmitter, OddRowsRunInReverse)
{
    LumaGrid grid(6, 2, 0);
    EmitResult result = ScanEmitter(scanLayer(), grid, unitSettings()).finish();
    ASSERT_TRUE(result.success);

    QVector<QPointF> trace = result.program.tracePositions();
    ASSERT_EQ(trace.size(), 4);
    EXPECT_EQ(trace[0], QPointF(0, 0));
    EXPECT_EQ(trace[1], QPointF(5, 0));
    EXPECT_EQ(trace[2], QPointF(5, 1));
    EXPECT_EQ(trace[3], QPointF(0, 1));
}

TEST(ScanEmitter, BottomGridRowIsMachineRowZero)
{
    LumaGrid grid(4, 3);
    grid.set(1, 2, 0);
    grid.set(2, 2, 0);

    EmitResult result = ScanEmitter(scanLayer(), grid, unitSettings()).finish();
    ASSERT_TRUE(result.success);
    for (const QPointF& p : result.program.tracePositions()) {
        EXPECT_DOUBLE_EQ(p.y(), 0.0);
    }
}

TEST(ScanEmitter, ByteScaleMapsPower)
{
    ScanSettings settings = unitSettings();
    settings.powerScale = PowerScale::Byte;
    EmitResult result = ScanEmitter(scanLayer(), rowGrid(5, {1, 2, 3}), settings).finish();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(*result.program.motions().last().power, 255);
}

TEST(ScanEmitter, FooterReportsRows)
{
    LumaGrid grid(4, 3);
    grid.set(1, 0, 0);
    grid.set(2, 0, 0);
    grid.set(1, 2, 0);
    grid.set(2, 2, 0);

    EmitResult result = ScanEmitter(scanLayer(), grid, unitSettings()).finish();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.stats.rowsProcessed, 2);
    EXPECT_EQ(result.stats.rowsSkipped, 1);

    const QString text = result.toText();
    EXPECT_TRUE(text.startsWith(QStringLiteral("; Platform Scan G-Code\n; Layer: Photos\n")));
    EXPECT_TRUE(text.contains(QStringLiteral("M4 ; Enable laser (variable power mode)\n")));
    EXPECT_TRUE(text.endsWith(QStringLiteral("; Processed 2 rows, skipped 1 blank rows\nM2 ; End program\n")));
}

TEST(ScanLayer, WhiteImageEmitsNoCuts)
{
    scene::Scene s = sceneWithImage(Qt::white);
    EmitResult result = emitScanInstructions(s.layers().first(), s.items(), 10, 10, ScanSettings());

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    EXPECT_EQ(result.program.cutCount(), 0);
    EXPECT_TRUE(result.toText().contains(QStringLiteral("; No content found in layer")));
}

TEST(ScanLayer, BlackImageIsBurned)
{
    scene::Scene s = sceneWithImage(Qt::black);
    EmitResult result = emitScanInstructions(s.layers().first(), s.items(), 10, 10, ScanSettings());

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    EXPECT_GT(result.program.cutCount(), 0);
    EXPECT_GT(result.stats.rowsProcessed, 0);
    for (const Instruction& m : result.program.motions()) {
        EXPECT_EQ(m.op == MotionOp::Cut, m.power.has_value());
    }
}

TEST(ScanLayer, LayerWithoutImagesHasNothingToEmit)
{
    EmitResult result = emitScanInstructions(scanLayer(), {}, 10, 10, ScanSettings());
    EXPECT_EQ(result.status, EmitStatus::NothingToEmit);
}

TEST(ScanLayer, ProgressCanCancel)
{
    scene::Scene s = sceneWithImage(Qt::black);
    int calls = 0;
    EmitResult result = emitScanInstructions(s.layers().first(), s.items(), 10, 10, ScanSettings(),
                                             nullptr, [&calls](int, int) { return ++calls < 3; });

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, EmitStatus::Cancelled);
    EXPECT_EQ(calls, 3);
}

TEST(ScanEmitter, OverscanLeadInAndLeadOut)
{
    ScanSettings settings = unitSettings();
    settings.overscanDistance = 5.0;
    EmitResult result = ScanEmitter(scanLayer(), rowGrid(30, {10, 11, 12}), settings).finish();
    ASSERT_TRUE(result.success);

    QVector<Instruction> motions = result.program.motions();
    ASSERT_EQ(motions.size(), 4);
    EXPECT_EQ(Program::formatMotion(motions[0], SCAN_DECIMALS), QStringLiteral("G0 X5 Y0 F6000"));
    EXPECT_EQ(Program::formatMotion(motions[1], SCAN_DECIMALS), QStringLiteral("G0 X9"));
    EXPECT_EQ(Program::formatMotion(motions[2], SCAN_DECIMALS), QStringLiteral("G1 X12 S100 F1000"));
    EXPECT_EQ(Program::formatMotion(motions[3], SCAN_DECIMALS), QStringLiteral("G0 X17 F6000"));

    // Moves outside the content never fire
    QVector<QPointF> trace = result.program.tracePositions();
    for (int i = 0; i < motions.size(); ++i) {
        if (trace[i].x() < 10.0 || trace[i].x() > 12.0) {
            EXPECT_EQ(motions[i].op, MotionOp::Rapid);
            EXPECT_FALSE(motions[i].power.has_value());
        }
    }
    EXPECT_TRUE(result.toText().contains(QStringLiteral("; Overscan: 5 mm (5 pixels)\n")));
}

TEST(ScanEmitter, ReversedRowOverscanStartsPastContentEnd)
{
    ScanSettings settings = unitSettings();
    settings.overscanDistance = 2.0;
    LumaGrid grid(20, 2);
    grid.set(8, 0, 0);
    grid.set(9, 0, 0);

    // Grid row 0 is the top, so the content sits on machine row 1
    EmitResult result = ScanEmitter(scanLayer(), grid, settings).finish();
    ASSERT_TRUE(result.success);

    QVector<QPointF> trace = result.program.tracePositions();
    ASSERT_FALSE(trace.isEmpty());
    EXPECT_EQ(trace.first(), QPointF(11, 1));
    EXPECT_EQ(trace.last(), QPointF(6, 1));
}

TEST(ScanEmitter, HorizontalFlipMirrorsColumns)
{
    ScanSettings settings = unitSettings();
    settings.hFlipped = true;
    EmitResult result = ScanEmitter(scanLayer(), rowGrid(10, {0, 1}), settings).finish();
    ASSERT_TRUE(result.success);

    QVector<Instruction> motions = result.program.motions();
    ASSERT_EQ(motions.size(), 2);
    EXPECT_EQ(Program::formatMotion(motions[0], SCAN_DECIMALS), QStringLiteral("G0 X8 Y0 F6000"));
    EXPECT_EQ(Program::formatMotion(motions[1], SCAN_DECIMALS), QStringLiteral("G1 X9 S100 F1000"));
}

TEST(ScanEmitter, VerticalFlipMovesContentToBottomRow)
{
    LumaGrid grid(4, 2);
    grid.set(1, 0, 0);
    grid.set(2, 0, 0);

    ScanSettings settings = unitSettings();
    EmitResult plain = ScanEmitter(scanLayer(), grid, settings).finish();
    settings.vFlipped = true;
    EmitResult flipped = ScanEmitter(scanLayer(), grid, settings).finish();
    ASSERT_TRUE(plain.success);
    ASSERT_TRUE(flipped.success);

    for (const QPointF& p : plain.program.tracePositions()) {
        EXPECT_DOUBLE_EQ(p.y(), 1.0);
    }
    for (const QPointF& p : flipped.program.tracePositions()) {
        EXPECT_DOUBLE_EQ(p.y(), 0.0);
    }
}

TEST(ScanLayer, NegativeImageBurnsWhite)
{
    scene::Scene s = sceneWithImage(Qt::white);
    ScanSettings settings;
    settings.negativeImage = true;
    EmitResult result = emitScanInstructions(s.layers().first(), s.items(), 10, 10, settings);

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    EXPECT_GT(result.program.cutCount(), 0);
    EXPECT_FALSE(result.toText().contains(QStringLiteral("; No content found in layer")));
}

TEST(ScanLayer, SceneLayerUsesProfileSettings)
{
    scene::ImageObject image;
    image.pixels = QImage(10, 10, QImage::Format_RGB32);
    image.pixels.fill(Qt::black);
    image.x = 10;
    image.y = 5;
    image.width = 4;
    image.height = 2;
    scene::SceneEdit edit = scene::Scene().addItem(image);
    ASSERT_TRUE(edit.success);

    MachineProfile profile;
    profile.platformSize = QSizeF(20, 10);
    profile.scan.lineDensity = 1.0;
    profile.scan.overscanDistance = 3.0;
    profile.scan.halftone = true;

    const scene::Layer* layer = edit.scene.firstLayerFor(scene::PrintingMethod::Scan);
    ASSERT_NE(layer, nullptr);
    EmitResult result = emitLayer(edit.scene, layer->id, profile);
    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();

    const QString text = result.toText();
    EXPECT_TRUE(text.contains(QStringLiteral("; Mode: Halftone\n")));
    EXPECT_TRUE(text.contains(QStringLiteral("; Resolution: 1 lines/mm (20x10 pixels)\n")));
    EXPECT_TRUE(text.contains(QStringLiteral("; Overscan: 3 mm (3 pixels)\n")));

    // Content spans columns 8..11; the first row starts 3 mm before it
    QVector<Instruction> motions = result.program.motions();
    ASSERT_FALSE(motions.isEmpty());
    EXPECT_EQ(Program::formatMotion(motions.first(), SCAN_DECIMALS), QStringLiteral("G0 X5 Y4 F6000"));

    double minX = 1e9;
    double maxX = -1e9;
    for (const QPointF& p : result.program.tracePositions()) {
        minX = qMin(minX, p.x());
        maxX = qMax(maxX, p.x());
    }
    EXPECT_DOUBLE_EQ(minX, 5.0);
    EXPECT_DOUBLE_EQ(maxX, 14.0);
}
