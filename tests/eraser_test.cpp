// =====================================================================
//  tests/eraser_test.cpp — Circular eraser
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/scene/eraser.h>
#include <lasercam/geometry/utils.h>

#include <gtest/gtest.h>

using namespace lasercam::scene;
using lasercam::geometry::distance;

TEST(Eraser, CrossingSegmentSplitsInTwo)
{
    const QPointF center(10, 0);
    const double radius = 2.0;
    QVector<QVector<QPointF>> pieces =
        erasePolyline({QPointF(0, 0), QPointF(20, 0)}, center, radius);

    ASSERT_EQ(pieces.size(), 2);
    for (const QVector<QPointF>& piece : pieces) {
        ASSERT_GE(piece.size(), 2);
        for (const QPointF& p : piece) {
            EXPECT_GE(distance(p, center), radius - 0.5);
        }
    }
    EXPECT_EQ(pieces[0].first(), QPointF(0, 0));
    EXPECT_EQ(pieces[1].last(), QPointF(20, 0));
    EXPECT_NEAR(pieces[0].last().x(), 8.0, 0.5);
    EXPECT_NEAR(pieces[1].first().x(), 12.0, 0.5);
}

TEST(Eraser, UntouchedPolylineIsKept)
{
    const QVector<QPointF> points = {QPointF(0, 0), QPointF(10, 0), QPointF(10, 10)};
    QVector<QVector<QPointF>> pieces = erasePolyline(points, QPointF(50, 50), 3.0);
    ASSERT_EQ(pieces.size(), 1);
    EXPECT_EQ(pieces.first(), points);
}

TEST(Eraser, FullyCoveredPolylineDisappears)
{
    QVector<QVector<QPointF>> pieces =
        erasePolyline({QPointF(0, 0), QPointF(1, 0), QPointF(1, 1)}, QPointF(0.5, 0.5), 5.0);
    EXPECT_TRUE(pieces.isEmpty());
}

TEST(Eraser, EndInsideTrimsTail)
{
    QVector<QVector<QPointF>> pieces =
        erasePolyline({QPointF(0, 0), QPointF(10, 0)}, QPointF(10, 0), 3.0);
    ASSERT_EQ(pieces.size(), 1);
    EXPECT_EQ(pieces.first().first(), QPointF(0, 0));
    EXPECT_GE(distance(pieces.first().last(), QPointF(10, 0)), 3.0 - 0.5);
    EXPECT_LE(pieces.first().last().x(), 7.5);
}

TEST(Eraser, EraseAtReplacesHitDrawing)
{
    Drawing line;
    line.points = {QPointF(-10, 0), QPointF(10, 0)};
    line.x = 10;
    line.y = 5;
    line.color = QStringLiteral("#123456");

    Drawing far;
    far.points = {QPointF(0, 0), QPointF(1, 1)};
    far.x = 100;
    far.y = 100;

    SceneEdit first = Scene().addItem(line);
    SceneEdit second = first.scene.addItem(far);
    const QString lineId = first.createdIds.first();
    const QString farId = second.createdIds.first();

    SceneEdit erased = eraseAt(second.scene, QPointF(10, 5), 2.0);
    ASSERT_TRUE(erased.success);
    EXPECT_EQ(erased.createdIds.size(), 2);
    EXPECT_EQ(erased.scene.item(lineId), nullptr);
    EXPECT_NE(erased.scene.item(farId), nullptr);
    EXPECT_EQ(erased.scene.items().size(), 3);

    for (const QString& id : erased.createdIds) {
        const CanvasItem* piece = erased.scene.item(id);
        ASSERT_NE(piece, nullptr);
        const Drawing& d = std::get<Drawing>(piece->shape);
        EXPECT_EQ(d.color, QStringLiteral("#123456"));
        for (const QPointF& p : d.absolutePoints()) {
            EXPECT_GE(distance(p, QPointF(10, 5)), 2.0 - 0.5);
        }
    }
}

TEST(Eraser, MissLeavesSceneUnchanged)
{
    Drawing line;
    line.points = {QPointF(0, 0), QPointF(10, 0)};
    SceneEdit added = Scene().addItem(line);

    SceneEdit erased = eraseAt(added.scene, QPointF(50, 50), 2.0);
    ASSERT_TRUE(erased.success);
    EXPECT_TRUE(erased.createdIds.isEmpty());
    EXPECT_EQ(erased.scene.version(), added.scene.version());
    EXPECT_EQ(erased.scene.items().size(), 1);
}

TEST(Eraser, HiddenLayersAreLeftAlone)
{
    Drawing line;
    line.points = {QPointF(0, 0), QPointF(10, 0)};
    SceneEdit added = Scene().addItem(line);

    Layer hidden = added.scene.layers().first();
    hidden.isVisible = false;
    SceneEdit updated = added.scene.updateLayer(hidden);
    ASSERT_TRUE(updated.success);

    SceneEdit erased = eraseAt(updated.scene, QPointF(5, 0), 2.0);
    ASSERT_TRUE(erased.success);
    EXPECT_TRUE(erased.createdIds.isEmpty());
}
