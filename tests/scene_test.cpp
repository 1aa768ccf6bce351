// =====================================================================
//  tests/scene_test.cpp — Scene editing and layer routing
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/scene/scene.h>
#include <lasercam/importer/hpgl.h>

#include <gtest/gtest.h>

using namespace lasercam::scene;

namespace {

Drawing segment()
{
    Drawing drawing;
    drawing.points = {QPointF(-5, 0), QPointF(5, 0)};
    drawing.x = 10;
    drawing.y = 10;
    return drawing;
}

ImageObject blankImage()
{
    ImageObject image;
    image.pixels = QImage(4, 4, QImage::Format_RGB32);
    image.pixels.fill(Qt::white);
    image.width = 4;
    image.height = 4;
    return image;
}

}  // anonymous namespace

TEST(Scene, ItemsAreRoutedByPrintingMethod)
{
    Scene scene;
    SceneEdit drawn = scene.addItem(segment());
    ASSERT_TRUE(drawn.success);
    SceneEdit imaged = drawn.scene.addItem(blankImage());
    ASSERT_TRUE(imaged.success);

    const Scene& result = imaged.scene;
    ASSERT_EQ(result.layers().size(), 2);
    ASSERT_EQ(result.items().size(), 2);

    const CanvasItem* drawing = result.item(drawn.createdIds.first());
    const CanvasItem* image = result.item(imaged.createdIds.first());
    ASSERT_NE(drawing, nullptr);
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(result.layer(drawing->layerId)->printingMethod, PrintingMethod::Engrave);
    EXPECT_EQ(result.layer(image->layerId)->printingMethod, PrintingMethod::Scan);
    EXPECT_EQ(result.layer(image->layerId)->name, QStringLiteral("Scan layer"));
}

TEST(Scene, EditsAreValuesWithIncreasingVersion)
{
    Scene empty;
    SceneEdit first = empty.addItem(segment());
    SceneEdit second = first.scene.addItem(segment());

    EXPECT_EQ(empty.version(), 0);
    EXPECT_TRUE(empty.items().isEmpty());
    EXPECT_EQ(first.scene.version(), 1);
    EXPECT_EQ(second.scene.version(), 2);
    EXPECT_NE(first.createdIds.first(), second.createdIds.first());
    // Both drawings share the one engrave layer
    EXPECT_EQ(second.scene.layers().size(), 1);
}

TEST(Scene, ImageCannotMoveToEngraveLayer)
{
    SceneEdit drawn = Scene().addItem(segment());
    SceneEdit imaged = drawn.scene.addItem(blankImage());
    const QString engraveLayer = drawn.scene.items().first().layerId;

    SceneEdit moved = imaged.scene.moveItemToLayer(imaged.createdIds.first(), engraveLayer);
    EXPECT_FALSE(moved.success);
    EXPECT_FALSE(moved.errorMessage.isEmpty());
    EXPECT_EQ(moved.scene.version(), imaged.scene.version());
}

TEST(Scene, ExplicitLayerMustMatchMethod)
{
    SceneEdit withLayer = Scene().addLayer(QStringLiteral("Photos"), PrintingMethod::Scan);
    ASSERT_TRUE(withLayer.success);
    const QString scanLayer = withLayer.createdIds.first();

    EXPECT_FALSE(withLayer.scene.addItem(segment(), scanLayer).success);
    EXPECT_TRUE(withLayer.scene.addItem(blankImage(), scanLayer).success);
    EXPECT_FALSE(withLayer.scene.addItem(segment(), QStringLiteral("layer_99")).success);
}

TEST(Scene, EngraveLayerCannotBeRemoved)
{
    SceneEdit drawn = Scene().addItem(segment());
    const QString engraveLayer = drawn.scene.items().first().layerId;

    SceneEdit removed = drawn.scene.removeLayer(engraveLayer);
    EXPECT_FALSE(removed.success);
    EXPECT_EQ(removed.scene.items().size(), 1);
}

TEST(Scene, RemovingScanLayerRemovesItsItems)
{
    SceneEdit drawn = Scene().addItem(segment());
    SceneEdit imaged = drawn.scene.addItem(blankImage());
    const QString scanLayer = imaged.scene.item(imaged.createdIds.first())->layerId;

    SceneEdit removed = imaged.scene.removeLayer(scanLayer);
    ASSERT_TRUE(removed.success);
    EXPECT_EQ(removed.scene.layers().size(), 1);
    ASSERT_EQ(removed.scene.items().size(), 1);
    EXPECT_EQ(removed.scene.items().first().kind(), ItemKind::Drawing);
}

TEST(Scene, UpdateKeepsPrintingMethod)
{
    SceneEdit drawn = Scene().addItem(segment());
    const QString id = drawn.createdIds.first();

    Drawing moved = segment();
    moved.x = 50;
    SceneEdit updated = drawn.scene.updateItem(id, moved);
    ASSERT_TRUE(updated.success);
    EXPECT_DOUBLE_EQ(updated.scene.item(id)->position().x(), 50.0);

    EXPECT_FALSE(drawn.scene.updateItem(id, blankImage()).success);
}

TEST(Scene, LayersReorder)
{
    SceneEdit a = Scene().addLayer(QStringLiteral("A"), PrintingMethod::Engrave);
    SceneEdit b = a.scene.addLayer(QStringLiteral("B"), PrintingMethod::Scan);

    SceneEdit up = b.scene.moveLayer(b.createdIds.first(), LayerMove::Up);
    ASSERT_TRUE(up.success);
    EXPECT_EQ(up.scene.layers().first().name, QStringLiteral("B"));
    EXPECT_FALSE(up.scene.moveLayer(b.createdIds.first(), LayerMove::Up).success);
}

TEST(Scene, ImportedGroupBecomesGroupItem)
{
    lasercam::importer::ImportResult imported = lasercam::importer::importHPGLString(
        QStringLiteral("PU0,0;PD5,0;PU20,20;PD25,20;PU;"));
    ASSERT_TRUE(imported.success);

    SceneEdit added = Scene().addShapes(imported.shapes);
    ASSERT_TRUE(added.success);
    ASSERT_EQ(added.scene.items().size(), 1);

    const CanvasItem& item = added.scene.items().first();
    ASSERT_EQ(item.kind(), ItemKind::Group);
    const GroupObject& group = std::get<GroupObject>(item.shape);
    ASSERT_EQ(group.children.size(), 2u);
    EXPECT_FALSE(group.children[0].id.isEmpty());
    EXPECT_NE(group.children[0].id, group.children[1].id);
}

TEST(Scene, AddingNothingIsRefused)
{
    EXPECT_FALSE(Scene().addShapes({}).success);
}
