// =====================================================================
//  tests/parts_test.cpp — Parametric part outlines
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/scene/parts.h>

#include <gtest/gtest.h>

using namespace lasercam::scene;

TEST(Parts, RectangleIsClosedAndCentered)
{
    Part part;
    part.type = PartType::Rectangle;
    part.parameters[QStringLiteral("width")] = 30;
    part.parameters[QStringLiteral("height")] = 10;

    QVector<PartOutline> outlines = partOutlines(part);
    ASSERT_EQ(outlines.size(), 1);
    EXPECT_TRUE(outlines.first().closed);
    ASSERT_EQ(outlines.first().points.size(), 5);
    EXPECT_EQ(outlines.first().points.first(), outlines.first().points.last());

    lasercam::geometry::BoundingBox box = partBounds(part);
    EXPECT_DOUBLE_EQ(box.minX, -15.0);
    EXPECT_DOUBLE_EQ(box.maxX, 15.0);
    EXPECT_DOUBLE_EQ(box.minY, -5.0);
    EXPECT_DOUBLE_EQ(box.maxY, 5.0);
}

TEST(Parts, MissingParametersUseCatalogDefaults)
{
    Part part;
    part.type = PartType::Circle;
    EXPECT_DOUBLE_EQ(part.parameter(QStringLiteral("radius")), 20.0);

    QVector<PartOutline> outlines = partOutlines(part);
    ASSERT_EQ(outlines.size(), 1);
    EXPECT_EQ(outlines.first().points.size(), 65);
    EXPECT_NEAR(partBounds(part).width(), 40.0, 1e-9);
}

TEST(Parts, FlangeHasBoltHoles)
{
    Part part;
    part.type = PartType::Flange;
    part.parameters[QStringLiteral("boltHoleCount")] = 6;

    // Inner bore, bolt holes, outer rim
    EXPECT_EQ(partOutlines(part).size(), 8);
}

TEST(Parts, LineIsOpen)
{
    Part part;
    part.type = PartType::Line;

    QVector<PartOutline> outlines = partOutlines(part);
    ASSERT_EQ(outlines.size(), 1);
    EXPECT_FALSE(outlines.first().closed);
    EXPECT_EQ(outlines.first().points.size(), 2);
}

TEST(Parts, ZeroSizeProducesNothing)
{
    Part part;
    part.type = PartType::Rectangle;
    part.parameters[QStringLiteral("width")] = 0;
    EXPECT_TRUE(partOutlines(part).isEmpty());
    EXPECT_FALSE(partBounds(part).valid);
}

TEST(Parts, EveryCatalogEntryHasAnOutline)
{
    for (PartType type : allPartTypes()) {
        Part part;
        part.type = type;
        EXPECT_FALSE(partOutlines(part).isEmpty()) << partTypeName(type).toStdString();
    }
}

TEST(Parts, CatalogNamesRoundTrip)
{
    EXPECT_EQ(partTypeName(PartType::LBracket), QStringLiteral("L_BRACKET"));
    EXPECT_EQ(partTypeFromName(QStringLiteral("circle_with_holes")), PartType::CircleWithHoles);
    EXPECT_FALSE(partTypeFromName(QStringLiteral("hexagon")).has_value());
}
