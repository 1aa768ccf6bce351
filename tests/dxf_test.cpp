// =====================================================================
//  tests/dxf_test.cpp — DXF import
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/importer/dxf.h>
#include <lasercam/geometry/utils.h>

#include <QStringList>

#include <gtest/gtest.h>

using namespace lasercam::importer;

namespace {

/// Join group code / value lines into DXF text
QString dxf(const QStringList& lines)
{
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QStringList entitiesSection(const QStringList& entities)
{
    QStringList lines = {QStringLiteral("0"), QStringLiteral("SECTION"),
                         QStringLiteral("2"), QStringLiteral("ENTITIES")};
    lines += entities;
    lines += {QStringLiteral("0"), QStringLiteral("ENDSEC"),
              QStringLiteral("0"), QStringLiteral("EOF")};
    return lines;
}

QStringList lineEntity(double x1, double y1, double x2, double y2)
{
    return {QStringLiteral("0"), QStringLiteral("LINE"),
            QStringLiteral("8"), QStringLiteral("0"),
            QStringLiteral("10"), QString::number(x1),
            QStringLiteral("20"), QString::number(y1),
            QStringLiteral("11"), QString::number(x2),
            QStringLiteral("21"), QString::number(y2)};
}

}  // anonymous namespace

TEST(DxfImport, SingleLine)
{
    ImportResult result = importDXFString(dxf(entitiesSection(lineEntity(0, 0, 5, 5))));

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    ASSERT_EQ(result.shapes.size(), 1);

    const Polyline* poly = std::get_if<Polyline>(&result.shapes.first());
    ASSERT_NE(poly, nullptr);
    ASSERT_EQ(poly->points.size(), 2);
    EXPECT_FALSE(poly->closed);

    QVector<QPointF> points = poly->absolutePoints();
    EXPECT_NEAR(lasercam::geometry::distance(points[0], points[1]), qSqrt(50.0), 1e-9);
}

TEST(DxfImport, FlipMirrorsAboutExtents)
{
    DXFImportOptions options;
    options.flipY = true;
    ImportResult flipped = importDXFString(dxf(entitiesSection(lineEntity(0, 0, 5, 5))), options);
    options.flipY = false;
    ImportResult plain = importDXFString(dxf(entitiesSection(lineEntity(0, 0, 5, 5))), options);

    ASSERT_TRUE(flipped.success);
    ASSERT_TRUE(plain.success);
    QVector<QPointF> f = std::get<Polyline>(flipped.shapes.first()).absolutePoints();
    QVector<QPointF> p = std::get<Polyline>(plain.shapes.first()).absolutePoints();

    // Y grows up in DXF: the start point ends up at the bottom of the box
    EXPECT_NEAR(p[0].y(), 0.0, 1e-9);
    EXPECT_NEAR(f[0].y(), 5.0, 1e-9);
    EXPECT_NEAR(f[1].y(), 0.0, 1e-9);
}

TEST(DxfImport, CircleIsSampled)
{
    ImportResult result = importDXFString(dxf(entitiesSection({
        QStringLiteral("0"), QStringLiteral("CIRCLE"),
        QStringLiteral("10"), QStringLiteral("10"),
        QStringLiteral("20"), QStringLiteral("10"),
        QStringLiteral("40"), QStringLiteral("3"),
        QStringLiteral("62"), QStringLiteral("1")})));

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    const Polyline& poly = std::get<Polyline>(result.shapes.first());
    EXPECT_TRUE(poly.closed);
    EXPECT_EQ(poly.points.size(), 65);
    EXPECT_EQ(poly.strokeColor, QStringLiteral("#ff0000"));
}

TEST(DxfImport, TwoEntitiesAreGrouped)
{
    QStringList entities = lineEntity(0, 0, 10, 0);
    entities += lineEntity(0, 5, 10, 5);
    ImportResult result = importDXFString(dxf(entitiesSection(entities)));

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    ASSERT_EQ(result.shapes.size(), 1);
    const Group* group = std::get_if<Group>(&result.shapes.first());
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->children.size(), 2u);
}

TEST(DxfImport, UnsupportedEntityIsCounted)
{
    QStringList entities = lineEntity(0, 0, 1, 1);
    entities += {QStringLiteral("0"), QStringLiteral("ELLIPSE"),
                 QStringLiteral("10"), QStringLiteral("0"),
                 QStringLiteral("20"), QStringLiteral("0")};
    ImportResult result = importDXFString(dxf(entitiesSection(entities)));

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    ASSERT_EQ(result.warnings.size(), 1);
    EXPECT_EQ(result.warnings.first().kind, QStringLiteral("ELLIPSE"));
    EXPECT_EQ(result.warningMessages().first(), QStringLiteral("ELLIPSE x1"));
}

TEST(DxfImport, MissingEntitiesSectionIsParseError)
{
    ImportResult result = importDXFString(dxf({
        QStringLiteral("0"), QStringLiteral("SECTION"),
        QStringLiteral("2"), QStringLiteral("HEADER"),
        QStringLiteral("0"), QStringLiteral("ENDSEC"),
        QStringLiteral("0"), QStringLiteral("EOF")}));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ImportStatus::ParseError);
}

TEST(DxfImport, OnlyUnsupportedEntitiesIsEmpty)
{
    ImportResult result = importDXFString(dxf(entitiesSection({
        QStringLiteral("0"), QStringLiteral("ELLIPSE"),
        QStringLiteral("10"), QStringLiteral("0"),
        QStringLiteral("20"), QStringLiteral("0")})));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ImportStatus::EmptyResult);
}

TEST(DxfImport, EmptyContentIsParseError)
{
    EXPECT_EQ(importDXFString(QString()).status, ImportStatus::ParseError);
}

TEST(DxfImport, NonNumericCoordinateIsParseError)
{
    ImportResult result = importDXFString(dxf(entitiesSection({
        QStringLiteral("0"), QStringLiteral("LINE"),
        QStringLiteral("10"), QStringLiteral("abc"),
        QStringLiteral("20"), QStringLiteral("0"),
        QStringLiteral("11"), QStringLiteral("5"),
        QStringLiteral("21"), QStringLiteral("5")})));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ImportStatus::ParseError);
    EXPECT_TRUE(result.shapes.isEmpty());
    EXPECT_TRUE(result.errorMessage.contains(QStringLiteral("abc")));
}

TEST(DxfImport, NonNumericColorIsParseError)
{
    QStringList entities = lineEntity(0, 0, 5, 5);
    entities += {QStringLiteral("62"), QStringLiteral("red")};
    ImportResult result = importDXFString(dxf(entitiesSection(entities)));

    EXPECT_EQ(result.status, ImportStatus::ParseError);
}

TEST(DxfImport, SplineFlattensControlPolygon)
{
    DXFImportOptions options;
    options.flipY = false;
    ImportResult result = importDXFString(dxf(entitiesSection({
        QStringLiteral("0"), QStringLiteral("SPLINE"),
        QStringLiteral("70"), QStringLiteral("8"),
        QStringLiteral("10"), QStringLiteral("0"),
        QStringLiteral("20"), QStringLiteral("0"),
        QStringLiteral("10"), QStringLiteral("0"),
        QStringLiteral("20"), QStringLiteral("10"),
        QStringLiteral("10"), QStringLiteral("10"),
        QStringLiteral("20"), QStringLiteral("10"),
        QStringLiteral("10"), QStringLiteral("10"),
        QStringLiteral("20"), QStringLiteral("0")})), options);

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    const Polyline& poly = std::get<Polyline>(result.shapes.first());
    EXPECT_FALSE(poly.closed);
    // max(4 * 8, 64) steps
    ASSERT_EQ(poly.points.size(), 65);

    QVector<QPointF> points = poly.absolutePoints();
    EXPECT_NEAR(lasercam::geometry::distance(points.first(), QPointF(0, 0)), 0.0, 1e-9);
    EXPECT_NEAR(lasercam::geometry::distance(points.last(), QPointF(10, 0)), 0.0, 1e-9);
    // Cubic midpoint of this control polygon
    EXPECT_NEAR(points[32].x(), 5.0, 1e-9);
    EXPECT_NEAR(points[32].y(), 7.5, 1e-9);
}

TEST(DxfImport, SplineFallsBackToFitPoints)
{
    DXFImportOptions options;
    options.flipY = false;
    QStringList entity = {QStringLiteral("0"), QStringLiteral("SPLINE")};
    for (int i = 0; i < 10; ++i) {
        entity += {QStringLiteral("11"), QString::number(i * 2),
                   QStringLiteral("21"), QStringLiteral("3")};
    }
    ImportResult result = importDXFString(dxf(entitiesSection(entity)), options);

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    const Polyline& poly = std::get<Polyline>(result.shapes.first());
    // max(10 * 8, 64) steps
    ASSERT_EQ(poly.points.size(), 81);

    QVector<QPointF> points = poly.absolutePoints();
    EXPECT_NEAR(points.first().x(), 0.0, 1e-9);
    EXPECT_NEAR(points.last().x(), 18.0, 1e-9);
    for (const QPointF& p : points) {
        EXPECT_NEAR(p.y(), 3.0, 1e-9);
    }
}

TEST(DxfColors, AciIndexMapsToHex)
{
    EXPECT_EQ(aciColor(1), QStringLiteral("#ff0000"));
    EXPECT_EQ(aciColor(5), QStringLiteral("#0000ff"));
    EXPECT_EQ(aciColor(0), QStringLiteral("#ffffff"));
    EXPECT_EQ(aciColor(200), QStringLiteral("#ffffff"));
}
