// =====================================================================
//  tests/svg_test.cpp — SVG import
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/importer/svg.h>

#include <gtest/gtest.h>

using namespace lasercam::importer;

namespace {

QString svgDocument(const QString& body)
{
    return QStringLiteral("<svg xmlns=\"http://www.w3.org/2000/svg\">%1</svg>").arg(body);
}

}  // anonymous namespace

TEST(SvgImport, SingleFilledPathIsNotGrouped)
{
    ImportResult result = importSVGString(
        svgDocument(QStringLiteral("<path d=\"M0 0 L10 0 L10 10 Z\" fill=\"#ff0000\"/>")));

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    EXPECT_EQ(result.status, ImportStatus::Ok);
    ASSERT_EQ(result.shapes.size(), 1);

    const Polyline* poly = std::get_if<Polyline>(&result.shapes.first());
    ASSERT_NE(poly, nullptr);
    EXPECT_TRUE(poly->closed);
    ASSERT_TRUE(poly->fillColor.has_value());
    EXPECT_EQ(*poly->fillColor, QStringLiteral("#ff0000"));
    // Paths carry no default stroke width
    EXPECT_DOUBLE_EQ(poly->strokeWidth, 0.0);

    lasercam::geometry::BoundingBox box = poly->bounds();
    EXPECT_NEAR(box.minX, 0.0, 1e-9);
    EXPECT_NEAR(box.maxX, 10.0, 1e-9);
    EXPECT_NEAR(box.maxY, 10.0, 1e-9);
}

TEST(SvgImport, SeveralShapesBecomeOneGroup)
{
    ImportResult result = importSVGString(svgDocument(QStringLiteral(
        "<rect x=\"0\" y=\"0\" width=\"10\" height=\"5\" stroke=\"#000000\"/>"
        "<circle cx=\"30\" cy=\"30\" r=\"5\"/>")));

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    ASSERT_EQ(result.shapes.size(), 1);

    const Group* group = std::get_if<Group>(&result.shapes.first());
    ASSERT_NE(group, nullptr);
    ASSERT_EQ(group->children.size(), 2u);

    const Polyline* rect = std::get_if<Polyline>(&group->children[0]);
    const Polyline* circle = std::get_if<Polyline>(&group->children[1]);
    ASSERT_NE(rect, nullptr);
    ASSERT_NE(circle, nullptr);
    EXPECT_EQ(rect->points.size(), 5);
    EXPECT_EQ(circle->points.size(), 65);
    EXPECT_DOUBLE_EQ(rect->strokeWidth, 2.0);
    EXPECT_EQ(rect->strokeColor, QStringLiteral("#000000"));
}

TEST(SvgImport, UnfilledPathIsDropped)
{
    ImportResult result = importSVGString(
        svgDocument(QStringLiteral("<path d=\"M0 0 L10 0\" stroke=\"#000\"/>")));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ImportStatus::EmptyResult);
    EXPECT_TRUE(result.shapes.isEmpty());
}

TEST(SvgImport, OverlongPathIsSkipped)
{
    ImportResult result = importSVGString(
        svgDocument(QStringLiteral("<path d=\"M0 0 L3e9 0Z\" fill=\"#000\"/>")));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ImportStatus::EmptyResult);
}

TEST(SvgImport, InheritedFillCountsAsDeclared)
{
    ImportResult result = importSVGString(svgDocument(QStringLiteral(
        "<g fill=\"#00ff00\"><path d=\"M0 0 L10 0 L0 10 Z\"/></g>")));

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    EXPECT_EQ(result.shapes.size(), 1);
}

TEST(SvgImport, GroupTransformIsApplied)
{
    ImportResult result = importSVGString(svgDocument(QStringLiteral(
        "<g transform=\"translate(100, 50)\"><line x1=\"0\" y1=\"0\" x2=\"10\" y2=\"0\"/></g>")));

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    const Polyline* line = std::get_if<Polyline>(&result.shapes.first());
    ASSERT_NE(line, nullptr);

    QVector<QPointF> points = line->absolutePoints();
    ASSERT_EQ(points.size(), 2);
    EXPECT_NEAR(points[0].x(), 100.0, 1e-9);
    EXPECT_NEAR(points[0].y(), 50.0, 1e-9);
    EXPECT_NEAR(points[1].x(), 110.0, 1e-9);
}

TEST(SvgImport, ViewBoxScalesToDeclaredSize)
{
    ImportResult result = importSVGString(QStringLiteral(
        "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"200\" height=\"200\" viewBox=\"0 0 100 100\">"
        "<line x1=\"0\" y1=\"0\" x2=\"50\" y2=\"0\"/></svg>"));

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    EXPECT_NEAR(result.bounds.width(), 100.0, 1e-9);
}

TEST(SvgImport, MalformedXmlIsParseError)
{
    ImportResult result = importSVGString(QStringLiteral("<svg><rect width=\"10\"</svg>"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ImportStatus::ParseError);
    EXPECT_FALSE(result.errorMessage.isEmpty());
}

TEST(SvgImport, NonSvgRootIsParseError)
{
    ImportResult result = importSVGString(QStringLiteral("<html><body/></html>"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ImportStatus::ParseError);
}

TEST(SvgImport, UnsupportedElementsAreReported)
{
    ImportResult result = importSVGString(svgDocument(QStringLiteral(
        "<text x=\"0\" y=\"0\">hello</text><text>again</text>"
        "<rect width=\"4\" height=\"4\"/>")));

    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    ASSERT_EQ(result.warnings.size(), 1);
    EXPECT_EQ(result.warnings.first().kind, QStringLiteral("text"));
    EXPECT_EQ(result.warnings.first().count, 2);
}

TEST(ShapeNormalize, GroupBoxIncludesHalfStroke)
{
    Polyline thin = Polyline::fromAbsolute({QPointF(0, 0), QPointF(10, 0)}, false);
    thin.strokeWidth = 2.0;
    Polyline thick = Polyline::fromAbsolute({QPointF(0, 10), QPointF(10, 10)}, false);
    thick.strokeWidth = 6.0;

    ImportResult result = normalizeShapes({thin, thick}, QStringLiteral("empty"));
    ASSERT_TRUE(result.success);
    const Group& group = std::get<Group>(result.shapes.first());

    // Union of [-1, 11] x [-1, 1] and [-3, 13] x [7, 13]
    EXPECT_DOUBLE_EQ(group.originX, 5.0);
    EXPECT_DOUBLE_EQ(group.originY, 6.0);
    EXPECT_DOUBLE_EQ(group.width, 16.0);
    EXPECT_DOUBLE_EQ(group.height, 14.0);

    const Polyline& first = std::get<Polyline>(group.children.first());
    EXPECT_EQ(first.origin, QPointF(0, -6));
}

TEST(SvgPathData, RelativeCommandsAndSubpaths)
{
    bool ok = false;
    QVector<SVGSubpath> subpaths = parseSVGPathData(QStringLiteral("M1 1 l4 0 v3 z m10 0 h2"), &ok);

    ASSERT_TRUE(ok);
    ASSERT_EQ(subpaths.size(), 2);
    EXPECT_TRUE(subpaths[0].closed);
    EXPECT_FALSE(subpaths[1].closed);
    EXPECT_EQ(subpaths[0].segments.first().start(), QPointF(1, 1));
    EXPECT_EQ(subpaths[1].segments.first().start(), QPointF(11, 1));
    EXPECT_EQ(subpaths[1].segments.last().end(), QPointF(13, 1));
}

TEST(SvgPathData, GarbageIsRejected)
{
    bool ok = true;
    parseSVGPathData(QStringLiteral("M0 0 L 10 x"), &ok);
    EXPECT_FALSE(ok);
}

TEST(SvgTransform, ParsesTransformLists)
{
    auto t = parseSVGTransform(QStringLiteral("translate(10) scale(2)"));
    ASSERT_TRUE(t.has_value());
    QPointF p = t->apply(QPointF(1, 1));
    EXPECT_NEAR(p.x(), 12.0, 1e-12);
    EXPECT_NEAR(p.y(), 2.0, 1e-12);

    EXPECT_FALSE(parseSVGTransform(QStringLiteral("wobble(3)")).has_value());
}
