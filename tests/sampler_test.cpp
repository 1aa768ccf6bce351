// =====================================================================
//  tests/sampler_test.cpp — Curve sampling
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/geometry/sampler.h>
#include <lasercam/geometry/utils.h>

#include <gtest/gtest.h>

using namespace lasercam::geometry;

TEST(Sampler, CircleHasClosingPoint)
{
    QVector<QPointF> points = sampleCircle(QPointF(10, 10), 5.0);
    ASSERT_EQ(points.size(), CIRCLE_SEGMENTS + 1);
    EXPECT_NEAR(distance(points.first(), points.last()), 0.0, 1e-9);
    for (const QPointF& p : points) {
        EXPECT_NEAR(distance(p, QPointF(10, 10)), 5.0, 1e-9);
    }
}

TEST(Sampler, ZeroRadiusCircleIsEmpty)
{
    EXPECT_TRUE(sampleCircle(QPointF(0, 0), 0.0).isEmpty());
}

TEST(Sampler, ArcSegmentCountScalesWithSweep)
{
    EXPECT_EQ(arcSegmentCount(360.0), 64);
    EXPECT_EQ(arcSegmentCount(90.0), 16);
    EXPECT_EQ(arcSegmentCount(-180.0), 32);
    // Short arcs keep a minimum of four segments
    EXPECT_EQ(arcSegmentCount(1.0), 4);
}

TEST(Sampler, QuarterArcEndpoints)
{
    Arc arc;
    arc.center = QPointF(0, 0);
    arc.radius = 10.0;
    arc.startAngle = 0.0;
    arc.sweepAngle = 90.0;

    QVector<QPointF> points = sampleArc(arc);
    ASSERT_EQ(points.size(), 17);
    EXPECT_NEAR(points.first().x(), 10.0, 1e-9);
    EXPECT_NEAR(points.first().y(), 0.0, 1e-9);
    EXPECT_NEAR(points.last().x(), 0.0, 1e-9);
    EXPECT_NEAR(points.last().y(), 10.0, 1e-9);
}

TEST(Sampler, SvgArcCenterOfSemicircle)
{
    auto arc = svgArcToCenter(QPointF(0, 0), 5.0, 5.0, 0.0, false, true, QPointF(10, 0));
    ASSERT_TRUE(arc.has_value());
    EXPECT_NEAR(arc->center.x(), 5.0, 1e-9);
    EXPECT_NEAR(arc->center.y(), 0.0, 1e-9);
    EXPECT_NEAR(qAbs(arc->sweepAngle), 180.0, 1e-9);
}

TEST(Sampler, StraightContourKeepsCorners)
{
    PathContour contour;
    contour.append(PathSegment::line(QPointF(0, 0), QPointF(10, 0)));
    contour.append(PathSegment::line(QPointF(10, 0), QPointF(10, 10)));

    EXPECT_NEAR(contourLength(contour), 20.0, 1e-9);

    QVector<QPointF> points = sampleContour(contour);
    ASSERT_GE(points.size(), 3);
    EXPECT_NEAR(distance(points.first(), QPointF(0, 0)), 0.0, 1e-9);
    EXPECT_NEAR(distance(points.last(), QPointF(10, 10)), 0.0, 1e-9);

    // The corner is sampled exactly
    double nearest = 1e9;
    for (const QPointF& p : points) {
        nearest = qMin(nearest, distance(p, QPointF(10, 0)));
    }
    EXPECT_LT(nearest, 1e-6);
}

TEST(Sampler, OverlongContourIsSkipped)
{
    PathContour contour;
    contour.append(PathSegment::line(QPointF(0, 0), QPointF(3e9, 0)));
    contour.append(PathSegment::line(QPointF(3e9, 0), QPointF(0, 0)));

    EXPECT_TRUE(sampleContour(contour).isEmpty());
}

TEST(Sampler, ControlPolygonStepCount)
{
    // Two control points still take the minimum step count
    QVector<QPointF> line = sampleControlPolygon({QPointF(0, 0), QPointF(64, 0)});
    ASSERT_EQ(line.size(), MIN_SPLINE_STEPS + 1);
    EXPECT_NEAR(line[1].x(), 1.0, 1e-9);
    EXPECT_NEAR(line.last().x(), 64.0, 1e-9);

    QVector<QPointF> many(12, QPointF(1, 1));
    EXPECT_EQ(sampleControlPolygon(many).size(), 12 * 8 + 1);

    EXPECT_EQ(sampleControlPolygon({QPointF(3, 4)}).size(), 1);
}
