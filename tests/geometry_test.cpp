// =====================================================================
//  tests/geometry_test.cpp — Geometry primitives and helpers
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/geometry/types.h>
#include <lasercam/geometry/utils.h>

#include <gtest/gtest.h>

using namespace lasercam::geometry;

TEST(BoundingBox, ContainsEveryIncludedPoint)
{
    const QVector<QPointF> points = {
        QPointF(3, -1), QPointF(-2.5, 4), QPointF(7, 7), QPointF(0, 0)};
    BoundingBox box = boundingBox(points);

    ASSERT_TRUE(box.valid);
    EXPECT_DOUBLE_EQ(box.minX, -2.5);
    EXPECT_DOUBLE_EQ(box.maxX, 7.0);
    EXPECT_DOUBLE_EQ(box.minY, -1.0);
    EXPECT_DOUBLE_EQ(box.maxY, 7.0);
    for (const QPointF& p : points) {
        EXPECT_TRUE(box.contains(p));
    }
    EXPECT_FALSE(box.contains(QPointF(8, 0)));
}

TEST(BoundingBox, EmptyInputIsInvalid)
{
    BoundingBox box = boundingBox({});
    EXPECT_FALSE(box.valid);
    EXPECT_FALSE(box.hasArea());
}

TEST(PointSegmentDistance, PerpendicularAndEndpoint)
{
    EXPECT_NEAR(pointSegmentDistance(QPointF(5, 3), QPointF(0, 0), QPointF(10, 0)), 3.0, 1e-12);
    // Beyond the end the distance is to the endpoint
    EXPECT_NEAR(pointSegmentDistance(QPointF(13, 4), QPointF(0, 0), QPointF(10, 0)), 5.0, 1e-12);
}

TEST(PointSegmentDistance, DegenerateSegmentIsPointDistance)
{
    EXPECT_NEAR(pointSegmentDistance(QPointF(3, 4), QPointF(0, 0), QPointF(0, 0)), 5.0, 1e-12);
    EXPECT_DOUBLE_EQ(projectPointOnSegment(QPointF(3, 4), QPointF(1, 1), QPointF(1, 1)), 0.0);
}

TEST(CircleSegmentIntersection, FindsBoundaryCrossing)
{
    auto hit = circleSegmentIntersection(QPointF(0, 0), 5.0, QPointF(0, 0), QPointF(20, 0), 1e-6);
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->x(), 5.0, 1e-3);
    EXPECT_NEAR(hit->y(), 0.0, 1e-9);
    // The returned point never lies inside the circle
    EXPECT_GE(distance(*hit, QPointF(0, 0)), 5.0 - 1e-9);
}

TEST(CircleSegmentIntersection, BothEndsOutsideIsNone)
{
    auto hit = circleSegmentIntersection(QPointF(0, 0), 1.0, QPointF(5, 5), QPointF(9, 5));
    EXPECT_FALSE(hit.has_value());
}

TEST(CircleSegmentIntersection, EndpointOnCircleIsReturned)
{
    auto hit = circleSegmentIntersection(QPointF(0, 0), 2.0, QPointF(2, 0), QPointF(10, 0));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, QPointF(2, 0));
}

TEST(Transform2D, ProductAppliesRightOperandFirst)
{
    Transform2D t = Transform2D::translation(10, 0) * Transform2D::rotation(90);
    QPointF p = t.apply(QPointF(1, 0));
    EXPECT_NEAR(p.x(), 10.0, 1e-12);
    EXPECT_NEAR(p.y(), 1.0, 1e-12);

    QPointF q = compose(Transform2D::rotation(90), Transform2D::translation(10, 0)).apply(QPointF(1, 0));
    EXPECT_NEAR(q.x(), 0.0, 1e-12);
    EXPECT_NEAR(q.y(), 11.0, 1e-12);
}

TEST(Transform2D, PlacementRotatesAboutAnchor)
{
    Transform2D t = placement(QPointF(5, 5), 180);
    QPointF p = t.apply(QPointF(1, 0));
    EXPECT_NEAR(p.x(), 4.0, 1e-12);
    EXPECT_NEAR(p.y(), 5.0, 1e-12);
    EXPECT_TRUE(Transform2D::identity().isIdentity());
    EXPECT_FALSE(Transform2D::scale(0, 1).isInvertible());
}

TEST(FormatNumber, TrimsTrailingZeros)
{
    EXPECT_EQ(formatNumber(1.5, 3), QStringLiteral("1.5"));
    EXPECT_EQ(formatNumber(2.0, 3), QStringLiteral("2"));
    EXPECT_EQ(formatNumber(0.12345, 2), QStringLiteral("0.12"));
    EXPECT_EQ(formatNumber(-0.0001, 3), QStringLiteral("0"));
    EXPECT_EQ(formatNumber(-3.25, 3), QStringLiteral("-3.25"));
}
