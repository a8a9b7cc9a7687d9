#include <cmath>
#include <vector>

#include "gtest/gtest.h"
#include "bubble/geometry.hpp"
#include "validation_harness.hpp"

namespace {

using bubble::Vec2;
using bubble_validation::ExpectNearWithTolerance;
using bubble_validation::ExpectVecNearWithTolerance;

constexpr bubble_validation::ScalarTolerance kExact{1.0e-12, 0.0, "closed-form evaluation"};
constexpr double kPi = bubble::constants::kPi;

}  // namespace

TEST(GeometryTest, StraightPointAndTangentFollowDirection) {
    const bubble::TrackShape shape = bubble::MakeStraight(Vec2(0.1, 0.2), 0.5, 0.4);

    ExpectVecNearWithTolerance("start", bubble::PointAt(shape, 0.0), Vec2(0.1, 0.2), kExact);
    ExpectVecNearWithTolerance(
        "end", bubble::EndPoint(shape), Vec2(0.1 + (0.4 * std::cos(0.5)), 0.2 + (0.4 * std::sin(0.5))), kExact);
    ExpectVecNearWithTolerance(
        "mid", bubble::MidPoint(shape), Vec2(0.1 + (0.2 * std::cos(0.5)), 0.2 + (0.2 * std::sin(0.5))), kExact);
    ExpectNearWithTolerance("tangent", bubble::TangentAt(shape, 0.7), 0.5, kExact);
}

TEST(GeometryTest, ArcStartsAtOriginHeadingInRequestedDirection) {
    for (const int charge : {-1, 1}) {
        const bubble::TrackShape shape = bubble::MakeArc(Vec2(0.4, 0.6), 0.3, 0.2, 0.25, charge);
        EXPECT_EQ(shape.handedness, charge);
        ExpectVecNearWithTolerance("start", bubble::PointAt(shape, 0.0), Vec2(0.4, 0.6), kExact);
        ExpectNearWithTolerance("tangent0", bubble::TangentAt(shape, 0.0), 0.3, kExact);
        ExpectNearWithTolerance(
            "radius", Vec2::Distance(bubble::ShapeCenter(shape), bubble::EndPoint(shape)), 0.2, kExact);
    }
}

TEST(GeometryTest, QuarterTurnArcEndsWhereHandednessPredicts) {
    const bubble::TrackShape positive = bubble::MakeArc(Vec2(0.5, 0.5), 0.0, 0.1, 0.25, 1);
    ExpectVecNearWithTolerance("center+", bubble::ShapeCenter(positive), Vec2(0.5, 0.6), kExact);
    ExpectVecNearWithTolerance("end+", bubble::EndPoint(positive), Vec2(0.6, 0.6), kExact);
    ExpectNearWithTolerance("tangent1+", bubble::TangentAt(positive, 1.0), kPi * 0.5, kExact);

    const bubble::TrackShape negative = bubble::MakeArc(Vec2(0.5, 0.5), 0.0, 0.1, 0.25, -1);
    ExpectVecNearWithTolerance("center-", bubble::ShapeCenter(negative), Vec2(0.5, 0.4), kExact);
    ExpectVecNearWithTolerance("end-", bubble::EndPoint(negative), Vec2(0.6, 0.4), kExact);
    ExpectNearWithTolerance("tangent1-", bubble::TangentAt(negative, 1.0), -kPi * 0.5, kExact);
}

TEST(GeometryTest, NeutralChargeUsesPositiveHandedness) {
    EXPECT_EQ(bubble::Handedness(0), 1);
    EXPECT_EQ(bubble::Handedness(1), 1);
    EXPECT_EQ(bubble::Handedness(-1), -1);
}

TEST(GeometryTest, ShrinkingSpiralStartsAtOriginAndEndsAtCenter) {
    const bubble::TrackShape shape = bubble::MakeShrinkingSpiral(Vec2(0.3, 0.7), 1.1, 0.08, 3.0, -1);
    EXPECT_TRUE(shape.shrink);

    ExpectVecNearWithTolerance("start", bubble::PointAt(shape, 0.0), Vec2(0.3, 0.7), kExact);
    ExpectVecNearWithTolerance("end", bubble::EndPoint(shape), bubble::ShapeCenter(shape), kExact);
    ExpectNearWithTolerance("radius", Vec2::Distance(bubble::ShapeCenter(shape), Vec2(0.3, 0.7)), 0.08, kExact);
    ExpectNearWithTolerance("tangent0", bubble::TangentAt(shape, 0.0), 1.1, kExact);
}

TEST(GeometryTest, GrowingSpiralStartsAtCenterAndReachesFullRadius) {
    const bubble::TrackShape shape = bubble::MakeGrowingSpiral(Vec2(0.5, 0.5), 0.4, 0.01, 3.0, 1);
    EXPECT_FALSE(shape.shrink);

    ExpectVecNearWithTolerance("start", bubble::PointAt(shape, 0.0), Vec2(0.5, 0.5), kExact);
    ExpectNearWithTolerance("endRadius", Vec2::Distance(bubble::EndPoint(shape), Vec2(0.5, 0.5)), 0.01, kExact);
    ExpectNearWithTolerance("midRadius", Vec2::Distance(bubble::MidPoint(shape), Vec2(0.5, 0.5)), 0.005, kExact);
}

TEST(GeometryTest, ArcThroughPointsConnectsEntryAndVertex) {
    const Vec2 entry(0.0, 0.45);
    const Vec2 vertex(0.55, 0.5);
    for (const int charge : {-1, 1}) {
        for (const double sweep : {0.3, 0.5, 0.7, 1.2}) {
            const bubble::TrackShape shape = bubble::ArcThroughPoints(entry, vertex, sweep, charge);
            ExpectVecNearWithTolerance("entry", bubble::PointAt(shape, 0.0), entry, kExact);
            ExpectVecNearWithTolerance("vertex", bubble::EndPoint(shape), vertex, kExact);

            const double chord = Vec2::Distance(entry, vertex);
            ExpectNearWithTolerance("radius", shape.radius, chord / (2.0 * std::sin(sweep * 0.5)), kExact);
            ExpectNearWithTolerance("sweep", std::abs(bubble::ArcSweep(shape)), sweep, kExact);
        }
    }
}

TEST(GeometryTest, ArcThroughPointsDegenerateInputCollapses) {
    const bubble::TrackShape samePoint = bubble::ArcThroughPoints(Vec2(0.2, 0.2), Vec2(0.2, 0.2), 0.5, 1);
    EXPECT_DOUBLE_EQ(samePoint.radius, 0.0);
    ExpectVecNearWithTolerance("collapsed", bubble::EndPoint(samePoint), Vec2(0.2, 0.2), kExact);

    const bubble::TrackShape badSweep = bubble::ArcThroughPoints(Vec2(0.0, 0.5), Vec2(0.5, 0.5), 0.0, 1);
    EXPECT_DOUBLE_EQ(badSweep.length, 0.0);
    EXPECT_TRUE(bubble::EndPoint(badSweep).IsFinite());
}

TEST(GeometryTest, RayBoundaryIntersectionPicksNearestEdge) {
    ExpectVecNearWithTolerance(
        "right", bubble::RayBoundaryIntersection(Vec2(0.5, 0.5), 0.0), Vec2(1.0, 0.5), kExact);
    ExpectVecNearWithTolerance(
        "bottom", bubble::RayBoundaryIntersection(Vec2(0.5, 0.5), kPi * 0.5), Vec2(0.5, 1.0), kExact);
    ExpectVecNearWithTolerance(
        "left", bubble::RayBoundaryIntersection(Vec2(0.25, 0.5), kPi), Vec2(0.0, 0.5), kExact);
    ExpectVecNearWithTolerance(
        "diagonal", bubble::RayBoundaryIntersection(Vec2(0.5, 0.8), kPi * 0.25), Vec2(0.7, 1.0), kExact);
}

TEST(GeometryTest, RayBoundaryIntersectionFallsBackOutsideChamber) {
    const Vec2 hit = bubble::RayBoundaryIntersection(Vec2(2.0, 2.0), 0.0);
    ExpectVecNearWithTolerance("fallback", hit, Vec2(4.0, 2.0), kExact);

    const bubble::ChamberBounds wide{3.0, 1.0};
    const Vec2 wideHit = bubble::RayBoundaryIntersection(Vec2(5.0, 0.5), 0.0, wide);
    ExpectVecNearWithTolerance("wideFallback", wideHit, Vec2(11.0, 0.5), kExact);
}

TEST(GeometryTest, SamplePolylineUsesKindSegmentCounts) {
    EXPECT_EQ(bubble::SamplePolyline(bubble::MakeStraight(Vec2(), 0.0, 1.0)).size(), 2U);
    EXPECT_EQ(
        bubble::SamplePolyline(bubble::MakeArc(Vec2(0.5, 0.5), 0.0, 0.1, 0.3, 1)).size(),
        static_cast<std::size_t>(bubble::constants::kArcSegments + 1));

    const bubble::TrackShape spiral = bubble::MakeShrinkingSpiral(Vec2(0.5, 0.5), 0.0, 0.05, 3.0, 1);
    const std::vector<Vec2> points = bubble::SamplePolyline(spiral);
    ASSERT_EQ(points.size(), static_cast<std::size_t>(bubble::constants::kSpiralSegments + 1));
    ExpectVecNearWithTolerance("first", points.front(), bubble::PointAt(spiral, 0.0), kExact);
    ExpectVecNearWithTolerance("last", points.back(), bubble::EndPoint(spiral), kExact);
}
