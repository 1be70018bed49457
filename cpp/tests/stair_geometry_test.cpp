#include "tests/floorplan_test_common.h"
#include "floorplan/stairs/stair_geometry.h"

using namespace floorplan;
using namespace floorplan_test;

namespace {

// 12 risers of 0.25 over a 3 m rise, 0.25 treads, 1 m wide.
Stair metricStair(StairShape shape) {
    Stair stair = makeStair("S1", 0, 0, std::move(shape));
    stair.width = len(1);
    stair.rise = len(3);
    stair.riser = len(0.25);
    stair.tread = len(0.25);
    return stair;
}

} // namespace

TEST(StairGeometryTest, StepCountRoundsUp) {
    EXPECT_EQ(computeStepCount(3.0, 0.25), 12);
    EXPECT_EQ(computeStepCount(3.1, 0.25), 13);
    EXPECT_EQ(computeStepCount(3.0, 0.0), 0);
    EXPECT_EQ(computeStepCount(0.0, 0.25), 0);
}

TEST(StairGeometryTest, SplitRunsKeepsDeclared) {
    EXPECT_EQ(splitRuns({}, 13, 2), (std::vector<int>{6, 7}));
    EXPECT_EQ(splitRuns({4, 9}, 13, 2), (std::vector<int>{4, 9}));
    EXPECT_EQ(splitRuns({5}, 12, 3), (std::vector<int>{4, 4, 4}));
}

TEST(StairGeometryTest, ImperialDefaults) {
    const StairDimensions dims = calculateStairDimensions(makeStair("S", 0, 0, StraightStair{}), LengthUnit::Ft);
    EXPECT_EQ(dims.stairWidth, 3.0);
    EXPECT_EQ(dims.rise, 10.0);
    EXPECT_EQ(dims.stepCount, 18);
    EXPECT_NEAR(dims.tread, 11.0 / 12.0, 1e-9);
    EXPECT_NEAR(dims.height, 16.5, 1e-9);
}

TEST(StairGeometryTest, StraightFootprintFollowsClimb) {
    const ResolvedSize up = getStairBoundingBox(metricStair(StraightStair{WallDirection::Top}), LengthUnit::M);
    EXPECT_EQ(up.width, 1.0);
    EXPECT_EQ(up.height, 3.0);

    const ResolvedSize across = getStairBoundingBox(metricStair(StraightStair{WallDirection::Right}), LengthUnit::M);
    EXPECT_EQ(across.width, 3.0);
    EXPECT_EQ(across.height, 1.0);
}

TEST(StairGeometryTest, LShapedUsesLanding) {
    LShapedStair shape;
    shape.entry = WallDirection::Bottom;
    const StairDimensions dims = calculateStairDimensions(metricStair(shape), LengthUnit::M);
    EXPECT_EQ(dims.runs, (std::vector<int>{6, 6}));
    EXPECT_EQ(dims.landingWidth, 1.0);
    EXPECT_EQ(dims.width, 2.5);
    EXPECT_EQ(dims.height, 2.5);

    shape.landing = Landing{len(2), len(1.5)};
    const StairDimensions wide = calculateStairDimensions(metricStair(shape), LengthUnit::M);
    EXPECT_EQ(wide.width, 3.5);
    EXPECT_EQ(wide.height, 3.0);
}

TEST(StairGeometryTest, UShapedIsTwoFlightsWide) {
    UShapedStair shape;
    shape.entry = WallDirection::Bottom;
    const ResolvedSize box = getStairBoundingBox(metricStair(shape), LengthUnit::M);
    EXPECT_EQ(box.width, 2.0);
    EXPECT_EQ(box.height, 2.5);
}

TEST(StairGeometryTest, SpiralIsDiameterSquare) {
    SpiralStair shape;
    shape.outerRadius = len(150, LengthUnit::Cm);
    const ResolvedSize box = getStairBoundingBox(metricStair(shape), LengthUnit::M);
    EXPECT_NEAR(box.width, 3.0, 1e-9);
    EXPECT_NEAR(box.height, 3.0, 1e-9);
}

TEST(StairGeometryTest, TurnsRotateClockwise) {
    EXPECT_EQ(applyTurn(WallDirection::Top, TurnDirection::Right), WallDirection::Right);
    EXPECT_EQ(applyTurn(WallDirection::Top, TurnDirection::Left), WallDirection::Left);
    EXPECT_EQ(applyTurn(WallDirection::Left, TurnDirection::Right), WallDirection::Top);
    EXPECT_EQ(applyTurn(WallDirection::Bottom, TurnDirection::Right), WallDirection::Left);
}

TEST(StairGeometryTest, SegmentedLayoutIsNormalized) {
    SegmentedStair shape;
    shape.entry = WallDirection::Bottom;
    shape.segments.push_back(FlightSegment{4, std::nullopt, std::nullopt});
    shape.segments.push_back(TurnSegment{TurnDirection::Right, std::nullopt, std::nullopt, std::nullopt});
    shape.segments.push_back(FlightSegment{4, std::nullopt, std::nullopt});

    const auto parts = layoutSegmentedStair(shape, 1.0, 0.25, LengthUnit::M);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0].kind, StairPart::Kind::Flight);
    EXPECT_EQ(parts[0].rect.x, 1.0);
    EXPECT_EQ(parts[0].rect.y, 0.0);
    EXPECT_EQ(parts[1].kind, StairPart::Kind::Landing);
    EXPECT_EQ(parts[1].rect.y, 1.0);
    EXPECT_EQ(parts[2].direction, WallDirection::Left);
    EXPECT_EQ(parts[2].rect.x, 0.0);
    EXPECT_EQ(parts[2].steps, 4);

    const ResolvedSize box = getStairBoundingBox(metricStair(shape), LengthUnit::M);
    EXPECT_EQ(box.width, 2.0);
    EXPECT_EQ(box.height, 2.0);
}

TEST(StairGeometryTest, ShapeNames) {
    EXPECT_STREQ(stairShapeName(StraightStair{}), "straight");
    EXPECT_STREQ(stairShapeName(LShapedStair{}), "L-shaped");
    EXPECT_STREQ(stairShapeName(SpiralStair{}), "spiral");
    EXPECT_STREQ(stairShapeName(SegmentedStair{}), "custom");
}
