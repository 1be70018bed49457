/**
 * Position Resolution Tests
 *
 * Relative placement runs as a bounded fixed-point loop over the pending
 * rooms of one floor. These tests pin the placement arithmetic, the error
 * kinds produced for bad references, and the overlap check.
 */

#include "tests/floorplan_test_common.h"
#include "floorplan/position/position_resolver.h"

using namespace floorplan;
using namespace floorplan_test;

TEST(PositionTest, RightOfPlacesAtReferenceEdge) {
    const Floor floor = makeFloor("F1", {
        makeRoom("A", 0, 0, 10, 10),
        makeRelativeRoom("B", RelativeDirection::RightOf, "A", 8, 6),
    });
    const PositionResolution res = resolveFloorPositions(floor, VariableMap{});
    ASSERT_TRUE(res.errors.empty());
    EXPECT_EQ(res.positions.at("B").x, 10.0);
    EXPECT_EQ(res.positions.at("B").y, 0.0);
    EXPECT_TRUE(res.warnings.empty());
}

TEST(PositionTest, RightOfAlignBottom) {
    const Floor floor = makeFloor("F1", {
        makeRoom("A", 0, 0, 10, 10),
        makeRelativeRoom("B", RelativeDirection::RightOf, "A", 8, 6, Alignment::Bottom),
    });
    const PositionResolution res = resolveFloorPositions(floor, VariableMap{});
    EXPECT_EQ(res.positions.at("B").x, 10.0);
    EXPECT_EQ(res.positions.at("B").y, 4.0);
}

TEST(PositionTest, BelowWithGapAndCenter) {
    const Floor floor = makeFloor("F1", {
        makeRoom("A", 2, 3, 10, 10),
        makeRelativeRoom("B", RelativeDirection::Below, "A", 4, 5, Alignment::Center, 1.5),
    });
    const PositionResolution res = resolveFloorPositions(floor, VariableMap{});
    EXPECT_EQ(res.positions.at("B").x, 5.0);
    EXPECT_EQ(res.positions.at("B").y, 14.5);
}

TEST(PositionTest, DiagonalPlacements) {
    const ResolvedPosition ref{0, 0};
    const ResolvedSize refSize{10, 10};
    const ResolvedSize size{4, 2};
    RelativePosition rel;

    rel.direction = RelativeDirection::AboveLeftOf;
    ResolvedPosition p = computeRelativePosition(rel, ref, refSize, size);
    EXPECT_EQ(p.x, -4.0);
    EXPECT_EQ(p.y, -2.0);

    rel.direction = RelativeDirection::BelowRightOf;
    p = computeRelativePosition(rel, ref, refSize, size);
    EXPECT_EQ(p.x, 10.0);
    EXPECT_EQ(p.y, 10.0);

    rel.direction = RelativeDirection::LeftOf;
    rel.alignment = Alignment::Center;
    p = computeRelativePosition(rel, ref, refSize, size);
    EXPECT_EQ(p.x, -4.0);
    EXPECT_EQ(p.y, 4.0);
}

TEST(PositionTest, ChainsResolveWithinPassBudget) {
    // Declared in reverse so each pass resolves one more room.
    const Floor floor = makeFloor("F1", {
        makeRelativeRoom("D", RelativeDirection::RightOf, "C", 1, 1),
        makeRelativeRoom("C", RelativeDirection::RightOf, "B", 1, 1),
        makeRelativeRoom("B", RelativeDirection::RightOf, "A", 1, 1),
        makeRoom("A", 0, 0, 1, 1),
    });
    const PositionResolution res = resolveFloorPositions(floor, VariableMap{});
    ASSERT_TRUE(res.errors.empty());
    EXPECT_EQ(res.positions.at("D").x, 3.0);
    EXPECT_EQ(res.passBudget, 4);
    EXPECT_LE(res.passes, res.passBudget);
    EXPECT_EQ(res.resolvedOrder.front(), "A");
    EXPECT_EQ(res.resolvedOrder.back(), "D");
}

TEST(PositionTest, CircularDependency) {
    const Floor floor = makeFloor("F1", {
        makeRelativeRoom("A", RelativeDirection::RightOf, "B", 5, 5),
        makeRelativeRoom("B", RelativeDirection::RightOf, "A", 5, 5),
    });
    const PositionResolution res = resolveFloorPositions(floor, VariableMap{});
    ASSERT_EQ(res.errors.size(), 1u);
    EXPECT_EQ(res.errors[0].kind, ResolutionErrorKind::CircularDependency);
    EXPECT_EQ(res.errors[0].message, "Circular dependency detected involving rooms: A, B");
    EXPECT_TRUE(res.positions.empty());
}

TEST(PositionTest, MissingReference) {
    const Floor floor = makeFloor("F1", {
        makeRoom("A", 0, 0, 5, 5),
        makeRelativeRoom("B", RelativeDirection::Below, "Ghost", 5, 5),
    });
    const PositionResolution res = resolveFloorPositions(floor, VariableMap{});
    ASSERT_EQ(res.errors.size(), 1u);
    EXPECT_EQ(res.errors[0].kind, ResolutionErrorKind::MissingReference);
    EXPECT_EQ(res.errors[0].element, "B");
    EXPECT_EQ(res.errors[0].message, "Room 'B' references unknown room 'Ghost'");
    EXPECT_EQ(res.positions.count("B"), 0u);
}

TEST(PositionTest, RoomWithoutPosition) {
    Room floating;
    floating.name = "Loose";
    floating.size = dim(3, 3);
    const Floor floor = makeFloor("F1", {floating});
    const PositionResolution res = resolveFloorPositions(floor, VariableMap{});
    ASSERT_EQ(res.errors.size(), 1u);
    EXPECT_EQ(res.errors[0].kind, ResolutionErrorKind::NoPosition);
    EXPECT_NE(res.errors[0].message.find("Room 'Loose' has no position specified"), std::string::npos);
}

TEST(PositionTest, OverlapIsWarningNotError) {
    const Floor floor = makeFloor("F1", {
        makeRoom("A", 0, 0, 10, 10),
        makeRoom("B", 5, 5, 10, 10),
        makeRoom("C", 10, 0, 5, 8),
    });
    const PositionResolution res = resolveFloorPositions(floor, VariableMap{});
    EXPECT_TRUE(res.errors.empty());
    ASSERT_EQ(res.warnings.size(), 2u);
    EXPECT_EQ(res.warnings[0].room1, "A");
    EXPECT_EQ(res.warnings[0].room2, "B");
    EXPECT_EQ(res.warnings[0].message, "Rooms 'A' and 'B' overlap at their computed positions");
    EXPECT_EQ(res.warnings[1].room1, "B");
    EXPECT_EQ(res.warnings[1].room2, "C");
}

TEST(PositionTest, VariableSizedReference) {
    Room ref;
    ref.name = "A";
    ref.position = Coordinate{len(0), len(0)};
    ref.sizeRef = "big";
    const Floor floor = makeFloor("F1", {ref, makeRelativeRoom("B", RelativeDirection::RightOf, "A", 2, 2)});

    const VariableMap vars{{"big", ResolvedSize{12, 8}}};
    const PositionResolution res = resolveFloorPositions(floor, vars);
    EXPECT_EQ(res.positions.at("B").x, 12.0);
}

TEST(PositionTest, ResolvesEveryFloorInOrder) {
    Floorplan plan;
    plan.floors.push_back(makeFloor("Ground", {makeRoom("A", 0, 0, 5, 5)}));
    plan.floors.push_back(makeFloor("Upper", {makeRelativeRoom("B", RelativeDirection::RightOf, "X", 5, 5)}));

    const FloorPositions all = resolveAllPositions(plan, VariableMap{});
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].first, "Ground");
    EXPECT_TRUE(all[0].second.errors.empty());
    EXPECT_EQ(all[1].first, "Upper");
    EXPECT_EQ(all[1].second.errors.size(), 1u);
}

TEST(PositionTest, ResolvedPositionFallsBackToExplicit) {
    const Room room = makeRoom("A", 3, 4, 1, 1);
    const auto fromExplicit = getResolvedPosition(room, PositionMap{});
    ASSERT_TRUE(fromExplicit.has_value());
    EXPECT_EQ(fromExplicit->x, 3.0);

    PositionMap positions{{"A", ResolvedPosition{7, 8}}};
    EXPECT_EQ(getResolvedPosition(room, positions)->x, 7.0);

    Room bare;
    bare.name = "Z";
    EXPECT_FALSE(getResolvedPosition(bare, PositionMap{}).has_value());
}

TEST(PositionTest, MismatchedAlignmentFallsBackToStartEdge) {
    const Floor floor = makeFloor("F1", {
        makeRoom("A", 0, 0, 10, 10),
        makeRelativeRoom("B", RelativeDirection::Below, "A", 4, 4, Alignment::Bottom),
        makeRelativeRoom("C", RelativeDirection::RightOf, "A", 4, 4, Alignment::Right),
    });
    const PositionResolution res = resolveFloorPositions(floor, VariableMap{});
    ASSERT_TRUE(res.errors.empty());
    EXPECT_EQ(res.positions.at("B").x, 0.0);
    EXPECT_EQ(res.positions.at("B").y, 10.0);
    EXPECT_EQ(res.positions.at("C").x, 10.0);
    EXPECT_EQ(res.positions.at("C").y, 0.0);
}

TEST(PositionTest, DependentsOfCycleJoinCircularError) {
    const Floor floor = makeFloor("F1", {
        makeRelativeRoom("A", RelativeDirection::RightOf, "B", 5, 5),
        makeRelativeRoom("B", RelativeDirection::LeftOf, "A", 5, 5),
        makeRelativeRoom("C", RelativeDirection::Below, "A", 5, 5),
    });
    const PositionResolution res = resolveFloorPositions(floor, VariableMap{});
    ASSERT_EQ(res.errors.size(), 1u);
    EXPECT_EQ(res.errors[0].kind, ResolutionErrorKind::CircularDependency);
    EXPECT_EQ(res.errors[0].element, "A");
    EXPECT_EQ(res.errors[0].message, "Circular dependency detected involving rooms: A, B, C");
    EXPECT_TRUE(res.positions.empty());
}
