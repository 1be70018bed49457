#include "tests/floorplan_test_common.h"
#include "floorplan/units.h"

using namespace floorplan;
using namespace floorplan_test;

TEST(UnitsTest, ConvertsThroughMeters) {
    EXPECT_DOUBLE_EQ(toMeters(10.0, LengthUnit::Ft), 3.048);
    EXPECT_DOUBLE_EQ(toMeters(250.0, LengthUnit::Cm), 2.5);
    EXPECT_DOUBLE_EQ(toMeters(1500.0, LengthUnit::Mm), 1.5);
    EXPECT_NEAR(fromMeters(0.0254, LengthUnit::In), 1.0, 1e-12);
    EXPECT_NEAR(convertUnit(12.0, LengthUnit::In, LengthUnit::Ft), 1.0, 1e-12);
    EXPECT_NEAR(convertUnit(1.0, LengthUnit::M, LengthUnit::Cm), 100.0, 1e-9);
}

TEST(UnitsTest, SameUnitIsIdentity) {
    EXPECT_EQ(convertUnit(0.1, LengthUnit::Ft, LengthUnit::Ft), 0.1);
    EXPECT_EQ(convertUnit(7.3, LengthUnit::Mm, LengthUnit::Mm), 7.3);
}

TEST(UnitsTest, UnitlessLengthTakesTargetUnit) {
    EXPECT_EQ(lengthIn(len(4.5), LengthUnit::Ft), 4.5);
    EXPECT_NEAR(lengthIn(len(1.0, LengthUnit::M), LengthUnit::Cm), 100.0, 1e-9);
}

TEST(UnitsTest, ResolveUnitPrecedence) {
    EXPECT_EQ(resolveUnit(LengthUnit::In, LengthUnit::Cm), LengthUnit::In);
    EXPECT_EQ(resolveUnit(std::nullopt, LengthUnit::Cm), LengthUnit::Cm);
    EXPECT_EQ(resolveUnit(std::nullopt, std::nullopt), LengthUnit::M);
}

TEST(UnitsTest, ParsesUnitNames) {
    EXPECT_EQ(parseLengthUnit("m"), LengthUnit::M);
    EXPECT_EQ(parseLengthUnit("ft"), LengthUnit::Ft);
    EXPECT_EQ(parseLengthUnit("cm"), LengthUnit::Cm);
    EXPECT_EQ(parseLengthUnit("in"), LengthUnit::In);
    EXPECT_EQ(parseLengthUnit("mm"), LengthUnit::Mm);
    EXPECT_FALSE(parseLengthUnit("yd").has_value());
    EXPECT_FALSE(parseLengthUnit("").has_value());
}

TEST(UnitsTest, ClassifiesUnitSystems) {
    EXPECT_TRUE(isMetric(LengthUnit::Cm));
    EXPECT_FALSE(isMetric(LengthUnit::In));
    EXPECT_TRUE(isImperial(LengthUnit::Ft));
    EXPECT_EQ(unitSystemOf(LengthUnit::Mm), UnitSystem::Metric);
    EXPECT_EQ(unitSystemOf(LengthUnit::In), UnitSystem::Imperial);
}

TEST(UnitsTest, CollectsUnitsFromRoomsVariablesAndFloors) {
    Floorplan plan;
    plan.variables.push_back(VariableDef{"bed", Dimension{len(3, LengthUnit::M), len(4, LengthUnit::M)}});

    Room parent = makeRoom("Parent", 0, 0, 10, 10);
    Room closet = makeRoom("Closet", 1, 1, 2, 2);
    closet.height = len(2.4, LengthUnit::Cm);
    parent.subRooms.push_back(closet);

    Floor floor = makeFloor("F1", {parent});
    floor.height = len(10, LengthUnit::Ft);
    plan.floors.push_back(floor);

    const auto units = collectUnits(plan);
    EXPECT_EQ(units.size(), 3u);
    EXPECT_TRUE(units.count(LengthUnit::M));
    EXPECT_TRUE(units.count(LengthUnit::Cm));
    EXPECT_TRUE(units.count(LengthUnit::Ft));
    EXPECT_TRUE(hasMixedUnitSystems(plan));
}

TEST(UnitsTest, UnitlessPlanIsNotMixed) {
    Floorplan plan;
    plan.floors.push_back(makeFloor("F1", {makeRoom("A", 0, 0, 5, 5)}));
    EXPECT_TRUE(collectUnits(plan).empty());
    EXPECT_TRUE(getUnitSystems(plan).empty());
    EXPECT_FALSE(hasMixedUnitSystems(plan));
}

TEST(UnitsTest, GapUnitsAreCollected) {
    Floorplan plan;
    Room b = makeRelativeRoom("B", RelativeDirection::Below, "A", 5, 5);
    b.relative->gap = len(1, LengthUnit::In);
    Room a = makeRoom("A", 0, 0, 5, 5);
    a.size = Dimension{len(5, LengthUnit::Mm), len(5, LengthUnit::Mm)};
    plan.floors.push_back(makeFloor("F1", {a, b}));

    const auto systems = getUnitSystems(plan);
    EXPECT_EQ(systems.size(), 2u);
}

TEST(UnitsTest, RoundTripEveryUnitPair) {
    const LengthUnit units[] = {LengthUnit::M, LengthUnit::Ft, LengthUnit::Cm, LengthUnit::In, LengthUnit::Mm};
    for (const LengthUnit a : units) {
        for (const LengthUnit b : units) {
            for (const double x : {0.0, 1.0, 3.35, 12.5, 1234.5678}) {
                EXPECT_NEAR(convertUnit(convertUnit(x, a, b), b, a), x, 1e-9 * (1.0 + x))
                    << toString(a) << " -> " << toString(b) << " for " << x;
            }
        }
    }
}
