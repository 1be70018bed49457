#include "tests/floorplan_test_common.h"
#include "floorplan/pipeline.h"

#include <type_traits>
#include <utility>

using namespace floorplan;
using namespace floorplan_test;

TEST(PipelineTest, ConvertsTwoRoomPlan) {
    const ConversionResult result = convertFloorplan(twoRoomPlan());
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.exportErrors.empty());
    EXPECT_EQ(countIf(result.warnings, [](const Warning& w) { return w.kind == WarningKind::Version; }), 0u);

    ASSERT_EQ(result.json.at("connections").size(), 1u);
    EXPECT_EQ(result.json.at("connections")[0].at("fromRoom"), "RoomA");
    EXPECT_EQ(result.json.at("grammarVersion"), "1.0");
    EXPECT_EQ(result.json.at("floors")[0].at("rooms").size(), 2u);

    EXPECT_EQ(countOccurrences(result.svg, "class=\"door\""), 1u);
    EXPECT_EQ(countOccurrences(result.svg, "<g class=\"room\""), 2u);
}

TEST(PipelineTest, MissingVersionIsWarning) {
    Floorplan plan = twoRoomPlan();
    plan.version.reset();
    const ConversionResult result = convertFloorplan(plan);
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(hasWarning(result.warnings, WarningKind::Version));
}

TEST(PipelineTest, UnsupportedVersionFailsConversion) {
    Floorplan plan = twoRoomPlan();
    plan.version = "3.0";
    const ConversionResult result = convertFloorplan(plan);
    EXPECT_FALSE(result.ok());
    ASSERT_EQ(result.versionErrors.size(), 1u);
    EXPECT_NE(result.versionErrors[0].find("Unsupported grammar version: 3.0.0"), std::string::npos);
    EXPECT_TRUE(result.errors.empty());
}

TEST(PipelineTest, DeprecatedConfigWarnsAfterDeprecation) {
    Floorplan plan = twoRoomPlan();
    plan.config.push_back(ConfigProperty{"door_width", 0.9});

    EXPECT_FALSE(hasWarning(convertFloorplan(plan).warnings, WarningKind::Deprecation));

    // 1.1 is newer than this parser, so the version itself is rejected while
    // the deprecation is still reported against it.
    plan.version = "1.1";
    const ConversionResult result = convertFloorplan(plan);
    EXPECT_FALSE(result.ok());
    ASSERT_EQ(result.versionErrors.size(), 1u);
    EXPECT_NE(result.versionErrors[0].find("Unsupported grammar version: 1.1.0"), std::string::npos);
    EXPECT_TRUE(hasWarning(result.warnings, WarningKind::Deprecation));
    EXPECT_TRUE(result.errors.empty());
}

TEST(PipelineTest, VariableErrorsAreCollected) {
    Floorplan plan = twoRoomPlan();
    plan.variables.push_back(VariableDef{"bath", dim(6, 8)});
    plan.variables.push_back(VariableDef{"bath", dim(7, 9)});
    Room study;
    study.name = "Study";
    study.position = Coordinate{len(0), len(20)};
    study.sizeRef = "missing";
    plan.floors[0].rooms.push_back(study);

    const ConversionResult result = convertFloorplan(plan);
    EXPECT_FALSE(result.ok());
    EXPECT_GE(countIf(result.errors, [](const ResolutionError& e) {
        return e.kind == ResolutionErrorKind::UndefinedVariable && e.element == "Study";
    }), 1u);
    EXPECT_EQ(countIf(result.errors, [](const ResolutionError& e) {
        return e.kind == ResolutionErrorKind::DuplicateDefinition;
    }), 1u);
}

TEST(PipelineTest, SizeReferenceResolvesThroughVariables) {
    Floorplan plan;
    plan.version = "1.0";
    plan.variables.push_back(VariableDef{"std", dim(6, 8)});
    Room room;
    room.name = "Bed";
    room.position = Coordinate{len(0), len(0)};
    room.sizeRef = "std";
    plan.floors.push_back(makeFloor("F1", {room}));

    const ConversionResult result = convertFloorplan(plan);
    EXPECT_TRUE(result.ok());
    EXPECT_NE(result.svg.find(">6 x 8</text>"), std::string::npos);
    EXPECT_EQ(result.json.at("floors")[0].at("rooms")[0].at("width"), 6.0);
}

TEST(PipelineTest, OverlapBecomesWarning) {
    Floorplan plan;
    plan.version = "1.0";
    plan.floors.push_back(makeFloor("F1", {makeRoom("A", 0, 0, 10, 10), makeRoom("B", 5, 5, 10, 10)}));

    const ConversionResult result = convertFloorplan(plan);
    EXPECT_TRUE(result.ok());
    const auto overlap = std::find_if(result.warnings.begin(), result.warnings.end(),
        [](const Warning& w) { return w.kind == WarningKind::Overlap; });
    ASSERT_NE(overlap, result.warnings.end());
    EXPECT_EQ(overlap->element, "A");
    EXPECT_EQ(overlap->message, "Rooms 'A' and 'B' overlap at their computed positions");
}

TEST(PipelineTest, PositionErrorsSkipFloorInJson) {
    Floorplan plan = twoRoomPlan();
    plan.floors[0].rooms[0].position.reset();
    plan.floors[0].rooms[0].relative = RelativePosition{};
    plan.floors[0].rooms[0].relative->direction = RelativeDirection::RightOf;
    plan.floors[0].rooms[0].relative->reference = "RoomB";

    const ConversionResult result = convertFloorplan(plan);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(countIf(result.errors, [](const ResolutionError& e) {
        return e.kind == ResolutionErrorKind::CircularDependency;
    }), 1u);
    ASSERT_EQ(result.exportErrors.size(), 1u);
    EXPECT_EQ(result.exportErrors[0].floor, "Ground");
    EXPECT_TRUE(result.json.at("floors").empty());
    EXPECT_NE(result.svg.find("<!-- Room RoomA has no resolved position -->"), std::string::npos);
}

TEST(PipelineTest, RenderOptionsPassThrough) {
    RenderOptions options;
    options.includeXmlDeclaration = true;
    const ConversionResult result = convertFloorplan(twoRoomPlan(), options);
    EXPECT_EQ(result.svg.rfind("<?xml", 0), 0u);
}

namespace {

template <typename T, typename = void>
struct ResolvesFrom : std::false_type {};

template <typename T>
struct ResolvesFrom<T, std::void_t<decltype(resolveModel(std::declval<T>()))>> : std::true_type {};

} // namespace

TEST(PipelineTest, ModelBorrowsLvalueFloorplanOnly) {
    static_assert(ResolvesFrom<const Floorplan&>::value, "lvalue documents resolve");
    static_assert(!ResolvesFrom<Floorplan>::value, "temporaries would dangle");

    const Floorplan plan = twoRoomPlan();
    const ResolvedModel model = resolveModel(plan);
    EXPECT_EQ(model.floorplan, &plan);
}

TEST(PipelineTest, PlacedRoomsSkipUnsizedRooms) {
    Floorplan plan = twoRoomPlan();
    Room study;
    study.name = "Study";
    study.position = Coordinate{len(0), len(20)};
    study.sizeRef = "missing";
    plan.floors[0].rooms.push_back(study);
    plan.floors[0].rooms[1].height = len(3);

    const ResolvedModel model = resolveModel(plan);
    const auto placed = collectPlacedRooms(plan.floors[0], model.positions[0].second, model.variables.variables);
    ASSERT_EQ(placed.size(), 2u);
    EXPECT_EQ(placed[0].room->name, "RoomA");
    EXPECT_EQ(placed[1].room->name, "RoomB");
    EXPECT_EQ(placed[1].footprint.x, 10.0);
    ASSERT_TRUE(placed[1].footprint.roomHeight.has_value());
    EXPECT_EQ(*placed[1].footprint.roomHeight, 3.0);

    const auto footprints = collectFloorFootprints(plan.floors[0], model.positions[0].second, model.variables.variables);
    ASSERT_EQ(footprints.size(), 2u);
    EXPECT_EQ(footprints[1].width, placed[1].footprint.width);
    EXPECT_EQ(convertFloorplan(plan).json.at("floors")[0].at("rooms").size(), 2u);
}
