#include "floorplan/render/room_svg.h"
#include "tests/floorplan_test_common.h"
#include "floorplan/pipeline.h"
#include "floorplan/render/dimension_svg.h"
#include "floorplan/render/door_svg.h"
#include "floorplan/render/floor_svg.h"
#include "floorplan/render/svg_builder.h"
#include "floorplan/render/svg_renderer.h"
#include "floorplan/style/theme.h"

using namespace floorplan;
using namespace floorplan_test;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string render(const Floorplan& plan, const RenderOptions& options = RenderOptions{}) {
    return renderSvg(resolveModel(plan), options);
}

Floorplan twoFloorPlan() {
    Floorplan plan = twoRoomPlan();
    plan.floors.push_back(makeFloor("Upper", {makeRoom("Loft", 0, 0, 10, 10)}));
    return plan;
}

} // namespace

TEST(SvgBuilderTest, EscapesAttributesAndText) {
    SvgBuilder svg;
    svg.open("text").attr("data-room", "A&B").attr("x", 1.5).attr("n", 3).textElement("text", "<Hall>");
    EXPECT_EQ(svg.str(), "<text data-room=\"A&amp;B\" x=\"1.5\" n=\"3\">&lt;Hall&gt;</text>");

    SvgBuilder other;
    other.open("rect").attr("x", -0.0).selfClose().comment("note");
    EXPECT_EQ(other.release(), "<rect x=\"0\"/><!-- note -->");
    EXPECT_EQ(formatPoint(1, 2.5), "1,2.5");
}

TEST(SvgBuilderTest, CommentsBreakDoubleHyphens) {
    SvgBuilder svg;
    svg.comment("Room A--B---C has no resolved position");
    EXPECT_EQ(svg.str(), "<!-- Room A- -B- - -C has no resolved position -->");
    EXPECT_EQ(countOccurrences(svg.str(), "--"), 2u);
}

TEST(SvgRenderTest, WallRectangleTagsDirection) {
    SvgBuilder svg;
    wallRectangle(svg, Rect{0, 0, 10, 0.2}, WallType::Solid, WallDirection::Top, "#000");
    EXPECT_EQ(svg.str(),
        "<rect x=\"0\" y=\"0\" width=\"10\" height=\"0.2\" class=\"wall\" fill=\"#000\" stroke=\"#000\" "
        "stroke-width=\"0.05\" data-direction=\"top\"/>");

    SvgBuilder open;
    wallRectangle(open, Rect{0, 0, 10, 0.2}, WallType::Open, WallDirection::Left, "#000");
    EXPECT_TRUE(open.empty());
}

TEST(SvgRenderTest, EmptyDocument) {
    EXPECT_EQ(render(Floorplan{}), kEmptySvg);

    RenderOptions options;
    options.floorIndex = 3;
    EXPECT_EQ(render(twoRoomPlan(), options), kEmptySvg);
}

TEST(SvgRenderTest, SingleFloorDocument) {
    const std::string svg = render(twoRoomPlan());
    EXPECT_EQ(svg.rfind("<svg viewBox=\"0 0 20 10\" xmlns=\"http://www.w3.org/2000/svg\" width=\"20\" height=\"10\"", 0), 0u);
    EXPECT_TRUE(contains(svg, "role=\"img\" aria-roledescription=\"floorplan\""));
    EXPECT_TRUE(contains(svg, "<marker id=\"arrowhead\""));
    EXPECT_TRUE(contains(svg, "<style>"));
    EXPECT_TRUE(contains(svg, "<g class=\"floorplan\" aria-label=\"Floor: Ground\">"));
    EXPECT_EQ(countOccurrences(svg, "class=\"floor-background\""), 1u);
    EXPECT_EQ(countOccurrences(svg, "<g class=\"room\""), 2u);
    EXPECT_EQ(countOccurrences(svg, "class=\"wall\""), 8u);
    EXPECT_TRUE(contains(svg,
        "<rect x=\"9.8\" y=\"0\" width=\"0.2\" height=\"10\" class=\"wall\" fill=\"#000000\" stroke=\"#000000\" "
        "stroke-width=\"0.05\" data-direction=\"right\"/>"));
    for (const char* side : {"top", "right", "bottom", "left"}) {
        EXPECT_EQ(countOccurrences(svg, std::string("stroke-width=\"0.05\" data-direction=\"") + side + "\"/>"), 2u) << side;
    }
    EXPECT_EQ(countOccurrences(svg, "class=\"door\""), 1u);
    EXPECT_TRUE(contains(svg, ">RoomB</text>"));
    EXPECT_TRUE(contains(svg, ">10 x 10</text>"));
    EXPECT_FALSE(contains(svg, "room-area"));
    EXPECT_FALSE(contains(svg, "floor-dimensions"));
    EXPECT_EQ(svg.substr(svg.size() - 10), "</g></svg>");
}

TEST(SvgRenderTest, DocumentOptions) {
    RenderOptions options;
    options.includeXmlDeclaration = true;
    options.includeStyles = false;
    options.padding = 1;
    options.scale = 2;
    const std::string svg = render(twoRoomPlan(), options);
    EXPECT_EQ(svg.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<svg", 0), 0u);
    EXPECT_TRUE(contains(svg, "viewBox=\"-1 -1 22 12\""));
    EXPECT_TRUE(contains(svg, "width=\"44\" height=\"24\""));
    EXPECT_FALSE(contains(svg, "<style>"));
}

TEST(SvgRenderTest, ThemeOverride) {
    Floorplan plan = twoRoomPlan();
    plan.config.push_back(ConfigProperty{"theme", std::string("blueprint")});
    EXPECT_TRUE(contains(render(plan), "fill: #1a365d"));

    RenderOptions options;
    options.theme = style::darkTheme();
    const std::string svg = render(plan, options);
    EXPECT_TRUE(contains(svg, "fill: #2d2d2d"));
    EXPECT_FALSE(contains(svg, "fill: #1a365d"));
}

TEST(SvgRenderTest, AreaDimensionsAndSummary) {
    RenderOptions options;
    options.showArea = true;
    options.showDimensions = true;
    options.showFloorSummary = true;
    const std::string svg = render(twoRoomPlan(), options);

    EXPECT_EQ(countOccurrences(svg, ">100 sqft</text>"), 2u);
    EXPECT_TRUE(contains(svg, "<g class=\"floor-dimensions\">"));
    EXPECT_EQ(countOccurrences(svg, "class=\"room-dimensions\""), 2u);
    EXPECT_TRUE(contains(svg, ">10ft</text>"));
    EXPECT_TRUE(contains(svg, "viewBox=\"0 0 20 14\""));
    EXPECT_TRUE(contains(svg, ">Floor Summary</text>"));
    EXPECT_TRUE(contains(svg, "Net Area: 200.0 sqft | Rooms: 2 | Efficiency: 100%"));
}

TEST(SvgRenderTest, ConfigShowDimensionsIsDefault) {
    Floorplan plan = twoRoomPlan();
    plan.config.push_back(ConfigProperty{"show_dimensions", true});
    EXPECT_TRUE(contains(render(plan), "floor-dimensions"));

    RenderOptions options;
    options.showDimensions = false;
    EXPECT_FALSE(contains(render(plan, options), "floor-dimensions"));
}

TEST(SvgRenderTest, LabelsCanBeDisabled) {
    Floorplan plan = twoRoomPlan();
    plan.config.push_back(ConfigProperty{"show_labels", false});
    const std::string svg = render(plan);
    EXPECT_FALSE(contains(svg, "class=\"room-name\""));
    EXPECT_FALSE(contains(svg, "class=\"room-size\""));
    EXPECT_TRUE(contains(svg, ".room-name {"));
}

TEST(SvgRenderTest, WallTypes) {
    Floorplan plan;
    Room room = makeRoom("Study", 0, 0, 10, 10);
    WallSpec window;
    window.direction = WallDirection::Top;
    window.type = WallType::Window;
    WallSpec open;
    open.direction = WallDirection::Left;
    open.type = WallType::Open;
    WallSpec door;
    door.direction = WallDirection::Bottom;
    door.type = WallType::Door;
    room.walls = {window, open, door};
    plan.floors.push_back(makeFloor("F1", {room}));

    const std::string svg = render(plan);
    EXPECT_EQ(countOccurrences(svg, "class=\"wall\""), 3u);
    EXPECT_TRUE(contains(svg, "class=\"window\" fill=\"white\" stroke=\"black\" stroke-width=\"0.01\" data-type=\"window\" data-direction=\"top\""));
    EXPECT_TRUE(contains(svg, "data-direction=\"bottom\" data-swing=\"default\""));
}

TEST(SvgRenderTest, ConnectionDoorKinds) {
    Floorplan plan = twoRoomPlan();
    plan.connections[0].swing = SwingDirection::Left;
    Connection opening = makeConnection("RoomA", WallDirection::Right, "RoomB", WallDirection::Left, DoorType::Opening, 10.0);
    Connection doubleDoor = makeConnection("RoomA", WallDirection::Right, "RoomB", WallDirection::Left, DoorType::DoubleDoor, 85.0);
    plan.connections.push_back(opening);
    plan.connections.push_back(doubleDoor);

    const std::string svg = render(plan);
    EXPECT_TRUE(contains(svg, "data-swing=\"left\""));
    EXPECT_EQ(countOccurrences(svg, "class=\"opening\""), 1u);
    EXPECT_EQ(countOccurrences(svg, "<g class=\"double-door\" data-type=\"double-door\" data-direction=\"right\">"), 1u);
}

TEST(SvgRenderTest, UnresolvedRoomLeavesComment) {
    Floorplan plan = twoRoomPlan();
    plan.floors[0].rooms.push_back(makeRelativeRoom("Ghost", RelativeDirection::Below, "Missing", 4, 4));
    const std::string svg = render(plan);
    EXPECT_TRUE(contains(svg, "<!-- Room Ghost has no resolved position -->"));
    EXPECT_EQ(countOccurrences(svg, "<g class=\"room\""), 2u);
}

TEST(SvgRenderTest, CirculationElements) {
    Floorplan plan = twoRoomPlan();
    Stair stair = makeStair("S1", 0, 12, StraightStair{WallDirection::Top});
    stair.width = len(3);
    stair.label = "Main stair";
    plan.floors[0].stairs.push_back(stair);
    Lift lift;
    lift.name = "L1";
    lift.position = Coordinate{len(22), len(0)};
    lift.size = dim(2, 2);
    lift.doors = {WallDirection::Left};
    plan.floors[0].lifts.push_back(lift);

    const std::string svg = render(plan);
    EXPECT_TRUE(contains(svg, "<g class=\"floor-circulation\" aria-label=\"Circulation elements\">"));
    EXPECT_TRUE(contains(svg, "<g class=\"stair\" data-name=\"S1\" transform=\"translate(0, 12)\">"));
    EXPECT_TRUE(contains(svg, ">Main stair</text>"));
    EXPECT_TRUE(contains(svg, "<g class=\"lift\" data-name=\"L1\" transform=\"translate(22, 0)\">"));
    EXPECT_TRUE(contains(svg, ">E</text>"));
}

TEST(SvgRenderTest, FloorBoundsIncludeCirculation) {
    Floorplan plan = twoRoomPlan();
    Lift lift;
    lift.name = "L1";
    lift.position = Coordinate{len(22), len(0)};
    lift.size = dim(2, 2);
    lift.label = "Lift";
    plan.floors[0].lifts.push_back(lift);

    const ResolvedModel model = resolveModel(plan);
    const FloorScene scene{plan.floors[0], model.positions[0].second.positions, model.variables.variables, model.styles};
    const FloorBounds bounds = calculateFloorBounds(scene);
    EXPECT_EQ(bounds.minX, 0.0);
    EXPECT_EQ(bounds.maxX, 24.0);
    EXPECT_EQ(bounds.maxY, 10.0);
    EXPECT_EQ(bounds.width, 24.0);

    const Floor bare{};
    const FloorScene empty{bare, model.positions[0].second.positions, model.variables.variables, model.styles};
    const FloorBounds none = calculateFloorBounds(empty);
    EXPECT_EQ(none.width, 0.0);
    EXPECT_EQ(none.height, 0.0);
}

TEST(SvgRenderTest, SideBySideFloors) {
    RenderOptions options;
    options.renderAllFloors = true;
    const std::string svg = render(twoFloorPlan(), options);
    EXPECT_TRUE(contains(svg, "viewBox=\"0 0 35 12\""));
    EXPECT_EQ(countOccurrences(svg, "class=\"floor-label\""), 2u);
    EXPECT_TRUE(contains(svg, "<g class=\"floor\" aria-label=\"Floor: Ground\" transform=\"translate(0, 2)\">"));
    EXPECT_TRUE(contains(svg, "<g class=\"floor\" aria-label=\"Floor: Upper\" transform=\"translate(25, 2)\">"));
}

TEST(SvgRenderTest, StackedFloorsPutFirstFloorAtBottom) {
    RenderOptions options;
    options.renderAllFloors = true;
    options.multiFloorLayout = MultiFloorLayout::Stacked;
    const std::string svg = render(twoFloorPlan(), options);
    EXPECT_TRUE(contains(svg, "viewBox=\"0 0 20 29\""));
    EXPECT_TRUE(contains(svg, "<g class=\"floor\" aria-label=\"Floor: Upper\" transform=\"translate(0, 2)\">"));
    EXPECT_TRUE(contains(svg, "<g class=\"floor\" aria-label=\"Floor: Ground\" transform=\"translate(0, 19)\">"));
    EXPECT_LT(svg.find("Floor: Upper"), svg.find("Floor: Ground"));
}

TEST(SvgRenderTest, StackedSummaryReservesSpace) {
    RenderOptions options;
    options.renderAllFloors = true;
    options.multiFloorLayout = MultiFloorLayout::Stacked;
    options.showFloorSummary = true;
    const std::string svg = render(twoFloorPlan(), options);
    EXPECT_TRUE(contains(svg, "viewBox=\"0 0 20 37\""));
    EXPECT_TRUE(contains(svg, "transform=\"translate(0, 23)\""));
    EXPECT_EQ(countOccurrences(svg, ">Floor Summary</text>"), 2u);
}

TEST(SvgRenderTest, SingleFloorIgnoresRenderAll) {
    RenderOptions options;
    options.renderAllFloors = true;
    const std::string svg = render(twoRoomPlan(), options);
    EXPECT_TRUE(contains(svg, "<g class=\"floorplan\" aria-label=\"Floor: Ground\">"));
    EXPECT_FALSE(contains(svg, "floor-label"));
}

TEST(DimensionSvgTest, ValueFormatting) {
    EXPECT_EQ(formatDimensionValue(12, LengthUnit::Ft), "12ft");
    EXPECT_EQ(formatDimensionValue(2.26, LengthUnit::M), "2.3m");
}

TEST(DimensionSvgTest, ShortLinesAreSkipped) {
    SvgBuilder svg;
    generateDimensionLine(svg, 0, 0, 0.05, 0, 0.05, DimensionStyle{});
    EXPECT_TRUE(svg.empty());

    generateDimensionLine(svg, 0, 0, 4, 0, 4, DimensionStyle{});
    EXPECT_EQ(countOccurrences(svg.str(), "<line"), 3u);
    EXPECT_TRUE(contains(svg.str(), "transform=\"rotate(0, 2, 0.3)\">4ft</text>"));
}

TEST(DoorSvgTest, LeafPathFormat) {
    DoorLeaf leaf;
    leaf.hingeX = 0;
    leaf.hingeY = 0.1;
    leaf.panelEndX = 0;
    leaf.panelEndY = 0.95;
    leaf.radius = 0.85;
    leaf.sweep = 0;
    leaf.arcEndX = 1;
    leaf.arcEndY = 0.1;
    EXPECT_EQ(doorLeafPath(leaf), "M 0 0.1 L 0 0.95 A 0.85 0.85 0 0 0 1 0.1");
}
