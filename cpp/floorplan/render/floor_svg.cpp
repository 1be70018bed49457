#include "floorplan/render/floor_svg.h"
#include "floorplan/core/string_utils.h"
#include "floorplan/stairs/stair_geometry.h"

#include <algorithm>
#include <limits>

namespace floorplan {

namespace {

struct Extent {
    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();

    void add(double x, double y, double w, double h) {
        minX = std::min(minX, x);
        minY = std::min(minY, y);
        maxX = std::max(maxX, x + w);
        maxY = std::max(maxY, y + h);
    }
};

} // namespace

FloorBounds calculateFloorBounds(const FloorScene& scene) {
    Extent e;

    for (const Room& room : scene.floor.rooms) {
        const auto pos = getResolvedPosition(room, scene.positions);
        const auto size = findRoomSize(room, scene.variables);
        if (!pos || !size) continue;
        e.add(pos->x, pos->y, size->width, size->height);
    }

    for (const Stair& stair : scene.floor.stairs) {
        if (!stair.position) continue;
        const ResolvedSize box = getStairBoundingBox(stair, scene.defaultUnit);
        const double labelSpace = stair.label ? kCirculationLabelSpace : 0.0;
        e.add(stair.position->x.value, stair.position->y.value, box.width, box.height + labelSpace);
    }

    for (const Lift& lift : scene.floor.lifts) {
        if (!lift.position) continue;
        const double labelSpace = lift.label ? kCirculationLabelSpace : 0.0;
        e.add(lift.position->x.value, lift.position->y.value,
            lift.size.width.value, lift.size.height.value + labelSpace);
    }

    if (e.minX == std::numeric_limits<double>::infinity()) return FloorBounds{};

    FloorBounds b;
    b.minX = e.minX;
    b.minY = e.minY;
    b.maxX = e.maxX;
    b.maxY = e.maxY;
    b.width = e.maxX - e.minX;
    b.height = e.maxY - e.minY;
    return b;
}

void generateFloorRectangle(SvgBuilder& svg, const FloorBounds& bounds) {
    svg.open("rect")
        .attr("x", bounds.minX)
        .attr("y", bounds.minY)
        .attr("width", bounds.width)
        .attr("height", bounds.height)
        .attr("class", "floor-background")
        .attr("fill", "#eed")
        .attr("stroke", "black")
        .attr("stroke-width", 0.1)
        .selfClose();
}

void generateFloorSummaryPanel(
    SvgBuilder& svg,
    const FloorMetrics& metrics,
    const FloorBounds& bounds,
    double offsetX,
    double offsetY,
    AreaUnit areaUnit) {
    constexpr double kPanelHeight = 3.0;
    constexpr double kFontSize = 0.5;
    constexpr double kLineHeight = 0.8;

    const double panelX = offsetX + bounds.minX;
    const double panelY = offsetY + bounds.maxY + 1.0;
    const std::string unit = toString(areaUnit);
    double y = panelY + 0.8;

    svg.open("g").attr("class", "floor-summary").attr("transform", "translate(0, 0)").close();

    svg.open("rect")
        .attr("x", panelX)
        .attr("y", panelY)
        .attr("width", bounds.width)
        .attr("height", kPanelHeight)
        .attr("fill", "#f5f5f5")
        .attr("stroke", "#ccc")
        .attr("stroke-width", 0.05)
        .attr("rx", 0.2)
        .selfClose();

    svg.open("text")
        .attr("x", panelX + bounds.width / 2.0)
        .attr("y", y)
        .attr("text-anchor", "middle")
        .attr("font-size", kFontSize * 1.2)
        .attr("font-weight", "bold")
        .attr("fill", "#333")
        .textElement("text", "Floor Summary");
    y += kLineHeight;

    const BoundingBox& bb = metrics.boundingBox;
    const std::string bbText = "Bounding: " + formatFixed(bb.width, 1) + " \xC3\x97 " + formatFixed(bb.height, 1)
        + " (" + formatFixed(bb.area, 1) + " " + unit + ")";
    svg.open("text")
        .attr("x", panelX + 0.3)
        .attr("y", y)
        .attr("font-size", kFontSize)
        .attr("fill", "#666")
        .textElement("text", bbText);
    y += kLineHeight;

    const std::string netText = "Net Area: " + formatFixed(metrics.netArea, 1) + " " + unit
        + " | Rooms: " + std::to_string(metrics.roomCount)
        + " | Efficiency: " + formatEfficiency(metrics.efficiency);
    svg.open("text")
        .attr("x", panelX + 0.3)
        .attr("y", y)
        .attr("font-size", kFontSize)
        .attr("fill", "#666")
        .textElement("text", netText);

    svg.end("g");
}

} // namespace floorplan
