#include "floorplan/render/dimension_svg.h"
#include "floorplan/core/string_utils.h"

#include <algorithm>
#include <cmath>

namespace floorplan {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kLabelOffset = 0.3;
constexpr const char* kDimensionColor = "#333";

bool hasType(const DimensionStyle& style, DimensionType type) {
    return std::find(style.types.begin(), style.types.end(), type) != style.types.end();
}

void line(SvgBuilder& svg, double x1, double y1, double x2, double y2) {
    svg.open("line")
        .attr("x1", x1)
        .attr("y1", y1)
        .attr("x2", x2)
        .attr("y2", y2)
        .attr("stroke", kDimensionColor)
        .attr("stroke-width", 0.03)
        .selfClose();
}

} // namespace

std::string formatDimensionValue(double value, LengthUnit unit) {
    const std::string number = std::fmod(value, 1.0) == 0.0 ? formatNumber(value) : formatFixed(value, 1);
    return number + toString(unit);
}

void generateDimensionLine(
    SvgBuilder& svg,
    double x1,
    double y1,
    double x2,
    double y2,
    double value,
    const DimensionStyle& style) {
    const double dx = x2 - x1;
    const double dy = y2 - y1;
    const double length = std::sqrt(dx * dx + dy * dy);
    if (length < 0.1) return;

    const double nx = dx / length;
    const double ny = dy / length;
    const double px = -ny;
    const double py = nx;
    const double half = style.tickLength / 2.0;

    svg.open("g").attr("class", "dimension-line").close();
    line(svg, x1, y1, x2, y2);
    line(svg, x1 + px * half, y1 + py * half, x1 - px * half, y1 - py * half);
    line(svg, x2 + px * half, y2 + py * half, x2 - px * half, y2 - py * half);

    const double labelX = (x1 + x2) / 2.0 + px * kLabelOffset;
    const double labelY = (y1 + y2) / 2.0 + py * kLabelOffset;

    double angle = std::atan2(dy, dx) * 180.0 / kPi;
    if (angle > 90.0 || angle < -90.0) angle += 180.0;

    const std::string transform = "rotate(" + formatNumber(angle) + ", " + formatNumber(labelX) + ", "
        + formatNumber(labelY) + ")";
    svg.open("text")
        .attr("x", labelX)
        .attr("y", labelY)
        .attr("text-anchor", "middle")
        .attr("dominant-baseline", "middle")
        .attr("font-size", style.fontSize)
        .attr("fill", kDimensionColor)
        .attr("transform", transform)
        .textElement("text", formatDimensionValue(value, style.lengthUnit));
    svg.end("g");
}

void generateRoomDimensions(SvgBuilder& svg, const Room& room, const FloorScene& scene, const DimensionStyle& style) {
    const auto it = scene.positions.find(room.name);
    if (it == scene.positions.end()) return;
    const auto size = findRoomSize(room, scene.variables);
    if (!size) return;

    const double x = it->second.x;
    const double y = it->second.y;

    svg.open("g").attr("class", "room-dimensions").attr("data-room", room.name).close();

    if (hasType(style, DimensionType::Width)) {
        generateDimensionLine(svg, x, y - style.offset, x + size->width, y - style.offset, size->width, style);
    }
    if (hasType(style, DimensionType::Depth)) {
        generateDimensionLine(svg, x - style.offset, y, x - style.offset, y + size->height, size->height, style);
    }
    if (hasType(style, DimensionType::Height) && room.height && room.height->value != style.defaultHeight) {
        svg.open("text")
            .attr("x", x + size->width / 2.0)
            .attr("y", y + size->height - 0.8)
            .attr("text-anchor", "middle")
            .attr("dominant-baseline", "middle")
            .attr("font-size", style.fontSize * 0.9)
            .attr("fill", "#666")
            .textElement("text", "h: " + formatNumber(room.height->value) + toString(style.lengthUnit));
    }

    svg.end("g");
}

void generateFloorDimensions(SvgBuilder& svg, const FloorScene& scene, const DimensionStyle& style) {
    svg.open("g").attr("class", "floor-dimensions").close();
    for (const Room& room : scene.floor.rooms) {
        generateRoomDimensions(svg, room, scene, style);
    }
    svg.end("g");
}

} // namespace floorplan
