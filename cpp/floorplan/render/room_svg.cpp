#include "floorplan/render/room_svg.h"
#include "floorplan/core/logging.h"
#include "floorplan/core/string_utils.h"
#include "floorplan/geometry/wall_geometry.h"
#include "floorplan/metrics.h"
#include "floorplan/render/door_svg.h"

#include <optional>

namespace floorplan {

namespace {

struct PlacedRoom {
    double x;
    double y;
    ResolvedSize size;
};

std::optional<PlacedRoom> placeRoom(const Room& room, double offsetX, double offsetY, const FloorScene& scene) {
    const auto pos = getResolvedPosition(room, scene.positions);
    const auto size = findRoomSize(room, scene.variables);
    if (!pos || !size) return std::nullopt;
    return PlacedRoom{pos->x + offsetX, pos->y + offsetY, *size};
}

WallType wallTypeOf(const Room& room, WallDirection direction) {
    for (const WallSpec& spec : room.walls) {
        if (spec.direction == direction) return spec.type;
    }
    return WallType::Solid;
}

void centeredText(SvgBuilder& svg, double x, double y, const char* cls, double fontSize,
    const char* fill, const std::string& content) {
    svg.open("text")
        .attr("x", x)
        .attr("y", y)
        .attr("text-anchor", "middle")
        .attr("dominant-baseline", "middle")
        .attr("class", cls)
        .attr("font-size", fontSize);
    if (fill) svg.attr("fill", fill);
    svg.textElement("text", content);
}

} // namespace

void wallRectangle(
    SvgBuilder& svg,
    const Rect& rect,
    WallType type,
    WallDirection direction,
    const std::string& color) {
    if (type == WallType::Open) return;

    svg.open("rect")
        .attr("x", rect.x)
        .attr("y", rect.y)
        .attr("width", rect.width)
        .attr("height", rect.height)
        .attr("class", "wall")
        .attr("fill", color)
        .attr("stroke", color)
        .attr("stroke-width", 0.05)
        .attr("data-direction", toString(direction))
        .selfClose();

    if (type == WallType::Door) {
        generateDoor(svg, rect, direction, DoorType::Door, std::nullopt);
    } else if (type == WallType::Window) {
        generateWindow(svg, rect, direction);
    }
}

void generateRoomSvg(
    SvgBuilder& svg,
    const Room& room,
    double parentOffsetX,
    double parentOffsetY,
    const FloorScene& scene) {
    const auto placed = placeRoom(room, parentOffsetX, parentOffsetY, scene);
    if (!placed) {
        svg.comment("Room " + room.name + " has no resolved position");
        return;
    }

    const double x = placed->x;
    const double y = placed->y;
    const double w = placed->size.width;
    const double h = placed->size.height;
    const style::ResolvedStyle roomStyle = style::resolveRoomStyle(room, scene.styles);

    svg.open("g").attr("class", "room").attr("data-room", room.name).close();

    svg.open("rect")
        .attr("x", x)
        .attr("y", y)
        .attr("width", w)
        .attr("height", h)
        .attr("class", "room-background")
        .attr("fill", roomStyle.floorColor)
        .attr("stroke", "none")
        .selfClose();

    const double t = kWallThickness;
    wallRectangle(svg, Rect{x, y, w, t}, wallTypeOf(room, WallDirection::Top), WallDirection::Top, roomStyle.wallColor);
    wallRectangle(svg, Rect{x + w - t, y, t, h}, wallTypeOf(room, WallDirection::Right), WallDirection::Right, roomStyle.wallColor);
    wallRectangle(svg, Rect{x, y + h - t, w, t}, wallTypeOf(room, WallDirection::Bottom), WallDirection::Bottom, roomStyle.wallColor);
    wallRectangle(svg, Rect{x, y, t, h}, wallTypeOf(room, WallDirection::Left), WallDirection::Left, roomStyle.wallColor);

    for (const Room& sub : room.subRooms) {
        generateRoomSvg(svg, sub, x, y, scene);
    }

    svg.end("g");
}

void generateRoomLabels(
    SvgBuilder& svg,
    const std::vector<Room>& rooms,
    double parentOffsetX,
    double parentOffsetY,
    const FloorScene& scene,
    const RoomTextOptions& options) {
    for (const Room& room : rooms) {
        const auto placed = placeRoom(room, parentOffsetX, parentOffsetY, scene);
        if (!placed) continue;

        const double cx = placed->x + placed->size.width / 2.0;
        const double cy = placed->y + placed->size.height / 2.0;

        if (options.showLabels) {
            centeredText(svg, cx, cy - 1.0, "room-name", 0.8, "black", room.name);
            if (room.label) {
                centeredText(svg, cx, cy, "room-label", 0.8, nullptr, stripQuotes(*room.label));
            }
            const std::string sizeText = formatNumber(placed->size.width) + " x " + formatNumber(placed->size.height);
            centeredText(svg, cx, cy + 1.0, "room-size", 0.7, "gray", sizeText);
        }

        if (options.showArea) {
            const double area = placed->size.width * placed->size.height;
            centeredText(svg, cx, cy + 2.0, "room-area", 0.6, "gray", formatArea(area, options.areaUnit));
        }

        generateRoomLabels(svg, room.subRooms, placed->x, placed->y, scene, options);
    }
}

void generateConnections(
    SvgBuilder& svg,
    const FloorScene& scene,
    const std::vector<Connection>& connections) {
    for (const Connection& connection : connections) {
        const auto placed = placeConnection(connection, scene.floor, scene.positions, scene.variables);
        if (!placed) continue;

        const ConnectionPoint& p = placed->point;
        FLOORPLAN_LOG_DEBUG("door %s -> %s at (%g, %g)",
            connection.from.room.c_str(), connection.to.room.c_str(), p.x, p.y);
        generateDoor(svg, Rect{p.x, p.y, p.width, p.height}, p.wallDirection, connection.doorType, placed->swing);
    }
}

} // namespace floorplan
