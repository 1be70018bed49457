#ifndef FLOORPLAN_ROOM_SVG_H
#define FLOORPLAN_ROOM_SVG_H

#include "floorplan/geometry/door_geometry.h"
#include "floorplan/render/render_options.h"
#include "floorplan/render/svg_builder.h"

#include <string>
#include <vector>

namespace floorplan {

struct RoomTextOptions {
    bool showLabels{true};
    bool showArea{false};
    AreaUnit areaUnit{AreaUnit::Sqft};
};

// Wall rect in `color`, with a door or window symbol for those wall types.
// Open walls draw nothing.
void wallRectangle(
    SvgBuilder& svg,
    const Rect& rect,
    WallType type,
    WallDirection direction,
    const std::string& color);

// Room background, four walls and sub-rooms (placed relative to this room).
void generateRoomSvg(
    SvgBuilder& svg,
    const Room& room,
    double parentOffsetX,
    double parentOffsetY,
    const FloorScene& scene);

// Name, label, size and area text for `rooms` and their sub-rooms.
void generateRoomLabels(
    SvgBuilder& svg,
    const std::vector<Room>& rooms,
    double parentOffsetX,
    double parentOffsetY,
    const FloorScene& scene,
    const RoomTextOptions& options);

// Door symbols for every connection whose rooms both lie on the scene's floor.
void generateConnections(
    SvgBuilder& svg,
    const FloorScene& scene,
    const std::vector<Connection>& connections);

} // namespace floorplan

#endif // FLOORPLAN_ROOM_SVG_H
