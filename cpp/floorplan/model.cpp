#include "floorplan/model.h"

namespace floorplan {

std::vector<PlacedRoomFootprint> collectPlacedRooms(
    const Floor& floor,
    const PositionResolution& resolution,
    const VariableMap& variables) {
    std::vector<PlacedRoomFootprint> out;
    for (const Room& room : floor.rooms) {
        const auto it = resolution.positions.find(room.name);
        if (it == resolution.positions.end()) continue;
        const auto size = findRoomSize(room, variables);
        if (!size) continue;

        RoomFootprint fp;
        fp.x = it->second.x;
        fp.y = it->second.y;
        fp.width = size->width;
        fp.height = size->height;
        if (room.height) fp.roomHeight = room.height->value;
        out.push_back(PlacedRoomFootprint{&room, fp});
    }
    return out;
}

std::vector<RoomFootprint> collectFloorFootprints(
    const Floor& floor,
    const PositionResolution& resolution,
    const VariableMap& variables) {
    std::vector<RoomFootprint> out;
    for (const PlacedRoomFootprint& placed : collectPlacedRooms(floor, resolution, variables)) {
        out.push_back(placed.footprint);
    }
    return out;
}

FloorMetrics computeFloorMetricsFor(const ResolvedModel& model, std::size_t floorIndex) {
    const Floor& floor = model.floorplan->floors.at(floorIndex);
    const PositionResolution& resolution = model.positions.at(floorIndex).second;
    return computeFloorMetrics(collectFloorFootprints(floor, resolution, model.variables.variables));
}

} // namespace floorplan
