#include "floorplan/metrics.h"
#include "floorplan/core/string_utils.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace floorplan {

RoomMetrics computeRoomMetrics(const RoomFootprint& room) noexcept {
    RoomMetrics m;
    m.area = room.width * room.height;
    if (room.roomHeight) m.volume = m.area * *room.roomHeight;
    return m;
}

BoundingBox computeBoundingBox(const std::vector<RoomFootprint>& rooms) noexcept {
    if (rooms.empty()) return BoundingBox{};

    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();
    for (const RoomFootprint& r : rooms) {
        minX = std::min(minX, r.x);
        minY = std::min(minY, r.y);
        maxX = std::max(maxX, r.x + r.width);
        maxY = std::max(maxY, r.y + r.height);
    }

    BoundingBox box;
    box.width = maxX - minX;
    box.height = maxY - minY;
    box.area = box.width * box.height;
    box.minX = minX;
    box.minY = minY;
    return box;
}

FloorMetrics computeFloorMetrics(const std::vector<RoomFootprint>& rooms) noexcept {
    FloorMetrics m;
    m.boundingBox = computeBoundingBox(rooms);
    for (const RoomFootprint& r : rooms) m.netArea += r.width * r.height;
    m.roomCount = static_cast<int>(rooms.size());
    const double efficiency = m.boundingBox.area > 0.0 ? m.netArea / m.boundingBox.area : 0.0;
    m.efficiency = std::round(efficiency * 100.0) / 100.0;
    return m;
}

FloorplanSummary computeFloorplanSummary(const std::vector<std::vector<RoomFootprint>>& floors) noexcept {
    FloorplanSummary s;
    for (const auto& rooms : floors) {
        const FloorMetrics m = computeFloorMetrics(rooms);
        s.grossFloorArea += m.netArea;
        s.totalRoomCount += m.roomCount;
    }
    s.floorCount = static_cast<int>(floors.size());
    return s;
}

std::string formatArea(double area, AreaUnit unit) {
    return formatNumber(std::round(area * 100.0) / 100.0) + " " + toString(unit);
}

std::string formatEfficiency(double efficiency) {
    return formatNumber(std::round(efficiency * 100.0)) + "%";
}

} // namespace floorplan
