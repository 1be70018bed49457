#ifndef FLOORPLAN_METRICS_H
#define FLOORPLAN_METRICS_H

#include "floorplan/config.h"

#include <optional>
#include <string>
#include <vector>

namespace floorplan {

// A resolved room as seen by the metrics: position, footprint and optional ceiling height.
struct RoomFootprint {
    double x{0.0};
    double y{0.0};
    double width{0.0};
    double height{0.0};
    std::optional<double> roomHeight;
};

struct RoomMetrics {
    double area{0.0};
    std::optional<double> volume; // only when roomHeight is known
};

struct BoundingBox {
    double width{0.0};
    double height{0.0};
    double area{0.0};
    double minX{0.0};
    double minY{0.0};
};

struct FloorMetrics {
    double netArea{0.0};
    BoundingBox boundingBox;
    int roomCount{0};
    double efficiency{0.0}; // netArea / boundingBox.area, two decimals
};

struct FloorplanSummary {
    double grossFloorArea{0.0};
    int totalRoomCount{0};
    int floorCount{0};
};

RoomMetrics computeRoomMetrics(const RoomFootprint& room) noexcept;
BoundingBox computeBoundingBox(const std::vector<RoomFootprint>& rooms) noexcept;
FloorMetrics computeFloorMetrics(const std::vector<RoomFootprint>& rooms) noexcept;
FloorplanSummary computeFloorplanSummary(const std::vector<std::vector<RoomFootprint>>& floors) noexcept;

// "12.5 sqft": area rounded to two decimals.
std::string formatArea(double area, AreaUnit unit);
// 0.834 -> "83%"
std::string formatEfficiency(double efficiency);

} // namespace floorplan

#endif // FLOORPLAN_METRICS_H
