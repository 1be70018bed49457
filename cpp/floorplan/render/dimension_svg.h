#ifndef FLOORPLAN_DIMENSION_SVG_H
#define FLOORPLAN_DIMENSION_SVG_H

#include "floorplan/render/render_options.h"
#include "floorplan/render/svg_builder.h"

#include <string>
#include <vector>

namespace floorplan {

struct DimensionStyle {
    std::vector<DimensionType> types{DimensionType::Width, DimensionType::Depth};
    double offset{0.8};        // distance from the room edge
    double tickLength{0.3};
    double fontSize{0.5};
    double defaultHeight{3.0}; // height labels are only drawn for other values
    LengthUnit lengthUnit{LengthUnit::Ft};
};

// "12ft" for integral values, one decimal otherwise.
std::string formatDimensionValue(double value, LengthUnit unit);

// Line with end ticks and a rotated, upright label. Lines shorter than 0.1 are skipped.
void generateDimensionLine(
    SvgBuilder& svg,
    double x1,
    double y1,
    double x2,
    double y2,
    double value,
    const DimensionStyle& style);

// Width above and depth left of a resolved top-level room, plus an optional height note.
void generateRoomDimensions(SvgBuilder& svg, const Room& room, const FloorScene& scene, const DimensionStyle& style);

void generateFloorDimensions(SvgBuilder& svg, const FloorScene& scene, const DimensionStyle& style);

} // namespace floorplan

#endif // FLOORPLAN_DIMENSION_SVG_H
