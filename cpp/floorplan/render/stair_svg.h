#ifndef FLOORPLAN_STAIR_SVG_H
#define FLOORPLAN_STAIR_SVG_H

#include "floorplan/render/render_options.h"
#include "floorplan/render/svg_builder.h"
#include "floorplan/stairs/stair_geometry.h"

#include <string>

namespace floorplan {

struct CirculationStyle {
    std::string strokeColor{"#666"};
    std::string fillColor{"#f0f0f0"};
    double strokeWidth{0.05};
};

// Plan symbol for one stair shape, in stair-local coordinates.
void generateStairShapeSvg(
    SvgBuilder& svg,
    const StairShape& shape,
    const StairDimensions& dims,
    const CirculationStyle& style);

// Stair group translated to its explicit position (origin when unset).
void generateStairSvg(SvgBuilder& svg, const Stair& stair, const FloorScene& scene, const CirculationStyle& style);

// Shaft with crossed diagonals, door indicators and an "E" marker.
void generateLiftSvg(SvgBuilder& svg, const Lift& lift, const FloorScene& scene, const CirculationStyle& style);

// All stairs, then all lifts, of the scene's floor.
void generateFloorCirculation(SvgBuilder& svg, const FloorScene& scene, const CirculationStyle& style = CirculationStyle{});

} // namespace floorplan

#endif // FLOORPLAN_STAIR_SVG_H
