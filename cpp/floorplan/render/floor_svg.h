#ifndef FLOORPLAN_FLOOR_SVG_H
#define FLOORPLAN_FLOOR_SVG_H

#include "floorplan/metrics.h"
#include "floorplan/render/render_options.h"
#include "floorplan/render/svg_builder.h"

namespace floorplan {

// Space reserved under a stair or lift that carries a label.
constexpr double kCirculationLabelSpace = 0.8;

struct FloorBounds {
    double minX{0.0};
    double minY{0.0};
    double maxX{0.0};
    double maxY{0.0};
    double width{0.0};
    double height{0.0};
};

/**
 * Extent of everything drawn on a floor: positioned top-level rooms, and
 * stairs and lifts with explicit positions (plus label space). All zeros when
 * nothing is positioned.
 */
FloorBounds calculateFloorBounds(const FloorScene& scene);

void generateFloorRectangle(SvgBuilder& svg, const FloorBounds& bounds);

// Metrics box drawn one unit below the floor, in the coordinates of the enclosing group.
void generateFloorSummaryPanel(
    SvgBuilder& svg,
    const FloorMetrics& metrics,
    const FloorBounds& bounds,
    double offsetX,
    double offsetY,
    AreaUnit areaUnit);

} // namespace floorplan

#endif // FLOORPLAN_FLOOR_SVG_H
