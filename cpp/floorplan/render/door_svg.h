#ifndef FLOORPLAN_DOOR_SVG_H
#define FLOORPLAN_DOOR_SVG_H

#include "floorplan/geometry/door_geometry.h"
#include "floorplan/render/svg_builder.h"

#include <optional>
#include <string>

namespace floorplan {

// "M hx hy L px py A r r 0 0 sweep ax ay"
std::string doorLeafPath(const DoorLeaf& leaf);

/**
 * Door symbol for an opening rect on `wall`.
 *
 * Openings are a plain white gap, double doors a group of two leaves, single
 * doors one leaf. An unset swing draws the right-hand leaf and is tagged
 * data-swing="default".
 */
void generateDoor(
    SvgBuilder& svg,
    const Rect& rect,
    WallDirection wall,
    DoorType type,
    std::optional<SwingDirection> swing);

// Glazing line centered in a wall rect.
void generateWindow(SvgBuilder& svg, const Rect& wallRect, WallDirection wall);

} // namespace floorplan

#endif // FLOORPLAN_DOOR_SVG_H
