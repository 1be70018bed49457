#ifndef FLOORPLAN_DOOR_GEOMETRY_H
#define FLOORPLAN_DOOR_GEOMETRY_H

#include "floorplan/types.h"
#include <array>

namespace floorplan {

constexpr double kDoorSwingRatio = 0.85;
constexpr double kDoubleDoorGap = 0.05;
constexpr double kWindowDepth = 0.1;
constexpr double kLiftDoorDepth = 0.15;

struct Rect {
    double x{0.0};
    double y{0.0};
    double width{0.0};
    double height{0.0};
};

/**
 * One door leaf in plan view: the panel drawn in its open position from the
 * hinge, then an arc from the panel end back to the far edge of the opening.
 *
 * Hinge side follows a "facing into the room" convention. On top and left
 * walls `Right` hinges at the low-coordinate edge; bottom walls mirror the
 * panel direction and right walls mirror the hinge side.
 */
struct DoorLeaf {
    double hingeX{0.0};
    double hingeY{0.0};
    double panelEndX{0.0};
    double panelEndY{0.0};
    double radius{0.0};
    int sweep{0};
    double arcEndX{0.0};
    double arcEndY{0.0};
};

DoorLeaf computeDoorLeaf(
    double x,
    double y,
    double doorWidth,
    double wallThickness,
    bool isHorizontal,
    WallDirection wall,
    SwingDirection swing) noexcept;

// Leaf geometry for a door rect (width > height means a horizontal wall).
DoorLeaf computeDoorLeafForRect(const Rect& rect, WallDirection wall, SwingDirection swing) noexcept;

// Two half-width leaves separated by kDoubleDoorGap: the first swings right, the second left.
std::array<DoorLeaf, 2> computeDoubleDoorLeaves(const Rect& rect, WallDirection wall) noexcept;

// Window glazing centered on a wall rect: min(0.8*len, len-0.2) long, kWindowDepth deep.
Rect computeWindowRect(const Rect& wall) noexcept;

// Lift door indicator on the shaft's `side`, in shaft-local coordinates.
Rect computeLiftDoorRect(WallDirection side, double width, double height) noexcept;

} // namespace floorplan

#endif // FLOORPLAN_DOOR_GEOMETRY_H
