#include "floorplan/geometry/door_geometry.h"

#include <algorithm>

namespace floorplan {

DoorLeaf computeDoorLeaf(
    double x,
    double y,
    double doorWidth,
    double wallThickness,
    bool isHorizontal,
    WallDirection wall,
    SwingDirection swing) noexcept {
    DoorLeaf leaf;
    leaf.radius = doorWidth * kDoorSwingRatio;
    const bool left = swing == SwingDirection::Left;

    if (isHorizontal) {
        const double cy = y + wallThickness / 2.0;
        const bool opensDown = wall == WallDirection::Top;
        leaf.hingeX = left ? x + doorWidth : x;
        leaf.hingeY = cy;
        leaf.panelEndX = leaf.hingeX;
        leaf.panelEndY = opensDown ? cy + leaf.radius : cy - leaf.radius;
        leaf.arcEndX = left ? x : x + doorWidth;
        leaf.arcEndY = cy;
        leaf.sweep = (opensDown == left) ? 1 : 0;
        return leaf;
    }

    const double cx = x + wallThickness / 2.0;
    const bool opensRight = wall == WallDirection::Left;
    // Right walls invert the hinge side relative to left walls.
    const bool hingeAtBottom = opensRight ? left : !left;
    leaf.hingeX = cx;
    leaf.hingeY = hingeAtBottom ? y + doorWidth : y;
    leaf.panelEndX = opensRight ? cx + leaf.radius : cx - leaf.radius;
    leaf.panelEndY = leaf.hingeY;
    leaf.arcEndX = cx;
    leaf.arcEndY = hingeAtBottom ? y : y + doorWidth;
    leaf.sweep = left ? 0 : 1;
    return leaf;
}

DoorLeaf computeDoorLeafForRect(const Rect& rect, WallDirection wall, SwingDirection swing) noexcept {
    const bool isHorizontal = rect.width > rect.height;
    const double doorWidth = isHorizontal ? rect.width : rect.height;
    const double thickness = isHorizontal ? rect.height : rect.width;
    return computeDoorLeaf(rect.x, rect.y, doorWidth, thickness, isHorizontal, wall, swing);
}

std::array<DoorLeaf, 2> computeDoubleDoorLeaves(const Rect& rect, WallDirection wall) noexcept {
    const bool isHorizontal = rect.width > rect.height;
    const double doorWidth = isHorizontal ? rect.width : rect.height;
    const double thickness = isHorizontal ? rect.height : rect.width;
    const double half = doorWidth / 2.0;
    const double leafWidth = half - kDoubleDoorGap;

    if (isHorizontal) {
        return {
            computeDoorLeaf(rect.x, rect.y, leafWidth, thickness, true, wall, SwingDirection::Right),
            computeDoorLeaf(rect.x + half + kDoubleDoorGap, rect.y, leafWidth, thickness, true, wall, SwingDirection::Left)};
    }
    return {
        computeDoorLeaf(rect.x, rect.y, leafWidth, thickness, false, wall, SwingDirection::Right),
        computeDoorLeaf(rect.x, rect.y + half + kDoubleDoorGap, leafWidth, thickness, false, wall, SwingDirection::Left)};
}

Rect computeWindowRect(const Rect& wall) noexcept {
    const double cx = wall.x + wall.width / 2.0;
    const double cy = wall.y + wall.height / 2.0;
    Rect out;
    if (wall.width > wall.height) {
        out.width = std::min(wall.width * 0.8, wall.width - 0.2);
        out.height = kWindowDepth;
    } else {
        out.width = kWindowDepth;
        out.height = std::min(wall.height * 0.8, wall.height - 0.2);
    }
    out.x = cx - out.width / 2.0;
    out.y = cy - out.height / 2.0;
    return out;
}

Rect computeLiftDoorRect(WallDirection side, double width, double height) noexcept {
    const double doorWidth = std::min(width, height) * 0.6;
    switch (side) {
        case WallDirection::Top:
            return Rect{(width - doorWidth) / 2.0, 0.0, doorWidth, kLiftDoorDepth};
        case WallDirection::Bottom:
            return Rect{(width - doorWidth) / 2.0, height - kLiftDoorDepth, doorWidth, kLiftDoorDepth};
        case WallDirection::Right:
            return Rect{width - kLiftDoorDepth, (height - doorWidth) / 2.0, kLiftDoorDepth, doorWidth};
        case WallDirection::Left:
            return Rect{0.0, (height - doorWidth) / 2.0, kLiftDoorDepth, doorWidth};
    }
    return Rect{};
}

} // namespace floorplan
