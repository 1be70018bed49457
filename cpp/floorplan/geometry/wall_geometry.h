#ifndef FLOORPLAN_WALL_GEOMETRY_H
#define FLOORPLAN_WALL_GEOMETRY_H

#include "floorplan/types.h"
#include "floorplan/variables.h"
#include "floorplan/position/position_resolver.h"
#include <optional>
#include <string_view>

namespace floorplan {

constexpr double kWallThickness = 0.2;
constexpr double kDefaultDoorWidth = 2.0;
constexpr double kDefaultConnectionPosition = 50.0;
constexpr double kAdjacencyTolerance = 0.5;

// Axis-aligned room rectangle (y is the second planar axis, z in JSON).
struct RoomBounds {
    double x{0.0};
    double y{0.0};
    double width{0.0};
    double height{0.0};
};

struct WallBounds {
    double x{0.0};
    double y{0.0};
    double length{0.0};
    bool isHorizontal{true};
};

struct WallOverlap {
    double start{0.0};
    double end{0.0};
    double length{0.0};
};

struct WallPair {
    WallDirection fromWall;
    WallDirection toWall;
};

// Door/opening rectangle on a wall. width > height on horizontal walls.
struct ConnectionPoint {
    double x{0.0};
    double y{0.0};
    double width{0.0};
    double height{0.0};
    WallDirection wallDirection{WallDirection::Top};
};

inline bool isHorizontalWall(WallDirection d) noexcept {
    return d == WallDirection::Top || d == WallDirection::Bottom;
}

WallBounds getWallBounds(const RoomBounds& room, WallDirection direction) noexcept;

// 1-D intersection of two rooms along the wall axis (y for vertical walls).
std::optional<WallOverlap> calculateWallOverlap(const RoomBounds& source, const RoomBounds& target, bool isVertical) noexcept;

// Absolute coordinate at `percent` of the shared segment.
std::optional<double> calculatePositionOnOverlap(
    const RoomBounds& source, const RoomBounds& target, bool isVertical, double percent) noexcept;

// As above, but falls back to `percent` of the source room's full wall when
// there is no target or no shared segment.
double calculatePositionWithFallback(
    const RoomBounds& source, const RoomBounds* target, bool isVertical, double percent) noexcept;

// Shared interval of two wall segments. nullopt for mixed orientation or an empty interval.
std::optional<WallOverlap> calculateWallBoundsOverlap(const WallBounds& a, const WallBounds& b) noexcept;

// Adjacency within kAdjacencyTolerance: right/left first, then bottom/top.
std::optional<WallPair> inferWallDirection(const RoomBounds& from, const RoomBounds& to) noexcept;

/**
 * Place a connection of `doorWidth` at `percent` along the walls.
 *
 * Same-orientation walls use their shared segment and fall back to the source
 * wall when none exists. Mixed orientation anchors to whichever wall is
 * horizontal, so swapping the endpoints can move the door.
 */
ConnectionPoint calculateConnectionPoint(
    const RoomBounds& fromRoom,
    WallDirection fromWall,
    const RoomBounds& toRoom,
    WallDirection toWall,
    double percent,
    double doorWidth) noexcept;

// =============================================================================
// Floor lookups
// =============================================================================

// Top-level rooms and their direct sub-rooms.
const Room* findRoom(const Floor& floor, std::string_view name) noexcept;

// Resolved (else explicit) position plus size. nullopt when either is unknown.
std::optional<RoomBounds> getRoomBounds(const Room& room, const PositionMap& positions, const VariableMap& variables);

// Explicit swing, else derived from opensInto (from-room -> left, other -> right).
std::optional<SwingDirection> resolveSwing(const Connection& connection);

struct PlacedConnection {
    const Connection* connection{nullptr};
    WallDirection fromWall{WallDirection::Top};
    WallDirection toWall{WallDirection::Top};
    ConnectionPoint point;
    std::optional<SwingDirection> swing;
};

// Geometry for a room-to-room connection on `floor`. nullopt for outside
// endpoints, rooms not on this floor, unresolved rooms or uninferable walls.
std::optional<PlacedConnection> placeConnection(
    const Connection& connection,
    const Floor& floor,
    const PositionMap& positions,
    const VariableMap& variables);

} // namespace floorplan

#endif // FLOORPLAN_WALL_GEOMETRY_H
