#ifndef FLOORPLAN_VALIDATOR_H
#define FLOORPLAN_VALIDATOR_H

#include "floorplan/types.h"
#include "floorplan/config.h"
#include "floorplan/variables.h"
#include "floorplan/position/position_resolver.h"
#include "floorplan/geometry/wall_geometry.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace floorplan {

// Shared-boundary tolerance for connection checks; adjacency uses kAdjacencyTolerance.
constexpr double kSharedBoundaryTolerance = 0.1;
constexpr double kDefaultRoomHeightM = 3.35;
constexpr double kVerticalAlignmentTolerance = 0.5;

// Approximate share of a wall taken by a door, for overlap detection (percent).
constexpr double kDoorWidthPercent = 10.0;
constexpr double kDoubleDoorWidthPercent = 20.0;

// Everything the checks read. Nothing here is owned.
struct ValidationContext {
    const Floorplan& floorplan;
    const VariableMap& variables;
    const ResolvedConfig& config;
    const FloorPositions& positions;
};

// Start/end ratios (0..1) along the from-room's wall.
struct SharedSegment {
    double start{0.0};
    double end{1.0};
};

struct SharedWall {
    WallDirection wallA;
    WallDirection wallB;
};

// Stair limits, all in inches. A zero bound is not checked.
struct StairCodeLimits {
    double maxRiser{0.0};
    double minRiser{0.0};
    double minTread{0.0};
    double minWidth{0.0};
    double minHeadroom{0.0};
};

std::optional<StairCodeLimits> stairCodeLimits(StairCode code) noexcept;

// Resolved (else explicit, else origin) bounds of every sized room on a floor,
// sub-rooms included, keyed by name.
std::map<std::string, RoomBounds> computeValidationBounds(
    const Floor& floor,
    const PositionMap* positions,
    const VariableMap& variables);

std::optional<SharedSegment> calculateSharedWallSegment(
    const RoomBounds& fromBounds,
    std::optional<WallDirection> fromWall,
    const RoomBounds& toBounds,
    std::optional<WallDirection> toWall) noexcept;

// Touching walls of two rooms (kAdjacencyTolerance): right/left, left/right, bottom/top, top/bottom.
std::optional<SharedWall> findSharedWall(const RoomBounds& a, const RoomBounds& b) noexcept;

// Room height in meters: room, floor, config default_height, then 3.35.
double getRoomHeightMeters(const Room& room, const Floor& floor, const ValidationContext& ctx);

// Individual checks. Each appends to `out`.
void checkConnectionOverlaps(const ValidationContext& ctx, std::vector<Warning>& out);
void checkConnectionWallTypes(const ValidationContext& ctx, std::vector<Warning>& out);
void checkStyleReferences(const ValidationContext& ctx, std::vector<Warning>& out);
void checkDuplicateStyles(const ValidationContext& ctx, std::vector<Warning>& out);
void checkSharedWallConflicts(const ValidationContext& ctx, std::vector<Warning>& out);
void checkMixedUnitSystems(const ValidationContext& ctx, std::vector<Warning>& out);
void checkRoomHeightExceedsFloor(const ValidationContext& ctx, std::vector<Warning>& out);
void checkSharedBoundary(const ValidationContext& ctx, std::vector<Warning>& out);
void checkConnectionSize(const ValidationContext& ctx, std::vector<Warning>& out);
void checkConflictingSizeConfig(const ValidationContext& ctx, std::vector<Warning>& out);
void checkBuildingCode(const ValidationContext& ctx, std::vector<Warning>& out);
void checkVerticalConnections(const ValidationContext& ctx, std::vector<Warning>& out);

/**
 * Run every advisory check in a fixed order and return the findings.
 *
 * Validation never fails the conversion; positions are taken from an earlier
 * resolution so rooms are not resolved twice.
 */
std::vector<Warning> validateFloorplan(const ValidationContext& ctx);

} // namespace floorplan

#endif // FLOORPLAN_VALIDATOR_H
