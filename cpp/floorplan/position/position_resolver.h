#ifndef FLOORPLAN_POSITION_RESOLVER_H
#define FLOORPLAN_POSITION_RESOLVER_H

#include "floorplan/types.h"
#include "floorplan/variables.h"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace floorplan {

// Edge-touching rooms closer than this are not reported as overlapping.
constexpr double kOverlapTolerance = 0.01;

using PositionMap = std::map<std::string, ResolvedPosition>;

struct OverlapWarning {
    std::string room1;
    std::string room2;
    std::string message;
};

struct PositionResolution {
    PositionMap positions;
    std::vector<std::string> resolvedOrder;   // order in which rooms were resolved
    std::vector<ResolutionError> errors;
    std::vector<OverlapWarning> warnings;
    int passes{0};                            // fixed-point passes actually run
    int passBudget{0};                        // |pending| + 1
};

/**
 * Resolve absolute positions for every top-level room of `floor`.
 *
 * Explicit coordinates are taken as-is. Relative placements are solved by a
 * bounded fixed-point iteration (at most |pending| + 1 passes) in declared
 * room order; a pass without progress marks every remaining room as part of
 * a circular dependency. Overlaps between resolved rooms are warnings.
 */
PositionResolution resolveFloorPositions(const Floor& floor, const VariableMap& variables);

// Floor id -> resolution, in floor declaration order.
using FloorPositions = std::vector<std::pair<std::string, PositionResolution>>;

FloorPositions resolveAllPositions(
    const Floorplan& floorplan,
    const VariableMap& variables);

// Position for a room from the resolved map, else its explicit coordinate.
std::optional<ResolvedPosition> getResolvedPosition(
    const Room& room,
    const PositionMap& positions);

// Placement of a room relative to an already positioned reference.
ResolvedPosition computeRelativePosition(
    const RelativePosition& rel,
    const ResolvedPosition& refPos,
    const ResolvedSize& refSize,
    const ResolvedSize& size) noexcept;

} // namespace floorplan

#endif // FLOORPLAN_POSITION_RESOLVER_H
