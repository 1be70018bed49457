#ifndef FLOORPLAN_STAIR_GEOMETRY_H
#define FLOORPLAN_STAIR_GEOMETRY_H

#include "floorplan/types.h"
#include "floorplan/geometry/door_geometry.h"
#include <vector>

namespace floorplan {

// Defaults, expressed in the floorplan's default unit after conversion.
constexpr double kDefaultStairWidthFt = 3.0;
constexpr double kDefaultStairRiseFt = 10.0;
constexpr double kStandardRiserIn = 7.0;
constexpr double kStandardTreadIn = 11.0;

// Footprint and derived step data for one stair, all in `unit`.
struct StairDimensions {
    double width{0.0};        // footprint along x
    double height{0.0};       // footprint along y
    WallDirection direction{WallDirection::Top}; // climb direction (straight) or entry side
    int stepCount{0};
    double stairWidth{0.0};
    double rise{0.0};
    double riser{0.0};
    double tread{0.0};
    std::vector<int> runs;    // steps per run for multi-run shapes
    double landingWidth{0.0};
    double landingHeight{0.0};
    LengthUnit unit{LengthUnit::Ft};
};

struct StairPart {
    enum class Kind : std::uint8_t { Flight, Landing };
    Kind kind{Kind::Flight};
    Rect rect;
    WallDirection direction{WallDirection::Top}; // travel direction while on this part
    int steps{0};
};

// Converts `len` into `unit`, or returns `fallback` (already in `unit`) when absent.
double normalizeLength(const std::optional<Length>& len, double fallback, LengthUnit unit) noexcept;

int computeStepCount(double rise, double riser) noexcept;

// Runs as declared, else an even split of `stepCount` over `parts` runs (remainder last).
std::vector<int> splitRuns(const std::vector<int>& declared, int stepCount, std::size_t parts);

StairDimensions calculateStairDimensions(const Stair& stair, LengthUnit unit);

// Width/height used for floor bounds and code checks.
ResolvedSize getStairBoundingBox(const Stair& stair, LengthUnit unit);

WallDirection applyTurn(WallDirection current, TurnDirection turn) noexcept;

/**
 * Walk a custom stair: flights extend in the travel direction, turns place a
 * landing and rotate the travel direction. Parts are translated so the
 * footprint starts at (0, 0).
 */
std::vector<StairPart> layoutSegmentedStair(
    const SegmentedStair& shape,
    double stairWidth,
    double tread,
    LengthUnit unit);

// Shape type name used by JSON export.
const char* stairShapeName(const StairShape& shape) noexcept;

} // namespace floorplan

#endif // FLOORPLAN_STAIR_GEOMETRY_H
