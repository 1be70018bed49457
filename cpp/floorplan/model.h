#ifndef FLOORPLAN_MODEL_H
#define FLOORPLAN_MODEL_H

#include "floorplan/types.h"
#include "floorplan/config.h"
#include "floorplan/metrics.h"
#include "floorplan/variables.h"
#include "floorplan/position/position_resolver.h"
#include "floorplan/style/style_resolver.h"
#include "floorplan/style/theme.h"
#include "floorplan/version/version_resolver.h"

#include <string>
#include <vector>

namespace floorplan {

/**
 * A document after every resolution stage has run once.
 *
 * The model borrows the floorplan it was built from (the style context points
 * into it as well), so the floorplan must outlive the model. JSON and SVG
 * emitters read the model and never resolve again.
 */
struct ResolvedModel {
    const Floorplan* floorplan{nullptr};
    VersionResolution version;
    VariableResolution variables;
    ResolvedConfig config;
    style::ThemeOptions theme;
    style::StyleContext styles;
    FloorPositions positions;               // one entry per floor, declared order

    std::vector<ResolutionError> errors;    // variables, size references, positions
    std::vector<Warning> warnings;          // version, deprecation, overlap, validation
    std::vector<std::string> versionErrors; // unusable version or removed features
};

struct PlacedRoomFootprint {
    const Room* room;
    RoomFootprint footprint;
};

// Top-level rooms of a floor that have both a resolved position and a known size,
// in declaration order.
std::vector<PlacedRoomFootprint> collectPlacedRooms(
    const Floor& floor,
    const PositionResolution& resolution,
    const VariableMap& variables);

std::vector<RoomFootprint> collectFloorFootprints(
    const Floor& floor,
    const PositionResolution& resolution,
    const VariableMap& variables);

FloorMetrics computeFloorMetricsFor(const ResolvedModel& model, std::size_t floorIndex);

} // namespace floorplan

#endif // FLOORPLAN_MODEL_H
