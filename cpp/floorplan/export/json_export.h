#ifndef FLOORPLAN_JSON_EXPORT_H
#define FLOORPLAN_JSON_EXPORT_H

#include "floorplan/model.h"
#include "floorplan/geometry/wall_geometry.h"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace floorplan {

using Json = nlohmann::ordered_json;

// A floor left out of the export because its rooms could not be placed.
struct JsonExportError {
    std::string message;
    std::string floor;
};

struct JsonExportResult {
    Json data;
    std::vector<JsonExportError> errors;
};

/**
 * Serialize a resolved model.
 *
 * Top-level keys, in order: grammarVersion, floors, connections,
 * verticalConnections, styles, config (only when the document sets any),
 * summary. The second planar axis is written as `z`. Stair lengths are
 * normalized to the document's default unit.
 */
JsonExportResult exportJson(const ResolvedModel& model);

Json configToJson(const Floorplan& floorplan);
Json styleToJson(const StyleDef& style);
Json wallToJson(const WallSpec& wall);
Json metricsToJson(const FloorMetrics& metrics);
Json summaryToJson(const FloorplanSummary& summary);
Json liftToJson(const Lift& lift);

// nullopt for connections to the outside.
std::optional<Json> connectionToJson(const Connection& connection);

// Where a flight hugging `ref` starts and which way it climbs.
std::optional<Json> wallAlignedPosition(
    const WallRef& ref,
    const std::map<std::string, RoomBounds>& rooms,
    double stairWidth);

Json stairShapeToJson(
    const StairShape& shape,
    const std::map<std::string, RoomBounds>& rooms,
    double stairWidth,
    LengthUnit unit);

Json stairToJson(const Stair& stair, const std::map<std::string, RoomBounds>& rooms, LengthUnit unit);

} // namespace floorplan

#endif // FLOORPLAN_JSON_EXPORT_H
