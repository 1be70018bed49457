#ifndef FLOORPLAN_VARIABLES_H
#define FLOORPLAN_VARIABLES_H

#include "floorplan/types.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace floorplan {

// Variable name -> resolved dimension. Ordered so every consumer iterates deterministically.
using VariableMap = std::map<std::string, ResolvedSize>;

struct VariableResolution {
    VariableMap variables;
    std::map<std::string, double> config;            // numeric config entries by raw key
    std::map<std::string, ResolvedSize> configSizes;  // door_size / window_size
    std::optional<LengthUnit> defaultUnit;
    std::vector<ResolutionError> errors;              // duplicate_definition
};

// Collect defines and numeric config. A name defined twice keeps its first value.
VariableResolution resolveVariables(const Floorplan& floorplan);

// Reports undefined_variable for every sizeRef (including sub-rooms) missing from `variables`.
std::vector<ResolutionError> validateSizeReferences(const Floorplan& floorplan, const VariableMap& variables);

// Inline size, else the referenced variable, else nullopt.
std::optional<ResolvedSize> findRoomSize(const Room& room, const VariableMap& variables);

// Same as findRoomSize but throws std::runtime_error when the size cannot be
// determined. Callers validate first.
ResolvedSize getRoomSize(const Room& room, const VariableMap& variables);

struct ResolvedDimensions {
    double wallThickness;
    double doorWidth;
    double doorHeight;
    double windowWidth;
    double windowHeight;
    double defaultHeight;
};

// Door/window/wall defaults with door_size and window_size taking precedence
// over the separate width/height keys.
ResolvedDimensions getResolvedConfig(const VariableResolution& resolution);

} // namespace floorplan

#endif // FLOORPLAN_VARIABLES_H
