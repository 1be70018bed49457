#include "floorplan/variables.h"
#include "floorplan/core/logging.h"
#include "floorplan/units.h"

#include <stdexcept>

namespace floorplan {

namespace {

constexpr double kDefaultWallThickness = 0.2;
constexpr double kDefaultDoorWidth = 1.0;
constexpr double kDefaultDoorHeight = 2.1;
constexpr double kDefaultWindowWidth = 1.5;
constexpr double kDefaultWindowHeight = 1.5;
constexpr double kDefaultRoomHeight = 3.0;

ResolvedSize toResolvedSize(const Dimension& d) {
    return ResolvedSize{d.width.value, d.height.value};
}

void validateRoomSizeRef(const Room& room, const VariableMap& variables, std::vector<ResolutionError>& errors) {
    if (room.sizeRef && variables.find(*room.sizeRef) == variables.end()) {
        errors.push_back(ResolutionError{
            ResolutionErrorKind::UndefinedVariable,
            room.name,
            "Room '" + room.name + "' references undefined variable '" + *room.sizeRef + "'"});
    }
    for (const Room& sub : room.subRooms) {
        validateRoomSizeRef(sub, variables, errors);
    }
}

double configOr(const std::map<std::string, double>& config, const char* key, double fallback) {
    const auto it = config.find(key);
    return it == config.end() ? fallback : it->second;
}

} // namespace

VariableResolution resolveVariables(const Floorplan& floorplan) {
    VariableResolution out;

    for (const VariableDef& def : floorplan.variables) {
        if (out.variables.find(def.name) != out.variables.end()) {
            FLOORPLAN_LOG_WARN("duplicate variable '%s' ignored", def.name.c_str());
            out.errors.push_back(ResolutionError{
                ResolutionErrorKind::DuplicateDefinition,
                def.name,
                "Variable '" + def.name + "' is defined multiple times"});
            continue;
        }
        out.variables.emplace(def.name, toResolvedSize(def.size));
    }

    for (const ConfigProperty& prop : floorplan.config) {
        if (const auto* number = std::get_if<double>(&prop.value)) {
            out.config[prop.name] = *number;
        } else if (const auto* dim = std::get_if<Dimension>(&prop.value)) {
            out.configSizes[prop.name] = toResolvedSize(*dim);
        } else if (const auto* text = std::get_if<std::string>(&prop.value)) {
            if (prop.name == "default_unit") {
                out.defaultUnit = parseLengthUnit(*text);
            }
        }
    }

    return out;
}

std::vector<ResolutionError> validateSizeReferences(const Floorplan& floorplan, const VariableMap& variables) {
    std::vector<ResolutionError> errors;
    for (const Floor& floor : floorplan.floors) {
        for (const Room& room : floor.rooms) {
            validateRoomSizeRef(room, variables, errors);
        }
    }
    return errors;
}

std::optional<ResolvedSize> findRoomSize(const Room& room, const VariableMap& variables) {
    if (room.size) return toResolvedSize(*room.size);
    if (room.sizeRef) {
        const auto it = variables.find(*room.sizeRef);
        if (it != variables.end()) return it->second;
    }
    return std::nullopt;
}

ResolvedSize getRoomSize(const Room& room, const VariableMap& variables) {
    if (auto size = findRoomSize(room, variables)) return *size;
    if (room.sizeRef) {
        throw std::runtime_error("Room '" + room.name + "' uses variable '" + *room.sizeRef + "' which is not defined");
    }
    throw std::runtime_error("Room '" + room.name + "' has no size defined");
}

ResolvedDimensions getResolvedConfig(const VariableResolution& resolution) {
    ResolvedDimensions dims{};
    dims.wallThickness = configOr(resolution.config, "wall_thickness", kDefaultWallThickness);
    dims.defaultHeight = configOr(resolution.config, "default_height", kDefaultRoomHeight);

    const auto door = resolution.configSizes.find("door_size");
    if (door != resolution.configSizes.end()) {
        dims.doorWidth = door->second.width;
        dims.doorHeight = door->second.height;
    } else {
        dims.doorWidth = configOr(resolution.config, "door_width", kDefaultDoorWidth);
        dims.doorHeight = configOr(resolution.config, "door_height", kDefaultDoorHeight);
    }

    const auto window = resolution.configSizes.find("window_size");
    if (window != resolution.configSizes.end()) {
        dims.windowWidth = window->second.width;
        dims.windowHeight = window->second.height;
    } else {
        dims.windowWidth = configOr(resolution.config, "window_width", kDefaultWindowWidth);
        dims.windowHeight = configOr(resolution.config, "window_height", kDefaultWindowHeight);
    }
    return dims;
}

} // namespace floorplan
