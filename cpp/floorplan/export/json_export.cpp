#include "floorplan/export/json_export.h"
#include "floorplan/core/logging.h"
#include "floorplan/core/string_utils.h"
#include "floorplan/stairs/stair_geometry.h"
#include "floorplan/units.h"

namespace floorplan {

namespace {

Json landingToJson(const Landing& landing, LengthUnit unit) {
    return Json::array({lengthIn(landing.width, unit), lengthIn(landing.height, unit)});
}

void putLength(Json& obj, const char* key, const std::optional<Length>& len, LengthUnit unit) {
    if (len) obj[key] = lengthIn(*len, unit);
}

void putString(Json& obj, const char* key, const std::optional<std::string>& value) {
    if (value) obj[key] = *value;
}

struct ShapeWriter {
    const std::map<std::string, RoomBounds>& rooms;
    double stairWidth;
    LengthUnit unit;

    Json operator()(const StraightStair& s) const {
        Json j;
        j["type"] = "straight";
        j["direction"] = toString(s.direction);
        return j;
    }

    Json turning(const char* type, WallDirection entry, TurnDirection turn, const std::vector<int>& runs,
        const std::optional<Landing>& landing) const {
        Json j;
        j["type"] = type;
        j["entry"] = toString(entry);
        j["turn"] = toString(turn);
        if (!runs.empty()) j["runs"] = runs;
        if (landing) j["landing"] = landingToJson(*landing, unit);
        return j;
    }

    Json operator()(const LShapedStair& s) const {
        return turning("L-shaped", s.entry, s.turn, s.runs, s.landing);
    }

    Json operator()(const UShapedStair& s) const {
        return turning("U-shaped", s.entry, s.turn, s.runs, s.landing);
    }

    Json operator()(const DoubleLStair& s) const {
        return turning("double-L", s.entry, s.turn, s.runs, s.landing);
    }

    Json operator()(const SpiralStair& s) const {
        Json j;
        j["type"] = "spiral";
        j["rotation"] = toString(s.rotation);
        j["outerRadius"] = lengthIn(s.outerRadius, unit);
        putLength(j, "innerRadius", s.innerRadius, unit);
        return j;
    }

    Json operator()(const CurvedStair& s) const {
        Json j;
        j["type"] = "curved";
        j["entry"] = toString(s.entry);
        j["arc"] = s.arc;
        j["radius"] = lengthIn(s.radius, unit);
        return j;
    }

    Json operator()(const WinderStair& s) const {
        Json j;
        j["type"] = "winder";
        j["entry"] = toString(s.entry);
        j["turn"] = toString(s.turn);
        j["winders"] = s.winders;
        if (!s.runs.empty()) j["runs"] = s.runs;
        return j;
    }

    Json operator()(const SegmentedStair& s) const {
        Json j;
        j["type"] = "custom";
        j["entry"] = toString(s.entry);
        j["segments"] = Json::array();
        for (const StairSegment& segment : s.segments) {
            j["segments"].push_back(std::visit(*this, segment));
        }
        return j;
    }

    Json operator()(const FlightSegment& f) const {
        Json j;
        j["type"] = "flight";
        j["steps"] = f.steps;
        putLength(j, "width", f.width, unit);
        if (f.wallRef) {
            j["wallRef"] = Json{{"room", f.wallRef->room}, {"wall", toString(f.wallRef->wall)}};
            const double width = f.width ? lengthIn(*f.width, unit) : stairWidth;
            if (auto aligned = wallAlignedPosition(*f.wallRef, rooms, width)) {
                j["wallAlignedPosition"] = std::move(*aligned);
            }
        }
        return j;
    }

    Json operator()(const TurnSegment& t) const {
        Json j;
        j["type"] = "turn";
        j["direction"] = toString(t.direction);
        if (t.landing) j["landing"] = landingToJson(*t.landing, unit);
        if (t.winders) j["winders"] = *t.winders;
        if (t.angle) j["angle"] = *t.angle;
        return j;
    }
};

Json roomToJson(const Room& room, const RoomFootprint& fp) {
    Json j;
    j["name"] = room.name;
    putString(j, "label", room.label);
    j["x"] = fp.x;
    j["z"] = fp.y;
    j["width"] = fp.width;
    j["height"] = fp.height;
    j["walls"] = Json::array();
    for (const WallSpec& wall : room.walls) {
        j["walls"].push_back(wallToJson(wall));
    }
    if (room.height) j["roomHeight"] = room.height->value;
    if (room.elevation) j["elevation"] = room.elevation->value;
    putString(j, "style", room.styleRef);

    const RoomMetrics metrics = computeRoomMetrics(fp);
    j["area"] = metrics.area;
    if (metrics.volume) j["volume"] = *metrics.volume;
    return j;
}

} // namespace

Json configToJson(const Floorplan& floorplan) {
    Json config = Json::object();
    for (const ConfigProperty& prop : floorplan.config) {
        const std::string key = normalizeConfigKey(prop.name);

        if (const auto* number = std::get_if<double>(&prop.value)) {
            config[prop.name] = *number;
        } else if (const auto* dim = std::get_if<Dimension>(&prop.value)) {
            if (key == "doorSize") {
                config["door_size"] = Json::array({dim->width.value, dim->height.value});
            } else if (key == "windowSize") {
                config["window_size"] = Json::array({dim->width.value, dim->height.value});
            }
        } else if (const auto* flag = std::get_if<bool>(&prop.value)) {
            config[key] = *flag;
        } else if (const auto* text = std::get_if<std::string>(&prop.value)) {
            if (key == "defaultUnit") config["default_unit"] = *text;
            else if (key == "defaultStyle") config["default_style"] = *text;
            else if (key == "areaUnit") config["area_unit"] = *text;
            else if (key == "theme") config["theme"] = *text;
            else if (key == "fontFamily") config["fontFamily"] = stripQuotes(*text);
            else if (key == "stairCode") config["stair_code"] = *text;
        }
    }
    return config;
}

Json styleToJson(const StyleDef& style) {
    Json j;
    j["name"] = style.name;
    if (style.floorColor) j["floor_color"] = stripQuotes(*style.floorColor);
    if (style.wallColor) j["wall_color"] = stripQuotes(*style.wallColor);
    if (style.floorTexture) j["floor_texture"] = stripQuotes(*style.floorTexture);
    if (style.wallTexture) j["wall_texture"] = stripQuotes(*style.wallTexture);
    if (style.roughness) j["roughness"] = *style.roughness;
    if (style.metalness) j["metalness"] = *style.metalness;
    return j;
}

Json wallToJson(const WallSpec& wall) {
    Json j;
    j["direction"] = toString(wall.direction);
    j["type"] = toString(wall.type);
    if (wall.position) j["position"] = *wall.position;
    j["isPercentage"] = wall.isPercentage;
    if (wall.size) {
        j["width"] = wall.size->width.value;
        j["height"] = wall.size->height.value;
    }
    if (wall.wallHeight) j["wallHeight"] = *wall.wallHeight;
    return j;
}

Json metricsToJson(const FloorMetrics& metrics) {
    const BoundingBox& bb = metrics.boundingBox;
    Json j;
    j["netArea"] = metrics.netArea;
    j["boundingBox"] = Json{
        {"width", bb.width}, {"height", bb.height}, {"area", bb.area}, {"minX", bb.minX}, {"minY", bb.minY}};
    j["roomCount"] = metrics.roomCount;
    j["efficiency"] = metrics.efficiency;
    return j;
}

Json summaryToJson(const FloorplanSummary& summary) {
    Json j;
    j["grossFloorArea"] = summary.grossFloorArea;
    j["totalRoomCount"] = summary.totalRoomCount;
    j["floorCount"] = summary.floorCount;
    return j;
}

Json liftToJson(const Lift& lift) {
    Json j;
    j["name"] = lift.name;
    j["x"] = lift.position ? lift.position->x.value : 0.0;
    j["z"] = lift.position ? lift.position->y.value : 0.0;
    j["width"] = lift.size.width.value;
    j["height"] = lift.size.height.value;
    j["doors"] = Json::array();
    for (const WallDirection door : lift.doors) {
        j["doors"].push_back(toString(door));
    }
    putString(j, "label", lift.label);
    putString(j, "style", lift.styleRef);
    return j;
}

std::optional<Json> connectionToJson(const Connection& connection) {
    if (connection.from.room.empty() || connection.to.room.empty()) return std::nullopt;

    Json j;
    j["fromRoom"] = connection.from.room;
    j["fromWall"] = connection.from.wall ? toString(*connection.from.wall) : "unknown";
    j["toRoom"] = connection.to.room;
    j["toWall"] = connection.to.wall ? toString(*connection.to.wall) : "unknown";
    j["doorType"] = toString(connection.doorType);
    if (connection.position) j["position"] = *connection.position;
    if (connection.swing) j["swing"] = toString(*connection.swing);
    putString(j, "opensInto", connection.opensInto);

    if (connection.size) {
        j["width"] = connection.size->width.value;
        if (connection.size->fullHeight) {
            j["fullHeight"] = true;
        } else if (connection.size->height) {
            j["height"] = connection.size->height->value;
        }
    }
    return j;
}

std::optional<Json> wallAlignedPosition(
    const WallRef& ref,
    const std::map<std::string, RoomBounds>& rooms,
    double stairWidth) {
    const auto it = rooms.find(ref.room);
    if (it == rooms.end()) return std::nullopt;
    const RoomBounds& b = it->second;

    double x = b.x;
    double z = b.y;
    WallDirection climb = WallDirection::Bottom;
    switch (ref.wall) {
        case WallDirection::Top:
            climb = WallDirection::Bottom;
            break;
        case WallDirection::Bottom:
            z = b.y + b.height - stairWidth;
            climb = WallDirection::Top;
            break;
        case WallDirection::Left:
            climb = WallDirection::Right;
            break;
        case WallDirection::Right:
            x = b.x + b.width - stairWidth;
            climb = WallDirection::Left;
            break;
    }
    return Json{{"x", x}, {"z", z}, {"direction", toString(climb)}};
}

Json stairShapeToJson(
    const StairShape& shape,
    const std::map<std::string, RoomBounds>& rooms,
    double stairWidth,
    LengthUnit unit) {
    return std::visit(ShapeWriter{rooms, stairWidth, unit}, shape);
}

Json stairToJson(const Stair& stair, const std::map<std::string, RoomBounds>& rooms, LengthUnit unit) {
    const double stairWidth = stair.width ? lengthIn(*stair.width, unit) : 1.0;

    Json j;
    j["name"] = stair.name;
    j["x"] = stair.position ? stair.position->x.value : 0.0;
    j["z"] = stair.position ? stair.position->y.value : 0.0;
    j["shape"] = stairShapeToJson(stair.shape, rooms, stairWidth, unit);
    j["rise"] = normalizeLength(stair.rise, convertUnit(kDefaultStairRiseFt, LengthUnit::Ft, unit), unit);
    putLength(j, "width", stair.width, unit);
    putLength(j, "riser", stair.riser, unit);
    putLength(j, "tread", stair.tread, unit);
    putLength(j, "nosing", stair.nosing, unit);
    putLength(j, "headroom", stair.headroom, unit);
    if (stair.handrail) j["handrail"] = toString(*stair.handrail);
    if (stair.stringers) j["stringers"] = toString(*stair.stringers);
    if (!stair.material.empty()) {
        Json material = Json::object();
        for (const auto& [key, value] : stair.material) {
            material[key] = stripQuotes(value);
        }
        j["material"] = std::move(material);
    }
    putString(j, "label", stair.label);
    putString(j, "style", stair.styleRef);
    return j;
}

JsonExportResult exportJson(const ResolvedModel& model) {
    const Floorplan& floorplan = *model.floorplan;
    const VariableMap& variables = model.variables.variables;
    const LengthUnit unit = model.config.defaultUnit;

    JsonExportResult result;
    Json& out = result.data;
    out["grammarVersion"] = floorplan.version ? stripQuotes(*floorplan.version) : std::string(kCurrentVersionString);
    out["floors"] = Json::array();
    out["connections"] = Json::array();
    out["verticalConnections"] = Json::array();
    out["styles"] = Json::array();

    for (const StyleDef& style : floorplan.styles) {
        out["styles"].push_back(styleToJson(style));
    }

    Json config = configToJson(floorplan);
    if (!config.empty()) out["config"] = std::move(config);

    std::vector<std::vector<RoomFootprint>> exportedFloors;
    for (std::size_t i = 0; i < floorplan.floors.size(); ++i) {
        const Floor& floor = floorplan.floors[i];
        const PositionResolution& resolution = model.positions[i].second;

        if (!resolution.errors.empty()) {
            FLOORPLAN_LOG_WARN("floor %s omitted from export: %zu resolution errors",
                floor.id.c_str(), resolution.errors.size());
            for (const ResolutionError& err : resolution.errors) {
                result.errors.push_back(JsonExportError{err.message, floor.id});
            }
            continue;
        }

        Json jf;
        jf["id"] = floor.id;
        jf["index"] = i;
        jf["rooms"] = Json::array();
        jf["stairs"] = Json::array();
        jf["lifts"] = Json::array();

        std::vector<RoomFootprint> footprints;
        std::map<std::string, RoomBounds> roomBounds;
        for (const PlacedRoomFootprint& placed : collectPlacedRooms(floor, resolution, variables)) {
            const RoomFootprint& fp = placed.footprint;
            jf["rooms"].push_back(roomToJson(*placed.room, fp));
            footprints.push_back(fp);
            roomBounds[placed.room->name] = RoomBounds{fp.x, fp.y, fp.width, fp.height};
        }

        for (const Stair& stair : floor.stairs) {
            jf["stairs"].push_back(stairToJson(stair, roomBounds, unit));
        }
        for (const Lift& lift : floor.lifts) {
            jf["lifts"].push_back(liftToJson(lift));
        }
        if (floor.height) jf["height"] = floor.height->value;
        jf["metrics"] = metricsToJson(computeFloorMetrics(footprints));

        out["floors"].push_back(std::move(jf));
        exportedFloors.push_back(std::move(footprints));
    }

    for (const Connection& connection : floorplan.connections) {
        if (auto j = connectionToJson(connection)) {
            out["connections"].push_back(std::move(*j));
        }
    }

    for (const VerticalConnection& vc : floorplan.verticalConnections) {
        Json links = Json::array();
        for (const VerticalLink& link : vc.links) {
            links.push_back(Json{{"floor", link.floor}, {"element", link.element}});
        }
        out["verticalConnections"].push_back(Json{{"links", std::move(links)}});
    }

    out["summary"] = summaryToJson(computeFloorplanSummary(exportedFloors));
    return result;
}

} // namespace floorplan
