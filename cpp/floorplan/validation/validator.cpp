#include "floorplan/validation/validator.h"
#include "floorplan/core/logging.h"
#include "floorplan/core/string_utils.h"
#include "floorplan/stairs/stair_geometry.h"
#include "floorplan/units.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace floorplan {

namespace {

const char* wallName(std::optional<WallDirection> wall) noexcept {
    return wall ? toString(*wall) : "unknown";
}

const PositionMap* findPositions(const FloorPositions& positions, const std::string& floorId) noexcept {
    for (const auto& entry : positions) {
        if (entry.first == floorId) return &entry.second.positions;
    }
    return nullptr;
}

void collectRooms(const std::vector<Room>& rooms, std::vector<const Room*>& out) {
    for (const Room& room : rooms) {
        out.push_back(&room);
        collectRooms(room.subRooms, out);
    }
}

std::vector<const Room*> allRooms(const Floor& floor) {
    std::vector<const Room*> out;
    collectRooms(floor.rooms, out);
    return out;
}

const Room* findRoomByName(const std::vector<const Room*>& rooms, const std::string& name) noexcept {
    for (const Room* room : rooms) {
        if (room->name == name) return room;
    }
    return nullptr;
}

// First explicit spec for a wall; unspecified walls have no type here.
std::optional<WallType> explicitWallType(const Room& room, WallDirection dir) noexcept {
    for (const WallSpec& spec : room.walls) {
        if (spec.direction == dir) return spec.type;
    }
    return std::nullopt;
}

// Unit used for unitless heights: declared default_unit, else meters.
LengthUnit heightUnit(const ValidationContext& ctx) noexcept {
    return ctx.config.defaultUnitDeclared ? ctx.config.defaultUnit : LengthUnit::M;
}

std::optional<double> configNumber(const Floorplan& floorplan, std::string_view name) noexcept {
    const ConfigProperty* prop = findConfigProperty(floorplan, name);
    if (!prop) return std::nullopt;
    if (const auto* v = std::get_if<double>(&prop->value)) return *v;
    return std::nullopt;
}

struct WallConnection {
    const Connection* connection;
    std::size_t index;
    double position;
    double widthPercent;
};

bool connectionsOverlap(const WallConnection& a, const WallConnection& b) noexcept {
    const double start1 = a.position - a.widthPercent / 2.0;
    const double end1 = a.position + a.widthPercent / 2.0;
    const double start2 = b.position - b.widthPercent / 2.0;
    const double end2 = b.position + b.widthPercent / 2.0;
    return !(end1 < start2 || end2 < start1);
}

bool isBidirectional(const Connection& a, const Connection& b) noexcept {
    return (a.from.room == b.to.room && a.to.room == b.from.room)
        || (a.from.room == b.from.room && a.to.room == b.to.room);
}

bool isCompleteRoomConnection(const Connection& c) noexcept {
    return !c.from.room.empty() && !c.to.room.empty() && c.from.wall && c.to.wall;
}

bool hasOpeningConnection(
    const Floorplan& floorplan,
    const std::string& roomA, WallDirection wallA,
    const std::string& roomB, WallDirection wallB) noexcept {
    for (const Connection& c : floorplan.connections) {
        if (c.doorType != DoorType::Opening) continue;
        const bool ab = c.from.room == roomA && c.from.wall == wallA && c.to.room == roomB && c.to.wall == wallB;
        const bool ba = c.from.room == roomB && c.from.wall == wallB && c.to.room == roomA && c.to.wall == wallA;
        if (ab || ba) return true;
    }
    return false;
}

double toInches(const Length& len, LengthUnit defaultUnit) noexcept {
    return convertUnit(len.value, len.unit.value_or(defaultUnit), LengthUnit::In);
}

std::string inches(double v) {
    return formatNumber(std::round(v * 100.0) / 100.0) + "in";
}

// Position of a linkable element: stairs and lifts by explicit coordinate,
// rooms by their resolved placement.
struct LinkedElement {
    std::size_t floorIndex{0};
    std::optional<ResolvedPosition> position;
};

std::optional<LinkedElement> findLinkedElement(
    const ValidationContext& ctx,
    std::size_t floorIndex,
    const std::string& element) {
    const Floor& floor = ctx.floorplan.floors[floorIndex];
    LinkedElement out;
    out.floorIndex = floorIndex;
    for (const Stair& stair : floor.stairs) {
        if (stair.name != element) continue;
        if (stair.position) out.position = ResolvedPosition{stair.position->x.value, stair.position->y.value};
        return out;
    }
    for (const Lift& lift : floor.lifts) {
        if (lift.name != element) continue;
        if (lift.position) out.position = ResolvedPosition{lift.position->x.value, lift.position->y.value};
        return out;
    }
    if (const Room* room = findRoom(floor, element)) {
        static const PositionMap kEmpty;
        const PositionMap* positions = findPositions(ctx.positions, floor.id);
        out.position = getResolvedPosition(*room, positions ? *positions : kEmpty);
        return out;
    }
    return std::nullopt;
}

} // namespace

std::optional<StairCodeLimits> stairCodeLimits(StairCode code) noexcept {
    switch (code) {
        case StairCode::Residential: return StairCodeLimits{7.75, 0.0, 10.0, 36.0, 80.0};
        case StairCode::Commercial: return StairCodeLimits{7.0, 4.0, 11.0, 44.0, 80.0};
        case StairCode::Ada: return StairCodeLimits{7.0, 4.0, 11.0, 48.0, 80.0};
        case StairCode::None: break;
    }
    return std::nullopt;
}

std::map<std::string, RoomBounds> computeValidationBounds(
    const Floor& floor,
    const PositionMap* positions,
    const VariableMap& variables) {
    std::map<std::string, RoomBounds> bounds;
    for (const Room* room : allRooms(floor)) {
        const auto size = findRoomSize(*room, variables);
        if (!size) {
            FLOORPLAN_LOG_DEBUG("validation: room '%s' has no size, skipped", room->name.c_str());
            continue;
        }
        RoomBounds b;
        b.width = size->width;
        b.height = size->height;
        const ResolvedPosition* resolved = nullptr;
        if (positions) {
            const auto it = positions->find(room->name);
            if (it != positions->end()) resolved = &it->second;
        }
        if (resolved) {
            b.x = resolved->x;
            b.y = resolved->y;
        } else if (room->position) {
            b.x = room->position->x.value;
            b.y = room->position->y.value;
        }
        bounds.emplace(room->name, b);
    }
    return bounds;
}

std::optional<SharedSegment> calculateSharedWallSegment(
    const RoomBounds& from,
    std::optional<WallDirection> fromWall,
    const RoomBounds& to,
    std::optional<WallDirection> toWall) noexcept {
    if (!fromWall || !toWall) return std::nullopt;
    const bool fromH = isHorizontalWall(*fromWall);
    const bool toH = isHorizontalWall(*toWall);
    if (fromH != toH) return std::nullopt;

    if (fromH) {
        const double fromEdge = *fromWall == WallDirection::Top ? from.y : from.y + from.height;
        const double toEdge = *toWall == WallDirection::Top ? to.y : to.y + to.height;
        if (std::abs(fromEdge - toEdge) > kSharedBoundaryTolerance) return std::nullopt;
        const double start = std::max(from.x, to.x);
        const double end = std::min(from.x + from.width, to.x + to.width);
        if (end <= start) return std::nullopt;
        return SharedSegment{
            std::max(0.0, (start - from.x) / from.width),
            std::min(1.0, (end - from.x) / from.width)};
    }

    const double fromEdge = *fromWall == WallDirection::Left ? from.x : from.x + from.width;
    const double toEdge = *toWall == WallDirection::Left ? to.x : to.x + to.width;
    if (std::abs(fromEdge - toEdge) > kSharedBoundaryTolerance) return std::nullopt;
    const double start = std::max(from.y, to.y);
    const double end = std::min(from.y + from.height, to.y + to.height);
    if (end <= start) return std::nullopt;
    return SharedSegment{
        std::max(0.0, (start - from.y) / from.height),
        std::min(1.0, (end - from.y) / from.height)};
}

std::optional<SharedWall> findSharedWall(const RoomBounds& a, const RoomBounds& b) noexcept {
    const bool overlapY = a.y < b.y + b.height && a.y + a.height > b.y;
    const bool overlapX = a.x < b.x + b.width && a.x + a.width > b.x;
    if (std::abs(a.x + a.width - b.x) < kAdjacencyTolerance && overlapY) {
        return SharedWall{WallDirection::Right, WallDirection::Left};
    }
    if (std::abs(a.x - (b.x + b.width)) < kAdjacencyTolerance && overlapY) {
        return SharedWall{WallDirection::Left, WallDirection::Right};
    }
    if (std::abs(a.y + a.height - b.y) < kAdjacencyTolerance && overlapX) {
        return SharedWall{WallDirection::Bottom, WallDirection::Top};
    }
    if (std::abs(a.y - (b.y + b.height)) < kAdjacencyTolerance && overlapX) {
        return SharedWall{WallDirection::Top, WallDirection::Bottom};
    }
    return std::nullopt;
}

double getRoomHeightMeters(const Room& room, const Floor& floor, const ValidationContext& ctx) {
    const LengthUnit unit = heightUnit(ctx);
    if (room.height) return toMeters(room.height->value, room.height->unit.value_or(unit));
    if (floor.height) return toMeters(floor.height->value, floor.height->unit.value_or(unit));
    if (const auto configured = configNumber(ctx.floorplan, "default_height")) return toMeters(*configured, unit);
    return kDefaultRoomHeightM;
}

// =============================================================================
// Connections
// =============================================================================

void checkConnectionOverlaps(const ValidationContext& ctx, std::vector<Warning>& out) {
    // Wall key -> connections touching it, in first-seen key order.
    std::vector<std::pair<std::string, std::vector<WallConnection>>> walls;
    auto bucket = [&walls](const std::string& key) -> std::vector<WallConnection>& {
        for (auto& entry : walls) {
            if (entry.first == key) return entry.second;
        }
        walls.emplace_back(key, std::vector<WallConnection>{});
        return walls.back().second;
    };

    const auto& connections = ctx.floorplan.connections;
    for (std::size_t i = 0; i < connections.size(); ++i) {
        const Connection& c = connections[i];
        if (!isCompleteRoomConnection(c)) continue;
        const WallConnection wc{
            &c,
            i,
            c.position.value_or(kDefaultConnectionPosition),
            c.doorType == DoorType::DoubleDoor ? kDoubleDoorWidthPercent : kDoorWidthPercent};
        bucket(c.from.room + "." + toString(*c.from.wall)).push_back(wc);
        bucket(c.to.room + "." + toString(*c.to.wall)).push_back(wc);
    }

    std::set<std::size_t> reported;
    for (auto& entry : walls) {
        auto& list = entry.second;
        if (list.size() < 2) continue;
        std::stable_sort(list.begin(), list.end(), [](const WallConnection& a, const WallConnection& b) {
            return a.position < b.position;
        });
        for (std::size_t i = 0; i < list.size(); ++i) {
            for (std::size_t j = i + 1; j < list.size(); ++j) {
                const WallConnection& c1 = list[i];
                const WallConnection& c2 = list[j];
                if (c1.index == c2.index) continue;
                if (reported.count(c1.index) || reported.count(c2.index)) continue;
                if (!connectionsOverlap(c1, c2)) continue;

                const Connection& a = *c1.connection;
                std::string message = isBidirectional(a, *c2.connection)
                    ? "Overlapping bidirectional connections between " + a.from.room + " and " + a.to.room + ". Remove one connection."
                    : "Overlapping connections at position " + formatNumber(c1.position) + "% on wall. Use different positions.";
                out.push_back(Warning{WarningKind::OverlappingConnections, a.from.room, std::move(message)});
                reported.insert(c1.index);
                reported.insert(c2.index);
            }
        }
    }
}

void checkConnectionWallTypes(const ValidationContext& ctx, std::vector<Warning>& out) {
    // Later specs for the same room wall replace earlier ones.
    std::map<std::string, WallType> wallTypes;
    for (const Floor& floor : ctx.floorplan.floors) {
        for (const Room* room : allRooms(floor)) {
            for (const WallSpec& spec : room->walls) {
                wallTypes[room->name + "." + toString(spec.direction)] = spec.type;
            }
        }
    }
    auto lookup = [&wallTypes](const ConnectionEnd& end) -> std::optional<WallType> {
        const auto it = wallTypes.find(end.room + "." + toString(*end.wall));
        if (it == wallTypes.end()) return std::nullopt;
        return it->second;
    };
    auto nonSolid = [](const ConnectionEnd& end, WallType type) {
        return "Connection references " + end.room + "." + toString(*end.wall) + " which is '" + toString(type)
            + "', not 'solid'. Door openings work best when both walls are 'solid'. Consider changing the wall type.";
    };

    for (const Connection& c : ctx.floorplan.connections) {
        if (!isCompleteRoomConnection(c)) continue;
        if (c.doorType == DoorType::Opening) continue;

        const auto fromType = lookup(c.from);
        const auto toType = lookup(c.to);
        if (fromType && *fromType != WallType::Solid) {
            out.push_back(Warning{WarningKind::NonSolidWall, c.from.room, nonSolid(c.from, *fromType)});
        }
        if (toType && *toType != WallType::Solid) {
            out.push_back(Warning{WarningKind::NonSolidWall, c.to.room, nonSolid(c.to, *toType)});
        }
        if (fromType && toType && *fromType != *toType) {
            out.push_back(Warning{
                WarningKind::WallTypeMismatch,
                c.from.room,
                "Wall type mismatch: " + c.from.room + "." + toString(*c.from.wall) + " is '" + toString(*fromType)
                    + "' but " + c.to.room + "." + toString(*c.to.wall) + " is '" + toString(*toType)
                    + "'. This may cause rendering issues in 3D viewer. Both walls should have the same type."});
        }
    }
}

void checkSharedBoundary(const ValidationContext& ctx, std::vector<Warning>& out) {
    for (const Floor& floor : ctx.floorplan.floors) {
        const auto bounds = computeValidationBounds(floor, findPositions(ctx.positions, floor.id), ctx.variables);
        for (const Connection& c : ctx.floorplan.connections) {
            if (c.from.room.empty() || c.to.room.empty()) continue;
            const auto from = bounds.find(c.from.room);
            const auto to = bounds.find(c.to.room);
            if (from == bounds.end() || to == bounds.end()) continue;
            if (calculateSharedWallSegment(from->second, c.from.wall, to->second, c.to.wall)) continue;
            out.push_back(Warning{
                WarningKind::NoSharedBoundary,
                c.from.room,
                "Connection from " + c.from.room + "." + wallName(c.from.wall) + " to " + c.to.room + "." + wallName(c.to.wall)
                    + " connects walls that don't share a boundary. The door may not align properly with the rooms."});
        }
    }
}

void checkConnectionSize(const ValidationContext& ctx, std::vector<Warning>& out) {
    const LengthUnit defaultUnit = heightUnit(ctx);
    for (const Floor& floor : ctx.floorplan.floors) {
        const auto rooms = allRooms(floor);
        const auto bounds = computeValidationBounds(floor, findPositions(ctx.positions, floor.id), ctx.variables);
        for (const Connection& c : ctx.floorplan.connections) {
            if (!c.size) continue;
            if (c.from.room.empty() || c.to.room.empty()) continue;
            const auto from = bounds.find(c.from.room);
            const auto to = bounds.find(c.to.room);
            if (from == bounds.end() || to == bounds.end()) continue;
            const auto segment = calculateSharedWallSegment(from->second, c.from.wall, to->second, c.to.wall);
            if (!segment) continue;

            const double along = isHorizontalWall(*c.from.wall) ? from->second.width : from->second.height;
            const double wallLength = along * (segment->end - segment->start);
            const Length& width = c.size->width;
            if (width.value > wallLength) {
                out.push_back(Warning{
                    WarningKind::ConnectionTooWide,
                    c.from.room,
                    "Connection width " + formatNumber(width.value) + (width.unit ? toString(*width.unit) : "")
                        + " exceeds shared wall length " + formatFixed(wallLength, 2) + ". The connection may not fit properly."});
            }

            if (c.size->fullHeight || !c.size->height) continue;
            const Length& height = *c.size->height;
            const LengthUnit unit = height.unit.value_or(defaultUnit);
            const double heightM = toMeters(height.value, unit);
            const double minRoomHeight = std::min(
                getRoomHeightMeters(*findRoomByName(rooms, c.from.room), floor, ctx),
                getRoomHeightMeters(*findRoomByName(rooms, c.to.room), floor, ctx));
            if (heightM > minRoomHeight) {
                out.push_back(Warning{
                    WarningKind::ConnectionTooTall,
                    c.from.room,
                    "Connection height " + formatNumber(height.value) + toString(unit) + " exceeds room height "
                        + formatFixed(minRoomHeight, 2) + "m. The connection may not fit properly."});
            }
        }
    }
}

// =============================================================================
// Styles and config
// =============================================================================

void checkStyleReferences(const ValidationContext& ctx, std::vector<Warning>& out) {
    std::set<std::string> defined;
    for (const StyleDef& style : ctx.floorplan.styles) defined.insert(style.name);

    for (const Floor& floor : ctx.floorplan.floors) {
        for (const Room* room : allRooms(floor)) {
            if (!room->styleRef || defined.count(*room->styleRef)) continue;
            out.push_back(Warning{
                WarningKind::UndefinedStyle,
                room->name,
                "Room '" + room->name + "' references undefined style '" + *room->styleRef
                    + "'. Define it with 'style " + *room->styleRef + " { ... }'."});
        }
    }

    if (ctx.config.defaultStyle && !defined.count(*ctx.config.defaultStyle)) {
        const std::string& name = *ctx.config.defaultStyle;
        out.push_back(Warning{
            WarningKind::UndefinedStyle,
            "default_style",
            "Config references undefined style '" + name + "'. Define it with 'style " + name + " { ... }'."});
    }
}

void checkDuplicateStyles(const ValidationContext& ctx, std::vector<Warning>& out) {
    std::set<std::string> seen;
    for (const StyleDef& style : ctx.floorplan.styles) {
        if (seen.insert(style.name).second) continue;
        out.push_back(Warning{
            WarningKind::DuplicateStyle,
            style.name,
            "Duplicate style name '" + style.name + "'. Style names must be unique."});
    }
}

void checkConflictingSizeConfig(const ValidationContext& ctx, std::vector<Warning>& out) {
    auto check = [&](const char* sizeKey, const char* widthKey, const char* heightKey) {
        if (!findConfigProperty(ctx.floorplan, sizeKey)) return;
        std::vector<std::string> conflicting;
        if (findConfigProperty(ctx.floorplan, widthKey)) conflicting.emplace_back(widthKey);
        if (findConfigProperty(ctx.floorplan, heightKey)) conflicting.emplace_back(heightKey);
        if (conflicting.empty()) return;
        const std::string names = joinNames(conflicting, ", ");
        out.push_back(Warning{
            WarningKind::ConflictingConfig,
            sizeKey,
            std::string("Config specifies both '") + sizeKey + "' and " + names + ". The '" + sizeKey
                + "' property takes precedence, making " + names + " redundant."});
    };
    check("door_size", "door_width", "door_height");
    check("window_size", "window_width", "window_height");
}

// =============================================================================
// Rooms
// =============================================================================

void checkSharedWallConflicts(const ValidationContext& ctx, std::vector<Warning>& out) {
    for (const Floor& floor : ctx.floorplan.floors) {
        const auto rooms = allRooms(floor);
        const auto bounds = computeValidationBounds(floor, findPositions(ctx.positions, floor.id), ctx.variables);

        // Declaration order; each unordered pair once.
        std::vector<const Room*> sized;
        for (const Room* room : rooms) {
            if (bounds.count(room->name) && !findRoomByName(sized, room->name)) sized.push_back(room);
        }

        for (std::size_t i = 0; i < sized.size(); ++i) {
            for (std::size_t j = i + 1; j < sized.size(); ++j) {
                const Room& a = *sized[i];
                const Room& b = *sized[j];
                const auto shared = findSharedWall(bounds.at(a.name), bounds.at(b.name));
                if (!shared) continue;

                const auto typeA = explicitWallType(a, shared->wallA);
                const auto typeB = explicitWallType(b, shared->wallB);
                if (typeA && typeB && *typeA != *typeB
                    && !hasOpeningConnection(ctx.floorplan, a.name, shared->wallA, b.name, shared->wallB)) {
                    out.push_back(Warning{
                        WarningKind::SharedWallConflict,
                        a.name,
                        "Shared wall conflict: " + a.name + "." + toString(shared->wallA) + " is '" + toString(*typeA)
                            + "' but " + b.name + "." + toString(shared->wallB) + " is '" + toString(*typeB)
                            + "'. Adjacent walls should have matching types for consistent rendering."});
                }

                const double heightA = getRoomHeightMeters(a, floor, ctx);
                const double heightB = getRoomHeightMeters(b, floor, ctx);
                if (heightA != heightB) {
                    out.push_back(Warning{
                        WarningKind::HeightMismatch,
                        a.name,
                        "Height mismatch at shared wall: " + a.name + " (" + formatFixed(heightA, 2) + "m) and " + b.name
                            + " (" + formatFixed(heightB, 2)
                            + "m) have different heights. This may cause visual inconsistencies in 3D rendering."});
                }
            }
        }
    }
}

void checkMixedUnitSystems(const ValidationContext& ctx, std::vector<Warning>& out) {
    if (!hasMixedUnitSystems(ctx.floorplan)) return;
    out.push_back(Warning{
        WarningKind::MixedUnitSystems,
        "",
        "Mixed unit systems detected: This floorplan uses both metric (m, cm, mm) and imperial (ft, in) units. "
        "Consider using a consistent unit system for clarity."});
}

// Raw values: heights are compared as written, without unit conversion.
void checkRoomHeightExceedsFloor(const ValidationContext& ctx, std::vector<Warning>& out) {
    const double defaultHeight = configNumber(ctx.floorplan, "default_height").value_or(kDefaultRoomHeightM);
    for (const Floor& floor : ctx.floorplan.floors) {
        const double floorHeight = floor.height ? floor.height->value : defaultHeight;
        for (const Room* room : allRooms(floor)) {
            const double roomHeight = room->height ? room->height->value : defaultHeight;
            if (roomHeight <= floorHeight) continue;
            out.push_back(Warning{
                WarningKind::RoomExceedsFloorHeight,
                room->name,
                "Room '" + room->name + "' has height " + formatNumber(roomHeight) + " which exceeds floor '" + floor.id
                    + "' height of " + formatNumber(floorHeight)
                    + ". This will cause the room to clip through the floor above in 3D rendering."
                      " Consider increasing the floor height or reducing the room height."});
        }
    }
}

// =============================================================================
// Circulation
// =============================================================================

void checkBuildingCode(const ValidationContext& ctx, std::vector<Warning>& out) {
    const auto limits = stairCodeLimits(ctx.config.stairCode);
    if (!limits) return;
    const std::string code = toString(ctx.config.stairCode);
    const LengthUnit unit = ctx.config.defaultUnit;

    for (const Floor& floor : ctx.floorplan.floors) {
        for (const Stair& stair : floor.stairs) {
            auto report = [&](const std::string& what) {
                out.push_back(Warning{WarningKind::BuildingCode, stair.name, "Stair '" + stair.name + "' " + what});
            };
            if (stair.riser) {
                const double riser = toInches(*stair.riser, unit);
                if (limits->maxRiser > 0.0 && riser > limits->maxRiser) {
                    report("riser height " + inches(riser) + " exceeds the " + code + " maximum of " + inches(limits->maxRiser) + ".");
                }
                if (limits->minRiser > 0.0 && riser < limits->minRiser) {
                    report("riser height " + inches(riser) + " is below the " + code + " minimum of " + inches(limits->minRiser) + ".");
                }
            }
            if (stair.tread) {
                const double tread = toInches(*stair.tread, unit);
                if (tread < limits->minTread) {
                    report("tread depth " + inches(tread) + " is below the " + code + " minimum of " + inches(limits->minTread) + ".");
                }
            }
            if (stair.width) {
                const double width = toInches(*stair.width, unit);
                if (width < limits->minWidth) {
                    report("width " + inches(width) + " is below the " + code + " minimum of " + inches(limits->minWidth) + ".");
                }
            }
            if (stair.headroom) {
                const double headroom = toInches(*stair.headroom, unit);
                if (headroom < limits->minHeadroom) {
                    report("headroom " + inches(headroom) + " is below the " + code + " minimum of " + inches(limits->minHeadroom) + ".");
                }
            }
        }
    }
}

void checkVerticalConnections(const ValidationContext& ctx, std::vector<Warning>& out) {
    const auto& floors = ctx.floorplan.floors;
    for (const VerticalConnection& vc : ctx.floorplan.verticalConnections) {
        const std::string element = vc.links.empty() ? std::string() : vc.links.front().element;
        auto report = [&](std::string message) {
            out.push_back(Warning{WarningKind::VerticalConnection, element, std::move(message)});
        };

        std::optional<LinkedElement> previous;
        const VerticalLink* previousLink = nullptr;
        for (const VerticalLink& link : vc.links) {
            const auto floorIt = std::find_if(floors.begin(), floors.end(), [&](const Floor& f) { return f.id == link.floor; });
            if (floorIt == floors.end()) {
                report("Vertical connection references unknown floor '" + link.floor + "'.");
                previous.reset();
                continue;
            }
            const auto current = findLinkedElement(ctx, static_cast<std::size_t>(floorIt - floors.begin()), link.element);
            if (!current) {
                report("Vertical connection references unknown element '" + link.element + "' on floor '" + link.floor + "'.");
                previous.reset();
                continue;
            }

            if (previous) {
                const std::size_t lo = std::min(previous->floorIndex, current->floorIndex);
                const std::size_t hi = std::max(previous->floorIndex, current->floorIndex);
                if (hi - lo > 1) {
                    report("Vertical connection from floor '" + previousLink->floor + "' to floor '" + link.floor
                        + "' skips intermediate floors.");
                }
                if (previous->position && current->position) {
                    const double dx = current->position->x - previous->position->x;
                    const double dy = current->position->y - previous->position->y;
                    if (std::abs(dx) > kVerticalAlignmentTolerance || std::abs(dy) > kVerticalAlignmentTolerance) {
                        report("Vertical connection elements '" + previousLink->element + "' on floor '" + previousLink->floor
                            + "' and '" + link.element + "' on floor '" + link.floor + "' are misaligned by ("
                            + formatFixed(dx, 2) + ", " + formatFixed(dy, 2) + ").");
                    }
                }
            }
            previous = current;
            previousLink = &link;
        }
    }
}

std::vector<Warning> validateFloorplan(const ValidationContext& ctx) {
    std::vector<Warning> out;
    checkConnectionOverlaps(ctx, out);
    checkConnectionWallTypes(ctx, out);
    checkStyleReferences(ctx, out);
    checkDuplicateStyles(ctx, out);
    checkSharedWallConflicts(ctx, out);
    checkMixedUnitSystems(ctx, out);
    checkRoomHeightExceedsFloor(ctx, out);
    checkSharedBoundary(ctx, out);
    checkConnectionSize(ctx, out);
    checkConflictingSizeConfig(ctx, out);
    checkBuildingCode(ctx, out);
    checkVerticalConnections(ctx, out);
    for (const Warning& w : out) {
        FLOORPLAN_LOG_WARN("%s: %s", toString(w.kind), w.message.c_str());
    }
    return out;
}

} // namespace floorplan
