#include "floorplan/position/position_resolver.h"
#include "floorplan/core/logging.h"
#include "floorplan/core/string_utils.h"

namespace floorplan {

namespace {

// Cross-axis alignment for right-of / left-of placements.
double alignY(double refY, double refH, double h, std::optional<Alignment> a) noexcept {
    switch (a.value_or(Alignment::Top)) {
        case Alignment::Bottom: return refY + refH - h;
        case Alignment::Center: return refY + (refH - h) / 2.0;
        default: return refY;
    }
}

// Cross-axis alignment for above / below placements.
double alignX(double refX, double refW, double w, std::optional<Alignment> a) noexcept {
    switch (a.value_or(Alignment::Left)) {
        case Alignment::Right: return refX + refW - w;
        case Alignment::Center: return refX + (refW - w) / 2.0;
        default: return refX;
    }
}

ResolvedSize sizeOrZero(const Room& room, const VariableMap& variables) {
    if (auto size = findRoomSize(room, variables)) return *size;
    // undefined_variable is reported by validateSizeReferences
    FLOORPLAN_LOG_DEBUG("room '%s' has no resolvable size, treating as 0x0", room.name.c_str());
    return ResolvedSize{};
}

bool boxesOverlap(const ResolvedPosition& p1, const ResolvedSize& s1,
                  const ResolvedPosition& p2, const ResolvedSize& s2) noexcept {
    const bool overlapX = p1.x < p2.x + s2.width - kOverlapTolerance && p1.x + s1.width > p2.x + kOverlapTolerance;
    const bool overlapY = p1.y < p2.y + s2.height - kOverlapTolerance && p1.y + s1.height > p2.y + kOverlapTolerance;
    return overlapX && overlapY;
}

} // namespace

ResolvedPosition computeRelativePosition(
    const RelativePosition& rel,
    const ResolvedPosition& ref,
    const ResolvedSize& refSize,
    const ResolvedSize& size) noexcept {
    const double gap = rel.gap ? rel.gap->value : 0.0;
    const double rightX = ref.x + refSize.width + gap;
    const double leftX = ref.x - size.width - gap;
    const double belowY = ref.y + refSize.height + gap;
    const double aboveY = ref.y - size.height - gap;

    switch (rel.direction) {
        case RelativeDirection::RightOf:
            return {rightX, alignY(ref.y, refSize.height, size.height, rel.alignment)};
        case RelativeDirection::LeftOf:
            return {leftX, alignY(ref.y, refSize.height, size.height, rel.alignment)};
        case RelativeDirection::Below:
            return {alignX(ref.x, refSize.width, size.width, rel.alignment), belowY};
        case RelativeDirection::Above:
            return {alignX(ref.x, refSize.width, size.width, rel.alignment), aboveY};
        case RelativeDirection::BelowRightOf: return {rightX, belowY};
        case RelativeDirection::BelowLeftOf: return {leftX, belowY};
        case RelativeDirection::AboveRightOf: return {rightX, aboveY};
        case RelativeDirection::AboveLeftOf: return {leftX, aboveY};
    }
    return ref;
}

PositionResolution resolveFloorPositions(const Floor& floor, const VariableMap& variables) {
    PositionResolution out;

    // Lookup includes sub-rooms so references to them are not "unknown".
    std::map<std::string, const Room*> roomMap;
    for (const Room& room : floor.rooms) {
        roomMap.emplace(room.name, &room);
        for (const Room& sub : room.subRooms) {
            roomMap.emplace(sub.name, &sub);
        }
    }

    std::vector<const Room*> pending;
    for (const Room& room : floor.rooms) {
        if (room.position) {
            out.positions[room.name] = ResolvedPosition{room.position->x.value, room.position->y.value};
            out.resolvedOrder.push_back(room.name);
        } else if (room.relative) {
            pending.push_back(&room);
        } else {
            out.errors.push_back(ResolutionError{
                ResolutionErrorKind::NoPosition,
                room.name,
                "Room '" + room.name + "' has no position specified (use 'at (x,y)' or relative positioning like 'right-of RoomA')"});
        }
    }

    out.passBudget = static_cast<int>(pending.size()) + 1;
    int budget = out.passBudget;
    while (!pending.empty() && budget > 0) {
        --budget;
        ++out.passes;
        bool progress = false;

        std::vector<const Room*> stillPending;
        stillPending.reserve(pending.size());
        for (const Room* room : pending) {
            const RelativePosition& rel = *room->relative;
            const auto refIt = roomMap.find(rel.reference);
            if (refIt == roomMap.end()) {
                out.errors.push_back(ResolutionError{
                    ResolutionErrorKind::MissingReference,
                    room->name,
                    "Room '" + room->name + "' references unknown room '" + rel.reference + "'"});
                progress = true;
                continue;
            }

            const auto refPos = out.positions.find(rel.reference);
            if (refPos == out.positions.end()) {
                stillPending.push_back(room);
                continue;
            }

            out.positions[room->name] = computeRelativePosition(
                rel,
                refPos->second,
                sizeOrZero(*refIt->second, variables),
                sizeOrZero(*room, variables));
            out.resolvedOrder.push_back(room->name);
            progress = true;
        }
        pending.swap(stillPending);

        FLOORPLAN_LOG_DEBUG("floor '%s' pass %d: %zu pending", floor.id.c_str(), out.passes, pending.size());

        if (!progress && !pending.empty()) {
            std::vector<std::string> stuck;
            stuck.reserve(pending.size());
            for (const Room* room : pending) stuck.push_back(room->name);
            out.errors.push_back(ResolutionError{
                ResolutionErrorKind::CircularDependency,
                stuck.front(),
                "Circular dependency detected involving rooms: " + joinNames(stuck, ", ")});
            FLOORPLAN_LOG_WARN("floor '%s': circular placement among %zu rooms", floor.id.c_str(), stuck.size());
            break;
        }
    }

    for (std::size_t i = 0; i < out.resolvedOrder.size(); ++i) {
        for (std::size_t j = i + 1; j < out.resolvedOrder.size(); ++j) {
            const std::string& a = out.resolvedOrder[i];
            const std::string& b = out.resolvedOrder[j];
            const ResolvedSize sizeA = sizeOrZero(*roomMap.at(a), variables);
            const ResolvedSize sizeB = sizeOrZero(*roomMap.at(b), variables);
            if (boxesOverlap(out.positions.at(a), sizeA, out.positions.at(b), sizeB)) {
                out.warnings.push_back(OverlapWarning{
                    a, b, "Rooms '" + a + "' and '" + b + "' overlap at their computed positions"});
            }
        }
    }

    return out;
}

FloorPositions resolveAllPositions(
    const Floorplan& floorplan,
    const VariableMap& variables) {
    FloorPositions out;
    out.reserve(floorplan.floors.size());
    for (const Floor& floor : floorplan.floors) {
        out.emplace_back(floor.id, resolveFloorPositions(floor, variables));
    }
    return out;
}

std::optional<ResolvedPosition> getResolvedPosition(
    const Room& room,
    const PositionMap& positions) {
    const auto it = positions.find(room.name);
    if (it != positions.end()) return it->second;
    if (room.position) return ResolvedPosition{room.position->x.value, room.position->y.value};
    return std::nullopt;
}

} // namespace floorplan
