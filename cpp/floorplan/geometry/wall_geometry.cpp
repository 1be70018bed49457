#include "floorplan/geometry/wall_geometry.h"
#include "floorplan/core/logging.h"

#include <algorithm>
#include <cmath>

namespace floorplan {

WallBounds getWallBounds(const RoomBounds& room, WallDirection direction) noexcept {
    switch (direction) {
        case WallDirection::Top:
            return WallBounds{room.x, room.y, room.width, true};
        case WallDirection::Bottom:
            return WallBounds{room.x, room.y + room.height - kWallThickness, room.width, true};
        case WallDirection::Left:
            return WallBounds{room.x, room.y, room.height, false};
        case WallDirection::Right:
            return WallBounds{room.x + room.width - kWallThickness, room.y, room.height, false};
    }
    return WallBounds{room.x, room.y, room.width, true};
}

std::optional<WallOverlap> calculateWallOverlap(const RoomBounds& source, const RoomBounds& target, bool isVertical) noexcept {
    double start = 0.0;
    double end = 0.0;
    if (isVertical) {
        start = std::max(source.y, target.y);
        end = std::min(source.y + source.height, target.y + target.height);
    } else {
        start = std::max(source.x, target.x);
        end = std::min(source.x + source.width, target.x + target.width);
    }
    if (end <= start) return std::nullopt;
    return WallOverlap{start, end, end - start};
}

std::optional<double> calculatePositionOnOverlap(
    const RoomBounds& source, const RoomBounds& target, bool isVertical, double percent) noexcept {
    const auto overlap = calculateWallOverlap(source, target, isVertical);
    if (!overlap) return std::nullopt;
    return overlap->start + overlap->length * percent / 100.0;
}

double calculatePositionWithFallback(
    const RoomBounds& source, const RoomBounds* target, bool isVertical, double percent) noexcept {
    if (target) {
        if (auto pos = calculatePositionOnOverlap(source, *target, isVertical, percent)) return *pos;
    }
    return isVertical
        ? source.y + source.height * (percent / 100.0)
        : source.x + source.width * (percent / 100.0);
}

std::optional<WallOverlap> calculateWallBoundsOverlap(const WallBounds& a, const WallBounds& b) noexcept {
    if (a.isHorizontal != b.isHorizontal) return std::nullopt;
    const double aStart = a.isHorizontal ? a.x : a.y;
    const double bStart = b.isHorizontal ? b.x : b.y;
    const double start = std::max(aStart, bStart);
    const double end = std::min(aStart + a.length, bStart + b.length);
    if (end <= start) return std::nullopt;
    return WallOverlap{start, end, end - start};
}

std::optional<WallPair> inferWallDirection(const RoomBounds& from, const RoomBounds& to) noexcept {
    if (std::abs(from.x + from.width - to.x) < kAdjacencyTolerance) {
        return WallPair{WallDirection::Right, WallDirection::Left};
    }
    if (std::abs(to.x + to.width - from.x) < kAdjacencyTolerance) {
        return WallPair{WallDirection::Left, WallDirection::Right};
    }
    if (std::abs(from.y + from.height - to.y) < kAdjacencyTolerance) {
        return WallPair{WallDirection::Bottom, WallDirection::Top};
    }
    if (std::abs(to.y + to.height - from.y) < kAdjacencyTolerance) {
        return WallPair{WallDirection::Top, WallDirection::Bottom};
    }
    return std::nullopt;
}

ConnectionPoint calculateConnectionPoint(
    const RoomBounds& fromRoom,
    WallDirection fromWall,
    const RoomBounds& toRoom,
    WallDirection toWall,
    double percent,
    double doorWidth) noexcept {
    const WallBounds from = getWallBounds(fromRoom, fromWall);
    const WallBounds to = getWallBounds(toRoom, toWall);

    if (from.isHorizontal && to.isHorizontal) {
        const auto overlap = calculateWallBoundsOverlap(from, to);
        const double center = overlap
            ? overlap->start + overlap->length * percent / 100.0
            : from.x + from.length * percent / 100.0;
        return ConnectionPoint{center - doorWidth / 2.0, std::min(from.y, to.y), doorWidth, kWallThickness, fromWall};
    }

    if (!from.isHorizontal && !to.isHorizontal) {
        const auto overlap = calculateWallBoundsOverlap(from, to);
        const double center = overlap
            ? overlap->start + overlap->length * percent / 100.0
            : from.y + from.length * percent / 100.0;
        return ConnectionPoint{std::min(from.x, to.x), center - doorWidth / 2.0, kWallThickness, doorWidth, fromWall};
    }

    // Mixed orientation: offset along the horizontal wall.
    const WallBounds& horiz = from.isHorizontal ? from : to;
    const WallDirection horizWall = from.isHorizontal ? fromWall : toWall;
    return ConnectionPoint{
        horiz.x + horiz.length * percent / 100.0 - doorWidth / 2.0,
        horiz.y,
        doorWidth,
        kWallThickness,
        horizWall};
}

const Room* findRoom(const Floor& floor, std::string_view name) noexcept {
    for (const Room& room : floor.rooms) {
        if (room.name == name) return &room;
        for (const Room& sub : room.subRooms) {
            if (sub.name == name) return &sub;
        }
    }
    return nullptr;
}

std::optional<RoomBounds> getRoomBounds(const Room& room, const PositionMap& positions, const VariableMap& variables) {
    const auto pos = getResolvedPosition(room, positions);
    if (!pos) return std::nullopt;
    const auto size = findRoomSize(room, variables);
    if (!size) return std::nullopt;
    return RoomBounds{pos->x, pos->y, size->width, size->height};
}

std::optional<SwingDirection> resolveSwing(const Connection& connection) {
    if (connection.swing) return connection.swing;
    if (connection.opensInto && !connection.opensInto->empty()) {
        return *connection.opensInto == connection.from.room ? SwingDirection::Left : SwingDirection::Right;
    }
    return std::nullopt;
}

std::optional<PlacedConnection> placeConnection(
    const Connection& connection,
    const Floor& floor,
    const PositionMap& positions,
    const VariableMap& variables) {
    if (connection.from.room.empty() || connection.to.room.empty()) {
        return std::nullopt;
    }

    const Room* fromRoom = findRoom(floor, connection.from.room);
    const Room* toRoom = findRoom(floor, connection.to.room);
    if (!fromRoom || !toRoom) return std::nullopt;

    const auto fromBounds = getRoomBounds(*fromRoom, positions, variables);
    const auto toBounds = getRoomBounds(*toRoom, positions, variables);
    if (!fromBounds || !toBounds) {
        FLOORPLAN_LOG_DEBUG("connection %s -> %s skipped: unresolved room",
            connection.from.room.c_str(), connection.to.room.c_str());
        return std::nullopt;
    }

    std::optional<WallDirection> fromWall = connection.from.wall;
    std::optional<WallDirection> toWall = connection.to.wall;
    if (!fromWall || !toWall) {
        const auto inferred = inferWallDirection(*fromBounds, *toBounds);
        if (!inferred) {
            FLOORPLAN_LOG_DEBUG("connection %s -> %s skipped: rooms are not adjacent",
                connection.from.room.c_str(), connection.to.room.c_str());
            return std::nullopt;
        }
        if (!fromWall) fromWall = inferred->fromWall;
        if (!toWall) toWall = inferred->toWall;
    }

    const double percent = connection.position.value_or(kDefaultConnectionPosition);
    const double doorWidth = connection.size ? connection.size->width.value : kDefaultDoorWidth;

    PlacedConnection placed;
    placed.connection = &connection;
    placed.fromWall = *fromWall;
    placed.toWall = *toWall;
    placed.point = calculateConnectionPoint(*fromBounds, *fromWall, *toBounds, *toWall, percent, doorWidth);
    placed.swing = resolveSwing(connection);
    return placed;
}

} // namespace floorplan
