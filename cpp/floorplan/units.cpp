#include "floorplan/units.h"

namespace floorplan {

double toMeters(double value, LengthUnit unit) noexcept {
    switch (unit) {
        case LengthUnit::M: return value;
        case LengthUnit::Ft: return value * 0.3048;
        case LengthUnit::Cm: return value * 0.01;
        case LengthUnit::In: return value * 0.0254;
        case LengthUnit::Mm: return value * 0.001;
    }
    return value;
}

double fromMeters(double meters, LengthUnit unit) noexcept {
    switch (unit) {
        case LengthUnit::M: return meters;
        case LengthUnit::Ft: return meters / 0.3048;
        case LengthUnit::Cm: return meters / 0.01;
        case LengthUnit::In: return meters / 0.0254;
        case LengthUnit::Mm: return meters / 0.001;
    }
    return meters;
}

double convertUnit(double value, LengthUnit from, LengthUnit to) noexcept {
    if (from == to) return value;
    return fromMeters(toMeters(value, from), to);
}

LengthUnit resolveUnit(std::optional<LengthUnit> explicitUnit, std::optional<LengthUnit> configDefault) noexcept {
    if (explicitUnit) return *explicitUnit;
    if (configDefault) return *configDefault;
    return kDefaultUnit;
}

std::optional<LengthUnit> parseLengthUnit(std::string_view s) noexcept {
    if (s == "m") return LengthUnit::M;
    if (s == "ft") return LengthUnit::Ft;
    if (s == "cm") return LengthUnit::Cm;
    if (s == "in") return LengthUnit::In;
    if (s == "mm") return LengthUnit::Mm;
    return std::nullopt;
}

bool isMetric(LengthUnit u) noexcept {
    return u == LengthUnit::M || u == LengthUnit::Cm || u == LengthUnit::Mm;
}

bool isImperial(LengthUnit u) noexcept {
    return u == LengthUnit::Ft || u == LengthUnit::In;
}

UnitSystem unitSystemOf(LengthUnit u) noexcept {
    return isMetric(u) ? UnitSystem::Metric : UnitSystem::Imperial;
}

double lengthIn(const Length& len, LengthUnit target) noexcept {
    return convertUnit(len.value, len.unit.value_or(target), target);
}

namespace {

void addUnit(std::set<LengthUnit>& out, const Length& len) {
    if (len.unit) out.insert(*len.unit);
}

void addUnit(std::set<LengthUnit>& out, const std::optional<Length>& len) {
    if (len) addUnit(out, *len);
}

void collectRoomUnits(std::set<LengthUnit>& out, const Room& room) {
    if (room.position) {
        addUnit(out, room.position->x);
        addUnit(out, room.position->y);
    }
    if (room.size) {
        addUnit(out, room.size->width);
        addUnit(out, room.size->height);
    }
    addUnit(out, room.height);
    addUnit(out, room.elevation);
    if (room.relative) addUnit(out, room.relative->gap);
    for (const Room& sub : room.subRooms) {
        collectRoomUnits(out, sub);
    }
}

} // namespace

std::set<LengthUnit> collectUnits(const Floorplan& floorplan) {
    std::set<LengthUnit> units;
    for (const VariableDef& def : floorplan.variables) {
        addUnit(units, def.size.width);
        addUnit(units, def.size.height);
    }
    for (const Floor& floor : floorplan.floors) {
        addUnit(units, floor.height);
        for (const Room& room : floor.rooms) {
            collectRoomUnits(units, room);
        }
    }
    return units;
}

std::set<UnitSystem> getUnitSystems(const Floorplan& floorplan) {
    std::set<UnitSystem> systems;
    for (const LengthUnit u : collectUnits(floorplan)) {
        systems.insert(unitSystemOf(u));
    }
    return systems;
}

bool hasMixedUnitSystems(const Floorplan& floorplan) {
    return getUnitSystems(floorplan).size() > 1;
}

} // namespace floorplan
