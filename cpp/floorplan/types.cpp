#include "floorplan/types.h"

namespace floorplan {

const char* toString(LengthUnit u) noexcept {
    switch (u) {
        case LengthUnit::M: return "m";
        case LengthUnit::Ft: return "ft";
        case LengthUnit::Cm: return "cm";
        case LengthUnit::In: return "in";
        case LengthUnit::Mm: return "mm";
    }
    return "m";
}

const char* toString(WallDirection d) noexcept {
    switch (d) {
        case WallDirection::Top: return "top";
        case WallDirection::Right: return "right";
        case WallDirection::Bottom: return "bottom";
        case WallDirection::Left: return "left";
    }
    return "top";
}

const char* toString(WallType t) noexcept {
    switch (t) {
        case WallType::Solid: return "solid";
        case WallType::Door: return "door";
        case WallType::Window: return "window";
        case WallType::Open: return "open";
    }
    return "solid";
}

const char* toString(DoorType t) noexcept {
    switch (t) {
        case DoorType::Door: return "door";
        case DoorType::DoubleDoor: return "double-door";
        case DoorType::Opening: return "opening";
    }
    return "door";
}

const char* toString(SwingDirection s) noexcept {
    return s == SwingDirection::Left ? "left" : "right";
}

const char* toString(TurnDirection t) noexcept {
    return t == TurnDirection::Left ? "left" : "right";
}

const char* toString(Rotation r) noexcept {
    return r == Rotation::Clockwise ? "clockwise" : "counterclockwise";
}

const char* toString(Handrail h) noexcept {
    switch (h) {
        case Handrail::Left: return "left";
        case Handrail::Right: return "right";
        case Handrail::Both: return "both";
        case Handrail::Inner: return "inner";
        case Handrail::Outer: return "outer";
        case Handrail::None: return "none";
    }
    return "none";
}

const char* toString(Stringers s) noexcept {
    switch (s) {
        case Stringers::Open: return "open";
        case Stringers::Closed: return "closed";
        case Stringers::Glass: return "glass";
    }
    return "closed";
}

const char* toString(ResolutionErrorKind k) noexcept {
    switch (k) {
        case ResolutionErrorKind::NoPosition: return "no_position";
        case ResolutionErrorKind::MissingReference: return "missing_reference";
        case ResolutionErrorKind::CircularDependency: return "circular_dependency";
        case ResolutionErrorKind::UndefinedVariable: return "undefined_variable";
        case ResolutionErrorKind::DuplicateDefinition: return "duplicate_definition";
    }
    return "unknown";
}

const char* toString(WarningKind k) noexcept {
    switch (k) {
        case WarningKind::Overlap: return "overlap";
        case WarningKind::NonSolidWall: return "non_solid_wall";
        case WarningKind::WallTypeMismatch: return "wall_type_mismatch";
        case WarningKind::NoSharedBoundary: return "no_shared_boundary";
        case WarningKind::ConnectionTooWide: return "connection_too_wide";
        case WarningKind::ConnectionTooTall: return "connection_too_tall";
        case WarningKind::OverlappingConnections: return "overlapping_connections";
        case WarningKind::SharedWallConflict: return "shared_wall_conflict";
        case WarningKind::HeightMismatch: return "height_mismatch";
        case WarningKind::MixedUnitSystems: return "mixed_unit_systems";
        case WarningKind::RoomExceedsFloorHeight: return "room_exceeds_floor_height";
        case WarningKind::ConflictingConfig: return "conflicting_config";
        case WarningKind::UndefinedStyle: return "undefined_style";
        case WarningKind::DuplicateStyle: return "duplicate_style";
        case WarningKind::BuildingCode: return "building_code";
        case WarningKind::VerticalConnection: return "vertical_connection";
        case WarningKind::Version: return "version";
        case WarningKind::Deprecation: return "deprecation";
    }
    return "unknown";
}

} // namespace floorplan
