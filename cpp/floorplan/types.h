#ifndef FLOORPLAN_TYPES_H
#define FLOORPLAN_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace floorplan {

// =============================================================================
// Scalars
// =============================================================================

enum class LengthUnit : std::uint8_t {
    M = 0,
    Ft = 1,
    Cm = 2,
    In = 3,
    Mm = 4,
};

// A number as written in the document, with its optional unit suffix.
struct Length {
    double value{0.0};
    std::optional<LengthUnit> unit;
};

struct Dimension {
    Length width;
    Length height;
};

struct Coordinate {
    Length x;
    Length y;
};

// =============================================================================
// Enumerations
// =============================================================================

enum class WallDirection : std::uint8_t { Top = 0, Right = 1, Bottom = 2, Left = 3 };

enum class WallType : std::uint8_t { Solid = 0, Door = 1, Window = 2, Open = 3 };

enum class RelativeDirection : std::uint8_t {
    RightOf = 0,
    LeftOf = 1,
    Above = 2,
    Below = 3,
    AboveRightOf = 4,
    AboveLeftOf = 5,
    BelowRightOf = 6,
    BelowLeftOf = 7,
};

enum class Alignment : std::uint8_t { Top = 0, Bottom = 1, Center = 2, Left = 3, Right = 4 };

enum class DoorType : std::uint8_t { Door = 0, DoubleDoor = 1, Opening = 2 };

enum class SwingDirection : std::uint8_t { Left = 0, Right = 1 };

enum class TurnDirection : std::uint8_t { Left = 0, Right = 1 };

enum class Rotation : std::uint8_t { Clockwise = 0, Counterclockwise = 1 };

enum class Handrail : std::uint8_t { Left, Right, Both, Inner, Outer, None };

enum class Stringers : std::uint8_t { Open, Closed, Glass };

enum class RoomKind : std::uint8_t { TopLevel = 0, SubRoom = 1 };

// =============================================================================
// Rooms
// =============================================================================

struct RelativePosition {
    RelativeDirection direction{RelativeDirection::RightOf};
    std::string reference;
    std::optional<Length> gap;
    std::optional<Alignment> alignment;
};

struct WallSpec {
    WallDirection direction{WallDirection::Top};
    WallType type{WallType::Solid};
    std::optional<double> position;   // along the wall
    bool isPercentage{false};
    std::optional<Dimension> size;    // door/window override
    std::optional<double> wallHeight;
};

struct Room {
    std::string name;
    RoomKind kind{RoomKind::TopLevel};
    std::optional<Coordinate> position;
    std::optional<RelativePosition> relative;
    std::optional<Dimension> size;
    std::optional<std::string> sizeRef;
    std::vector<WallSpec> walls;
    std::vector<Room> subRooms;
    std::optional<Length> height;
    std::optional<Length> elevation; // signed
    std::optional<std::string> styleRef;
    std::optional<std::string> label;
};

// =============================================================================
// Connections
// =============================================================================

// An empty room name denotes the building exterior.
struct ConnectionEnd {
    std::string room;
    std::optional<WallDirection> wall;
};

struct ConnectionSize {
    Length width;
    std::optional<Length> height;
    bool fullHeight{false};
};

struct Connection {
    ConnectionEnd from;
    ConnectionEnd to;
    DoorType doorType{DoorType::Door};
    std::optional<double> position;   // percent along the shared wall
    std::optional<SwingDirection> swing;
    std::optional<std::string> opensInto;
    std::optional<ConnectionSize> size;
};

struct VerticalLink {
    std::string floor;
    std::string element;
};

struct VerticalConnection {
    std::vector<VerticalLink> links;
};

// =============================================================================
// Stairs and lifts
// =============================================================================

struct Landing {
    Length width;
    Length height;
};

struct StraightStair {
    WallDirection direction{WallDirection::Top}; // climb direction
};

struct LShapedStair {
    WallDirection entry{WallDirection::Bottom};
    TurnDirection turn{TurnDirection::Right};
    std::vector<int> runs;
    std::optional<Landing> landing;
};

struct UShapedStair {
    WallDirection entry{WallDirection::Bottom};
    TurnDirection turn{TurnDirection::Right};
    std::vector<int> runs;
    std::optional<Landing> landing;
};

struct DoubleLStair {
    WallDirection entry{WallDirection::Bottom};
    TurnDirection turn{TurnDirection::Right};
    std::vector<int> runs;
    std::optional<Landing> landing;
};

struct SpiralStair {
    Rotation rotation{Rotation::Clockwise};
    Length outerRadius;
    std::optional<Length> innerRadius;
};

struct CurvedStair {
    WallDirection entry{WallDirection::Bottom};
    double arc{90.0}; // degrees
    Length radius;
};

struct WinderStair {
    WallDirection entry{WallDirection::Bottom};
    TurnDirection turn{TurnDirection::Right};
    int winders{3};
    std::vector<int> runs;
};

struct WallRef {
    std::string room;
    WallDirection wall{WallDirection::Top};
};

struct FlightSegment {
    int steps{0};
    std::optional<Length> width;
    std::optional<WallRef> wallRef;
};

struct TurnSegment {
    TurnDirection direction{TurnDirection::Right};
    std::optional<Landing> landing;
    std::optional<int> winders;
    std::optional<double> angle; // 90 or 180
};

using StairSegment = std::variant<FlightSegment, TurnSegment>;

struct SegmentedStair {
    WallDirection entry{WallDirection::Bottom};
    std::vector<StairSegment> segments;
};

using StairShape = std::variant<
    StraightStair,
    LShapedStair,
    UShapedStair,
    DoubleLStair,
    SpiralStair,
    CurvedStair,
    WinderStair,
    SegmentedStair>;

struct Stair {
    std::string name;
    std::optional<Coordinate> position;
    StairShape shape;
    std::optional<Length> rise;
    std::optional<Length> width;
    std::optional<Length> riser;
    std::optional<Length> tread;
    std::optional<Length> nosing;
    std::optional<Length> headroom;
    std::optional<Handrail> handrail;
    std::optional<Stringers> stringers;
    std::vector<std::pair<std::string, std::string>> material;
    std::optional<std::string> label;
    std::optional<std::string> styleRef;
};

struct Lift {
    std::string name;
    std::optional<Coordinate> position;
    Dimension size;
    std::vector<WallDirection> doors;
    std::optional<std::string> label;
    std::optional<std::string> styleRef;
};

// =============================================================================
// Document
// =============================================================================

struct Floor {
    std::string id;
    std::vector<Room> rooms;
    std::vector<Stair> stairs;
    std::vector<Lift> lifts;
    std::optional<Length> height;
};

struct VariableDef {
    std::string name;
    Dimension size;
};

struct StyleDef {
    std::string name;
    std::optional<std::string> floorColor;
    std::optional<std::string> wallColor;
    std::optional<std::string> floorTexture;
    std::optional<std::string> wallTexture;
    std::optional<double> roughness;
    std::optional<double> metalness;
};

// Identifiers (units, style names, themes, stair codes) and quoted strings
// both arrive as std::string.
using ConfigValue = std::variant<double, Dimension, bool, std::string>;

struct ConfigProperty {
    std::string name;
    ConfigValue value;
};

struct Floorplan {
    std::optional<std::string> version;
    std::vector<Floor> floors;
    std::vector<Connection> connections;
    std::vector<VerticalConnection> verticalConnections;
    std::vector<VariableDef> variables;
    std::vector<StyleDef> styles;
    std::vector<ConfigProperty> config;
};

// =============================================================================
// Resolution results
// =============================================================================

struct ResolvedPosition {
    double x{0.0};
    double y{0.0};
};

struct ResolvedSize {
    double width{0.0};
    double height{0.0};
};

enum class ResolutionErrorKind : std::uint8_t {
    NoPosition = 0,
    MissingReference = 1,
    CircularDependency = 2,
    UndefinedVariable = 3,
    DuplicateDefinition = 4,
};

struct ResolutionError {
    ResolutionErrorKind kind;
    std::string element;
    std::string message;
};

enum class WarningKind : std::uint8_t {
    Overlap,
    NonSolidWall,
    WallTypeMismatch,
    NoSharedBoundary,
    ConnectionTooWide,
    ConnectionTooTall,
    OverlappingConnections,
    SharedWallConflict,
    HeightMismatch,
    MixedUnitSystems,
    RoomExceedsFloorHeight,
    ConflictingConfig,
    UndefinedStyle,
    DuplicateStyle,
    BuildingCode,
    VerticalConnection,
    Version,
    Deprecation,
};

struct Warning {
    WarningKind kind;
    std::string element;
    std::string message;
};

// Names used by JSON, SVG attributes and messages.
const char* toString(LengthUnit u) noexcept;
const char* toString(WallDirection d) noexcept;
const char* toString(WallType t) noexcept;
const char* toString(DoorType t) noexcept;
const char* toString(SwingDirection s) noexcept;
const char* toString(TurnDirection t) noexcept;
const char* toString(Rotation r) noexcept;
const char* toString(Handrail h) noexcept;
const char* toString(Stringers s) noexcept;
const char* toString(ResolutionErrorKind k) noexcept;
const char* toString(WarningKind k) noexcept;

} // namespace floorplan

#endif // FLOORPLAN_TYPES_H
