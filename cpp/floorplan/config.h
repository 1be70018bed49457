#ifndef FLOORPLAN_CONFIG_H
#define FLOORPLAN_CONFIG_H

#include "floorplan/types.h"
#include <optional>
#include <string>
#include <string_view>

namespace floorplan {

enum class AreaUnit : std::uint8_t { Sqft = 0, Sqm = 1 };

enum class StairCode : std::uint8_t { None = 0, Residential = 1, Commercial = 2, Ada = 3 };

const char* toString(AreaUnit u) noexcept;
const char* toString(StairCode c) noexcept;
std::optional<AreaUnit> parseAreaUnit(std::string_view s) noexcept;
std::optional<StairCode> parseStairCode(std::string_view s) noexcept;

/**
 * Document configuration after merging the config block over the defaults.
 * Fields left unset in the document keep the default values below.
 */
struct ResolvedConfig {
    std::optional<std::string> theme;
    std::optional<bool> darkMode;

    double wallThickness{0.2};
    double floorThickness{0.2};
    double defaultHeight{3.35};
    double doorWidth{1.0};
    double doorHeight{2.1};
    std::optional<ResolvedSize> doorSize;
    double windowWidth{1.5};
    double windowHeight{1.5};
    double windowSill{0.9};
    std::optional<ResolvedSize> windowSize;

    std::optional<std::string> defaultStyle;
    LengthUnit defaultUnit{LengthUnit::Ft};
    bool defaultUnitDeclared{false};
    AreaUnit areaUnit{AreaUnit::Sqft};

    std::string fontFamily{"Arial, sans-serif"};
    double fontSize{0.8};
    bool fontFamilyDeclared{false};
    bool fontSizeDeclared{false};

    bool showLabels{true};
    bool showDimensions{false};

    StairCode stairCode{StairCode::None};
};

// door_width -> doorWidth; keys without underscores pass through unchanged.
std::string normalizeConfigKey(std::string_view key);

ResolvedConfig resolveConfig(const Floorplan& floorplan);

// Lookup of a raw config property by name (first match, declared order).
const ConfigProperty* findConfigProperty(const Floorplan& floorplan, std::string_view name) noexcept;

} // namespace floorplan

#endif // FLOORPLAN_CONFIG_H
