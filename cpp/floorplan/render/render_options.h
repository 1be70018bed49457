#ifndef FLOORPLAN_RENDER_OPTIONS_H
#define FLOORPLAN_RENDER_OPTIONS_H

#include "floorplan/types.h"
#include "floorplan/config.h"
#include "floorplan/variables.h"
#include "floorplan/position/position_resolver.h"
#include "floorplan/style/style_resolver.h"
#include "floorplan/style/theme.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace floorplan {

enum class MultiFloorLayout : std::uint8_t { SideBySide = 0, Stacked = 1 };

enum class DimensionType : std::uint8_t { Width = 0, Depth = 1, Height = 2 };

struct RenderOptions {
    bool includeXmlDeclaration{false};
    bool includeStyles{true};
    std::optional<style::ThemeOptions> theme;  // replaces the config-derived theme
    double padding{0.0};
    double scale{1.0};
    std::size_t floorIndex{0};
    bool renderAllFloors{false};
    MultiFloorLayout multiFloorLayout{MultiFloorLayout::SideBySide};
    bool showArea{false};
    AreaUnit areaUnit{AreaUnit::Sqft};
    LengthUnit lengthUnit{LengthUnit::Ft};    // suffix on dimension labels
    bool showFloorSummary{false};
    std::optional<bool> showDimensions;       // unset: config show_dimensions
    std::vector<DimensionType> dimensionTypes{DimensionType::Width, DimensionType::Depth};
};

// One floor plus the resolved data the element renderers read.
struct FloorScene {
    const Floor& floor;
    const PositionMap& positions;
    const VariableMap& variables;
    const style::StyleContext& styles;
    LengthUnit defaultUnit{LengthUnit::Ft};
    bool showLabels{true};
};

} // namespace floorplan

#endif // FLOORPLAN_RENDER_OPTIONS_H
