#ifndef FLOORPLAN_STYLE_RESOLVER_H
#define FLOORPLAN_STYLE_RESOLVER_H

#include "floorplan/types.h"
#include <map>
#include <optional>
#include <string>

namespace floorplan::style {

struct ResolvedStyle {
    std::string floorColor;
    std::string wallColor;
    std::optional<std::string> floorTexture;
    std::optional<std::string> wallTexture;
    double roughness;
    double metalness;
};

// Flat gray floor, black walls.
ResolvedStyle defaultStyle();

struct StyleContext {
    std::map<std::string, const StyleDef*> styles; // first definition wins
    std::optional<std::string> defaultStyleName;
};

// The context points into `floorplan`, which must outlive it.
StyleContext buildStyleContext(const Floorplan& floorplan);

// room.styleRef -> config default_style -> built-in default.
ResolvedStyle resolveRoomStyle(const Room& room, const StyleContext& ctx);

std::optional<ResolvedStyle> getStyleByName(const std::string& name, const StyleContext& ctx);

} // namespace floorplan::style

#endif // FLOORPLAN_STYLE_RESOLVER_H
