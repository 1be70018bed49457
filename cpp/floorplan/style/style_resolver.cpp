#include "floorplan/style/style_resolver.h"
#include "floorplan/core/string_utils.h"

namespace floorplan::style {

namespace {

ResolvedStyle toResolved(const StyleDef& def) {
    ResolvedStyle out = defaultStyle();
    if (def.floorColor) out.floorColor = stripQuotes(*def.floorColor);
    if (def.wallColor) out.wallColor = stripQuotes(*def.wallColor);
    if (def.floorTexture) out.floorTexture = stripQuotes(*def.floorTexture);
    if (def.wallTexture) out.wallTexture = stripQuotes(*def.wallTexture);
    if (def.roughness) out.roughness = *def.roughness;
    if (def.metalness) out.metalness = *def.metalness;
    return out;
}

} // namespace

ResolvedStyle defaultStyle() {
    return ResolvedStyle{"#E0E0E0", "#000000", std::nullopt, std::nullopt, 0.8, 0.1};
}

StyleContext buildStyleContext(const Floorplan& floorplan) {
    StyleContext ctx;
    for (const StyleDef& def : floorplan.styles) {
        ctx.styles.emplace(def.name, &def);
    }
    for (const ConfigProperty& prop : floorplan.config) {
        if (prop.name != "default_style") continue;
        if (const auto* name = std::get_if<std::string>(&prop.value)) {
            ctx.defaultStyleName = stripQuotes(*name);
            break;
        }
    }
    return ctx;
}

std::optional<ResolvedStyle> getStyleByName(const std::string& name, const StyleContext& ctx) {
    const auto it = ctx.styles.find(name);
    if (it == ctx.styles.end()) return std::nullopt;
    return toResolved(*it->second);
}

ResolvedStyle resolveRoomStyle(const Room& room, const StyleContext& ctx) {
    if (room.styleRef) {
        if (auto style = getStyleByName(*room.styleRef, ctx)) return *style;
    }
    if (ctx.defaultStyleName) {
        if (auto style = getStyleByName(*ctx.defaultStyleName, ctx)) return *style;
    }
    return defaultStyle();
}

} // namespace floorplan::style
