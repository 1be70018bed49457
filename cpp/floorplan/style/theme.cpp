#include "floorplan/style/theme.h"
#include "floorplan/core/logging.h"
#include "floorplan/core/string_utils.h"

namespace floorplan::style {

ThemeOptions defaultTheme() {
    ThemeOptions t;
    t.floorBackground = "#eed";
    t.floorBorder = "#000";
    t.roomBackground = "transparent";
    t.roomBorder = "#000";
    t.wallColor = "#000";
    t.wallStroke = "#000";
    t.doorFill = "#fff";
    t.doorStroke = "#000";
    t.windowFill = "#fff";
    t.windowStroke = "#000";
    t.textColor = "#000";
    t.labelColor = "#000";
    t.sizeColor = "#666";
    t.fontFamily = "Arial, sans-serif";
    t.fontSize = "0.8";
    return t;
}

ThemeOptions darkTheme() {
    ThemeOptions t = defaultTheme();
    t.floorBackground = "#2d2d2d";
    t.floorBorder = "#888";
    t.wallColor = "#ccc";
    t.wallStroke = "#ccc";
    t.doorFill = "#444";
    t.doorStroke = "#ccc";
    t.windowFill = "#555";
    t.windowStroke = "#ccc";
    t.textColor = "#eee";
    t.labelColor = "#ddd";
    t.sizeColor = "#999";
    return t;
}

ThemeOptions blueprintTheme() {
    ThemeOptions t = defaultTheme();
    t.floorBackground = "#1a365d";
    t.floorBorder = "#4299e1";
    t.wallColor = "#4299e1";
    t.wallStroke = "#4299e1";
    t.doorFill = "#1a365d";
    t.doorStroke = "#63b3ed";
    t.windowFill = "#1a365d";
    t.windowStroke = "#63b3ed";
    t.textColor = "#e2e8f0";
    t.labelColor = "#bee3f8";
    t.sizeColor = "#90cdf4";
    return t;
}

std::optional<ThemeOptions> getThemeByName(std::string_view name) {
    if (name == "default") return defaultTheme();
    if (name == "dark") return darkTheme();
    if (name == "blueprint") return blueprintTheme();
    return std::nullopt;
}

ThemeOptions resolveThemeOptions(const ResolvedConfig& config) {
    ThemeOptions theme = defaultTheme();
    if (config.theme) {
        if (auto named = getThemeByName(*config.theme)) {
            theme = *named;
        } else {
            FLOORPLAN_LOG_WARN("unknown theme '%s', using default", config.theme->c_str());
        }
    } else if (config.darkMode.value_or(false)) {
        theme = darkTheme();
    }

    if (config.fontFamilyDeclared) theme.fontFamily = config.fontFamily;
    if (config.fontSizeDeclared) theme.fontSize = formatNumber(config.fontSize);
    return theme;
}

std::string getStyles(const ThemeOptions& t) {
    std::string css;
    css += ".floor-background { fill: " + t.floorBackground + "; stroke: " + t.floorBorder + "; stroke-width: 0.1; }\n";
    css += ".room-background { stroke: none; }\n";
    css += ".wall { fill: " + t.wallColor + "; stroke: " + t.wallStroke + "; stroke-width: 0.05; }\n";
    css += ".door { fill: " + t.doorFill + "; stroke: " + t.doorStroke + "; stroke-width: 0.05; }\n";
    css += ".window { fill: " + t.windowFill + "; stroke: " + t.windowStroke + "; stroke-width: 0.01; }\n";
    css += ".room-name { fill: " + t.textColor + "; font-family: " + t.fontFamily + "; font-size: " + t.fontSize + "; }\n";
    css += ".room-label { fill: " + t.labelColor + "; font-family: " + t.fontFamily + "; font-size: " + t.fontSize + "; }\n";
    css += ".room-size { fill: " + t.sizeColor + "; font-family: " + t.fontFamily + "; font-size: 0.7; }\n";
    return css;
}

} // namespace floorplan::style
