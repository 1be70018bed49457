#ifndef FLOORPLAN_STYLE_THEME_H
#define FLOORPLAN_STYLE_THEME_H

#include "floorplan/config.h"
#include <optional>
#include <string>
#include <string_view>

namespace floorplan::style {

// Palette and font used by the embedded SVG stylesheet.
struct ThemeOptions {
    std::string floorBackground;
    std::string floorBorder;
    std::string roomBackground;
    std::string roomBorder;
    std::string wallColor;
    std::string wallStroke;
    std::string doorFill;
    std::string doorStroke;
    std::string windowFill;
    std::string windowStroke;
    std::string textColor;
    std::string labelColor;
    std::string sizeColor;
    std::string fontFamily;
    std::string fontSize;
};

ThemeOptions defaultTheme();
ThemeOptions darkTheme();
ThemeOptions blueprintTheme();

// "default", "dark" or "blueprint"; nullopt for anything else.
std::optional<ThemeOptions> getThemeByName(std::string_view name);

// Named theme, else dark when darkMode is set, else default; then explicit
// font family / size from the config override the palette values.
ThemeOptions resolveThemeOptions(const ResolvedConfig& config);

// CSS rules for the classes the renderer emits.
std::string getStyles(const ThemeOptions& theme);

} // namespace floorplan::style

#endif // FLOORPLAN_STYLE_THEME_H
