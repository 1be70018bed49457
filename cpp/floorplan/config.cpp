#include "floorplan/config.h"
#include "floorplan/core/logging.h"
#include "floorplan/core/string_utils.h"
#include "floorplan/units.h"

#include <cctype>

namespace floorplan {

const char* toString(AreaUnit u) noexcept {
    return u == AreaUnit::Sqm ? "sqm" : "sqft";
}

const char* toString(StairCode c) noexcept {
    switch (c) {
        case StairCode::None: return "none";
        case StairCode::Residential: return "residential";
        case StairCode::Commercial: return "commercial";
        case StairCode::Ada: return "ada";
    }
    return "none";
}

std::optional<AreaUnit> parseAreaUnit(std::string_view s) noexcept {
    if (s == "sqft") return AreaUnit::Sqft;
    if (s == "sqm") return AreaUnit::Sqm;
    return std::nullopt;
}

std::optional<StairCode> parseStairCode(std::string_view s) noexcept {
    if (s == "none") return StairCode::None;
    if (s == "residential") return StairCode::Residential;
    if (s == "commercial") return StairCode::Commercial;
    if (s == "ada") return StairCode::Ada;
    return std::nullopt;
}

std::string normalizeConfigKey(std::string_view key) {
    std::string out;
    out.reserve(key.size());
    bool upperNext = false;
    for (const char c : key) {
        if (c == '_') {
            upperNext = !out.empty();
            continue;
        }
        if (upperNext) {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            upperNext = false;
        } else {
            out += c;
        }
    }
    return out;
}

const ConfigProperty* findConfigProperty(const Floorplan& floorplan, std::string_view name) noexcept {
    for (const ConfigProperty& prop : floorplan.config) {
        if (prop.name == name) return &prop;
    }
    return nullptr;
}

namespace {

void applyNumber(ResolvedConfig& cfg, const std::string& key, double v) {
    if (key == "wallThickness") cfg.wallThickness = v;
    else if (key == "floorThickness") cfg.floorThickness = v;
    else if (key == "defaultHeight") cfg.defaultHeight = v;
    else if (key == "doorWidth") cfg.doorWidth = v;
    else if (key == "doorHeight") cfg.doorHeight = v;
    else if (key == "windowWidth") cfg.windowWidth = v;
    else if (key == "windowHeight") cfg.windowHeight = v;
    else if (key == "windowSill") cfg.windowSill = v;
    else if (key == "fontSize") {
        cfg.fontSize = v;
        cfg.fontSizeDeclared = true;
    } else {
        FLOORPLAN_LOG_DEBUG("config: numeric key '%s' not recognised", key.c_str());
    }
}

void applyText(ResolvedConfig& cfg, const std::string& key, const std::string& raw) {
    const std::string v = stripQuotes(raw);
    if (key == "theme") {
        cfg.theme = v;
    } else if (key == "defaultStyle") {
        cfg.defaultStyle = v;
    } else if (key == "defaultUnit") {
        if (auto unit = parseLengthUnit(v)) {
            cfg.defaultUnit = *unit;
            cfg.defaultUnitDeclared = true;
        } else {
            FLOORPLAN_LOG_WARN("config: unknown default_unit '%s'", v.c_str());
        }
    } else if (key == "areaUnit") {
        if (auto unit = parseAreaUnit(v)) cfg.areaUnit = *unit;
    } else if (key == "fontFamily") {
        cfg.fontFamily = v;
        cfg.fontFamilyDeclared = true;
    } else if (key == "stairCode") {
        if (auto code = parseStairCode(v)) cfg.stairCode = *code;
    }
}

void applyBool(ResolvedConfig& cfg, const std::string& key, bool v) {
    if (key == "darkMode") cfg.darkMode = v;
    else if (key == "showLabels") cfg.showLabels = v;
    else if (key == "showDimensions") cfg.showDimensions = v;
}

void applyDimension(ResolvedConfig& cfg, const std::string& key, const Dimension& d) {
    const ResolvedSize size{d.width.value, d.height.value};
    if (key == "doorSize") cfg.doorSize = size;
    else if (key == "windowSize") cfg.windowSize = size;
}

} // namespace

ResolvedConfig resolveConfig(const Floorplan& floorplan) {
    ResolvedConfig cfg;
    for (const ConfigProperty& prop : floorplan.config) {
        const std::string key = normalizeConfigKey(prop.name);
        if (const auto* number = std::get_if<double>(&prop.value)) {
            applyNumber(cfg, key, *number);
        } else if (const auto* text = std::get_if<std::string>(&prop.value)) {
            applyText(cfg, key, *text);
        } else if (const auto* flag = std::get_if<bool>(&prop.value)) {
            applyBool(cfg, key, *flag);
        } else if (const auto* dim = std::get_if<Dimension>(&prop.value)) {
            applyDimension(cfg, key, *dim);
        }
    }
    return cfg;
}

} // namespace floorplan
