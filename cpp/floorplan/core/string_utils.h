#pragma once

#include <charconv>
#include <cmath>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace floorplan {

// =============================================================================
// Number formatting
// =============================================================================

/**
 * Shortest round-trip decimal form of a double, without a trailing ".0" for
 * integral values. Output is locale-independent so SVG text stays byte-stable.
 */
inline std::string formatNumber(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v > 0 ? "Infinity" : "-Infinity";
    if (v == 0.0) return "0"; // also folds -0
    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}

// Fixed-point formatting, as used by human-facing labels ("12.5 sqft").
inline std::string formatFixed(double v, int digits) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", digits, v);
    return std::string(buf);
}

// =============================================================================
// Text helpers
// =============================================================================

// Remove a single pair of surrounding quotes ('x' or "x"), if present.
inline std::string stripQuotes(std::string_view s) {
    if (!s.empty() && (s.front() == '"' || s.front() == '\'')) s.remove_prefix(1);
    if (!s.empty() && (s.back() == '"' || s.back() == '\'')) s.remove_suffix(1);
    return std::string(s);
}

// Escape text for use as XML character data or attribute value.
inline std::string escapeXml(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

inline std::string joinNames(const std::vector<std::string>& names, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += sep;
        out += names[i];
    }
    return out;
}

} // namespace floorplan
