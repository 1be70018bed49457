#include "floorplan/version/version_resolver.h"
#include "floorplan/core/logging.h"
#include "floorplan/core/string_utils.h"

#include <charconv>
#include <stdexcept>
#include <system_error>

namespace floorplan {

static bool parseComponent(std::string_view part, int& out) {
    if (part.empty()) return false;
    const auto res = std::from_chars(part.data(), part.data() + part.size(), out);
    return res.ec == std::errc() && res.ptr == part.data() + part.size() && out >= 0;
}

SemanticVersion parseVersion(std::string_view text) {
    const std::string cleaned = stripQuotes(text);
    std::vector<std::string_view> parts;
    std::string_view rest(cleaned);
    while (true) {
        const auto dot = rest.find('.');
        parts.push_back(rest.substr(0, dot));
        if (dot == std::string_view::npos) break;
        rest.remove_prefix(dot + 1);
    }

    if (parts.size() < 2 || parts.size() > 3) {
        throw std::invalid_argument("Expected format X.Y or X.Y.Z, got '" + cleaned + "'");
    }

    int values[3] = {0, 0, 0};
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (!parseComponent(parts[i], values[i])) {
            throw std::invalid_argument("Version components must be non-negative integers, got '" + cleaned + "'");
        }
    }
    return SemanticVersion{values[0], values[1], values[2]};
}

int compareVersions(const SemanticVersion& a, const SemanticVersion& b) noexcept {
    if (a.major != b.major) return a.major - b.major;
    if (a.minor != b.minor) return a.minor - b.minor;
    return a.patch - b.patch;
}

std::string formatVersion(const SemanticVersion& v) {
    return std::to_string(v.major) + "." + std::to_string(v.minor) + "." + std::to_string(v.patch);
}

bool isCompatibleVersion(const SemanticVersion& v) noexcept {
    return v.major == kCurrentVersion.major && compareVersions(v, kCurrentVersion) <= 0;
}

bool isFutureVersion(const SemanticVersion& v) noexcept {
    return compareVersions(v, kCurrentVersion) > 0;
}

VersionResolution resolveVersion(const std::optional<std::string>& declared) {
    VersionResolution out;
    const std::string current = kCurrentVersionString;

    if (!declared || stripQuotes(*declared).empty()) {
        out.warnings.push_back(
            "No grammar version declared. Assuming version " + current + ". Add '%%{version: " + current +
            "}%%' or YAML frontmatter with 'version: \"" + current + "\"' to suppress this warning.");
        return out;
    }

    SemanticVersion parsed;
    try {
        parsed = parseVersion(*declared);
    } catch (const std::invalid_argument& e) {
        FLOORPLAN_LOG_WARN("invalid grammar version '%s'", declared->c_str());
        out.errors.push_back("Invalid version format: " + stripQuotes(*declared) + ". " + e.what());
        return out;
    }

    out.declared = true;
    out.version = parsed;
    const std::string requested = formatVersion(parsed);

    if (isFutureVersion(parsed)) {
        out.errors.push_back(
            "Unsupported grammar version: " + requested + ". This parser supports up to version " + current +
            ". Please upgrade your parser or use an older grammar version.");
    } else if (parsed.major < kCurrentVersion.major) {
        out.warnings.push_back(
            "Using legacy grammar version " + requested + ". Current version is " + current +
            ". Consider running 'floorplan migrate <file> --to " + current + "' to upgrade.");
    }
    return out;
}

} // namespace floorplan
