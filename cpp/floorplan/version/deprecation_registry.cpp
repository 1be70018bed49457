#include "floorplan/version/deprecation_registry.h"
#include "floorplan/core/logging.h"

namespace floorplan {

namespace {

constexpr SemanticVersion kSplitSizeDeprecated{1, 1, 0};
constexpr SemanticVersion kSplitSizeRemoved{2, 0, 0};

DeprecationInfo splitSizeEntry(const std::string& feature, const std::string& prefix) {
    return DeprecationInfo{
        feature,
        "Separate " + prefix + "_width and " + prefix + "_height config properties",
        kSplitSizeDeprecated,
        kSplitSizeRemoved,
        prefix + "_size",
        "Replace `" + prefix + "_width: X` and `" + prefix + "_height: Y` with `" + prefix + "_size: (X x Y)`"};
}

} // namespace

const std::vector<DeprecationInfo>& deprecationRegistry() {
    static const std::vector<DeprecationInfo> registry = {
        splitSizeEntry("door_width", "door"),
        splitSizeEntry("door_height", "door"),
        splitSizeEntry("window_width", "window"),
        splitSizeEntry("window_height", "window"),
    };
    return registry;
}

const DeprecationInfo* findDeprecation(std::string_view feature) noexcept {
    for (const DeprecationInfo& info : deprecationRegistry()) {
        if (info.feature == feature) return &info;
    }
    return nullptr;
}

const DeprecationInfo* isDeprecated(std::string_view feature, const SemanticVersion& version) noexcept {
    const DeprecationInfo* info = findDeprecation(feature);
    if (!info) return nullptr;
    return compareVersions(version, info->deprecatedIn) >= 0 ? info : nullptr;
}

bool isRemoved(std::string_view feature, const SemanticVersion& version) noexcept {
    const DeprecationInfo* info = findDeprecation(feature);
    return info && compareVersions(version, info->removedIn) >= 0;
}

std::vector<DeprecationInfo> getActiveDeprecations(const SemanticVersion& version) {
    std::vector<DeprecationInfo> out;
    for (const DeprecationInfo& info : deprecationRegistry()) {
        if (compareVersions(version, info.deprecatedIn) >= 0 && compareVersions(version, info.removedIn) < 0) {
            out.push_back(info);
        }
    }
    return out;
}

std::vector<DeprecationInfo> getRemovedFeatures(const SemanticVersion& version) {
    std::vector<DeprecationInfo> out;
    for (const DeprecationInfo& info : deprecationRegistry()) {
        if (compareVersions(version, info.removedIn) >= 0) out.push_back(info);
    }
    return out;
}

std::optional<std::string> getDeprecationWarning(std::string_view feature) {
    const DeprecationInfo* info = findDeprecation(feature);
    if (!info) return std::nullopt;
    const std::string removed = formatVersion(info->removedIn);
    return "Deprecation warning: '" + info->feature + "' is deprecated since version " +
        formatVersion(info->deprecatedIn) + ".\n" +
        "    " + info->migrationGuide + "\n" +
        "    This will become an error in version " + removed + ".\n" +
        "    Run 'floorplan migrate <file> --to " + removed + "' to auto-fix.";
}

std::optional<std::string> getRemovalError(std::string_view feature) {
    const DeprecationInfo* info = findDeprecation(feature);
    if (!info) return std::nullopt;
    return "Error: '" + info->feature + "' was removed in version " + formatVersion(info->removedIn) + ".\n" +
        "    " + info->migrationGuide + "\n" +
        "    Use '" + info->replacement + "' instead.";
}

DeprecationReport checkDeprecatedConfig(const Floorplan& floorplan, const SemanticVersion& version) {
    DeprecationReport report;
    for (const ConfigProperty& prop : floorplan.config) {
        if (isRemoved(prop.name, version)) {
            if (auto msg = getRemovalError(prop.name)) report.errors.push_back(*msg);
            continue;
        }
        if (isDeprecated(prop.name, version)) {
            if (auto msg = getDeprecationWarning(prop.name)) {
                FLOORPLAN_LOG_WARN("deprecated config key '%s'", prop.name.c_str());
                report.warnings.push_back(Warning{WarningKind::Deprecation, prop.name, *msg});
            }
        }
    }
    return report;
}

} // namespace floorplan
