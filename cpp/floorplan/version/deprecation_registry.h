#ifndef FLOORPLAN_DEPRECATION_REGISTRY_H
#define FLOORPLAN_DEPRECATION_REGISTRY_H

#include "floorplan/types.h"
#include "floorplan/version/version_resolver.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace floorplan {

struct DeprecationInfo {
    std::string feature;
    std::string description;
    SemanticVersion deprecatedIn;
    SemanticVersion removedIn;
    std::string replacement;
    std::string migrationGuide;
};

const std::vector<DeprecationInfo>& deprecationRegistry();

const DeprecationInfo* findDeprecation(std::string_view feature) noexcept;

// Registry entry when `version` is at or past its deprecation, else nullptr.
const DeprecationInfo* isDeprecated(std::string_view feature, const SemanticVersion& version) noexcept;
bool isRemoved(std::string_view feature, const SemanticVersion& version) noexcept;

std::vector<DeprecationInfo> getActiveDeprecations(const SemanticVersion& version);
std::vector<DeprecationInfo> getRemovedFeatures(const SemanticVersion& version);

std::optional<std::string> getDeprecationWarning(std::string_view feature);
std::optional<std::string> getRemovalError(std::string_view feature);

struct DeprecationReport {
    std::vector<Warning> warnings;
    std::vector<std::string> errors;
};

// Apply the registry to the document's config keys at `version`.
DeprecationReport checkDeprecatedConfig(const Floorplan& floorplan, const SemanticVersion& version);

} // namespace floorplan

#endif // FLOORPLAN_DEPRECATION_REGISTRY_H
