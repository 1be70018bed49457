#ifndef FLOORPLAN_VERSION_RESOLVER_H
#define FLOORPLAN_VERSION_RESOLVER_H

#include "floorplan/types.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace floorplan {

struct SemanticVersion {
    int major{0};
    int minor{0};
    int patch{0};
};

// Newest grammar version this engine understands.
constexpr SemanticVersion kCurrentVersion{1, 0, 0};
constexpr const char* kCurrentVersionString = "1.0.0";

// "X.Y" or "X.Y.Z", optionally quoted. Throws std::invalid_argument otherwise.
SemanticVersion parseVersion(std::string_view text);

int compareVersions(const SemanticVersion& a, const SemanticVersion& b) noexcept;
std::string formatVersion(const SemanticVersion& v);

// Same major as the current version and not newer than it.
bool isCompatibleVersion(const SemanticVersion& v) noexcept;
bool isFutureVersion(const SemanticVersion& v) noexcept;

struct VersionResolution {
    SemanticVersion version{kCurrentVersion};
    bool declared{false};
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
};

/**
 * Resolve the document's declared grammar version.
 *
 * A missing declaration assumes the current version with a warning. A
 * malformed or newer-than-supported version is an error. An older major
 * version is accepted with a migration hint.
 */
VersionResolution resolveVersion(const std::optional<std::string>& declared);

} // namespace floorplan

#endif // FLOORPLAN_VERSION_RESOLVER_H
