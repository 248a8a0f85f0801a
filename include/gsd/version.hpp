#pragma once

/**
 * @file version.hpp
 * @brief Semantic Versioning 2.0.0 helpers for pinned update targets
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>

namespace gsd {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/// Parse a version string, tolerating surrounding whitespace and a leading 'v'
std::optional<Version> parse_version(const std::string& str);

enum class VersionChange {
    Same,
    Upgrade,
    Downgrade,
    Unknown     ///< either side is not valid SemVer
};

inline const char* version_change_to_string(VersionChange c) {
    switch (c) {
        case VersionChange::Same: return "same";
        case VersionChange::Upgrade: return "upgrade";
        case VersionChange::Downgrade: return "downgrade";
        case VersionChange::Unknown: return "unknown";
        default: return "unknown";
    }
}

/// Direction of a move from `installed` to `target`
VersionChange classify_change(const std::string& installed, const std::string& target);

} // namespace gsd
