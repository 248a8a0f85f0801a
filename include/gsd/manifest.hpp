#pragma once

/**
 * @file manifest.hpp
 * @brief The installed-files manifest and its on-disk store
 *
 * The manifest is the single source of truth for which files the tool
 * owns. Wire format is a pretty-printed JSON array:
 *
 *   [
 *     {
 *       "path": "/home/u/.config/opencode/agents/gsd-planner.md",
 *       "relativePath": "agents/gsd-planner.md",
 *       "size": 1234,
 *       "hash": "sha256:..."
 *     }
 *   ]
 *
 * The absolute `path` is informational; every operation resolves
 * `root / relativePath`.
 */

#include "gsd/namespace_rules.hpp"
#include "gsd/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gsd {

struct ManifestEntry {
    std::string path;           // absolute path at install time
    std::string relative_path;  // '/' separated, relative to the root
    uint64_t size = 0;
    std::string hash;           // "sha256:<hex>"

    bool operator==(const ManifestEntry& other) const {
        return relative_path == other.relative_path && size == other.size &&
               hash == other.hash;
    }
    bool operator!=(const ManifestEntry& other) const { return !(*this == other); }
};

enum class ManifestLoadStatus {
    Absent,
    Corrupt,
    Loaded
};

inline const char* manifest_status_to_string(ManifestLoadStatus s) {
    switch (s) {
        case ManifestLoadStatus::Absent: return "absent";
        case ManifestLoadStatus::Corrupt: return "corrupt";
        case ManifestLoadStatus::Loaded: return "loaded";
        default: return "unknown";
    }
}

struct Manifest {
    ManifestLoadStatus status = ManifestLoadStatus::Absent;
    std::vector<ManifestEntry> entries;
    std::string version;                // version marker content, trimmed
    std::string error;                  // parse error when Corrupt
    std::vector<std::string> warnings;  // dropped entries

    bool loaded() const { return status == ManifestLoadStatus::Loaded; }
    const ManifestEntry* find(const std::string& relative_path) const;
};

// ============================================================================
// Serialization
// ============================================================================

std::string serialize_manifest(const std::vector<ManifestEntry>& entries);

// Parse manifest JSON. Entries with unsafe relative paths are dropped and
// reported in `warnings`; a malformed document yields status Corrupt.
Manifest parse_manifest(const std::string& json_str);

// ============================================================================
// Manifest Manager
// ============================================================================

class ManifestManager {
public:
    ManifestManager(std::string root, PackageLayout layout);

    Manifest load() const;

    // Atomically write the version marker and then the manifest
    Result<void> save(const std::vector<ManifestEntry>& entries,
                      const std::string& version) const;

    // Accumulate entries; replaces an existing entry with the same relPath
    const ManifestEntry& add_file(const std::string& absolute_path,
                                  const std::string& relative_path,
                                  uint64_t size,
                                  const std::string& hash);

    const std::vector<ManifestEntry>& entries() const { return entries_; }
    void set_entries(std::vector<ManifestEntry> entries) { entries_ = std::move(entries); }
    void clear() { entries_.clear(); }

    static bool is_in_namespace(const std::string& relative_path, const NamespaceRules& rules) {
        return rules.matches(relative_path);
    }

    // Delete manifest and version marker
    Result<void> remove() const;

    std::string read_version() const;
    Result<void> write_version(const std::string& version) const;

    bool manifest_exists() const;
    bool version_exists() const;

    const std::string& root() const { return root_; }
    std::string manifest_path() const;
    std::string version_path() const;

private:
    std::string root_;
    PackageLayout layout_;
    std::vector<ManifestEntry> entries_;
};

} // namespace gsd
