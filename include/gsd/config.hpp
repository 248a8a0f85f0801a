#pragma once

/**
 * @file config.hpp
 * @brief Project profile configuration (.planning/config.json)
 *
 * The profile section is a closed set of shapes:
 *   - LegacyProfileConfig: top-level "model_profile" in {quality, balanced, budget}
 *   - ConfigV1:            "profiles": { "profile_type", "models": {...} }
 * Anything else is rejected with CONFIG_INVALID. Keys outside the profile
 * section are carried through migration untouched.
 */

#include "gsd/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>

namespace gsd {

enum class ProfileType {
    Simple,
    Smart,
    Genius
};

const char* profile_type_to_string(ProfileType t);
std::optional<ProfileType> parse_profile_type(const std::string& str);

constexpr const char* kDefaultModel = "opencode/default";

struct ModelAssignment {
    std::string planning = kDefaultModel;
    std::string execution = kDefaultModel;
    std::string verification = kDefaultModel;
};

struct LegacyProfileConfig {
    std::string model_profile;
};

struct ConfigV1 {
    ProfileType profile_type = ProfileType::Smart;
    ModelAssignment models;
};

using ProfileConfig = std::variant<LegacyProfileConfig, ConfigV1>;

Result<ProfileConfig> parse_profile_config(const nlohmann::json& j);

struct ConfigMigration {
    bool needed = false;
    std::string from;               // legacy model_profile
    ConfigV1 to;
    nlohmann::json document;        // migrated document (or the input if not needed)
};

// Convert a legacy document to ConfigV1, preserving unrelated keys and
// model_profile for backward compatibility.
Result<ConfigMigration> migrate_config(const nlohmann::json& j);

// ============================================================================
// Config File
// ============================================================================

struct MigrateOutcome {
    ConfigMigration migration;
    bool written = false;
    std::string backup_path;
};

class ProfileConfigFile {
public:
    // project_dir contains .planning/config.json
    explicit ProfileConfigFile(std::string project_dir);

    const std::string& path() const { return path_; }

    Result<nlohmann::json> read() const;
    Result<ProfileConfig> load() const;

    // Backs the file up to config.json.bak, then writes atomically
    Result<MigrateOutcome> migrate(bool dry_run) const;

private:
    std::string path_;
};

} // namespace gsd
