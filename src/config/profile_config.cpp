#include "gsd/config.hpp"
#include "gsd/platform.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace gsd {

namespace {

Error invalid(const std::string& msg) {
    return Error(ErrorCode::CONFIG_INVALID, msg);
}

std::optional<ProfileType> legacy_profile_type(const std::string& legacy) {
    if (legacy == "quality") return ProfileType::Genius;
    if (legacy == "balanced") return ProfileType::Smart;
    if (legacy == "budget") return ProfileType::Simple;
    return std::nullopt;
}

nlohmann::json models_to_json(const ModelAssignment& m) {
    return {
        {"planning", m.planning},
        {"execution", m.execution},
        {"verification", m.verification},
    };
}

} // namespace

const char* profile_type_to_string(ProfileType t) {
    switch (t) {
        case ProfileType::Simple: return "simple";
        case ProfileType::Smart: return "smart";
        case ProfileType::Genius: return "genius";
        default: return "unknown";
    }
}

std::optional<ProfileType> parse_profile_type(const std::string& str) {
    if (str == "simple") return ProfileType::Simple;
    if (str == "smart") return ProfileType::Smart;
    if (str == "genius") return ProfileType::Genius;
    return std::nullopt;
}

Result<ProfileConfig> parse_profile_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<ProfileConfig>::err(invalid("config must be a JSON object"));
    }

    if (j.contains("profiles")) {
        const auto& profiles = j["profiles"];
        if (!profiles.is_object()) {
            return Result<ProfileConfig>::err(invalid("'profiles' must be an object"));
        }
        if (profiles.contains("profile_type")) {
            if (!profiles["profile_type"].is_string()) {
                return Result<ProfileConfig>::err(invalid("'profiles.profile_type' must be a string"));
            }
            auto type = parse_profile_type(profiles["profile_type"].get<std::string>());
            if (!type) {
                return Result<ProfileConfig>::err(
                    invalid("unknown profile_type '" + profiles["profile_type"].get<std::string>() +
                            "' (expected simple, smart or genius)"));
            }

            ConfigV1 config;
            config.profile_type = *type;
            if (profiles.contains("models")) {
                const auto& models = profiles["models"];
                if (!models.is_object()) {
                    return Result<ProfileConfig>::err(invalid("'profiles.models' must be an object"));
                }
                if (models.contains("planning") && models["planning"].is_string()) {
                    config.models.planning = models["planning"].get<std::string>();
                }
                if (models.contains("execution") && models["execution"].is_string()) {
                    config.models.execution = models["execution"].get<std::string>();
                }
                if (models.contains("verification") && models["verification"].is_string()) {
                    config.models.verification = models["verification"].get<std::string>();
                }
            }
            return Result<ProfileConfig>::ok(config);
        }
    }

    if (j.contains("model_profile")) {
        if (!j["model_profile"].is_string() ||
            !legacy_profile_type(j["model_profile"].get<std::string>())) {
            return Result<ProfileConfig>::err(
                invalid("unknown model_profile (expected quality, balanced or budget)"));
        }
        return Result<ProfileConfig>::ok(LegacyProfileConfig{j["model_profile"].get<std::string>()});
    }

    return Result<ProfileConfig>::err(invalid("no profile configuration found"));
}

Result<ConfigMigration> migrate_config(const nlohmann::json& j) {
    auto parsed = parse_profile_config(j);
    if (parsed.isErr()) {
        return Result<ConfigMigration>::err(parsed.error());
    }

    ConfigMigration migration;
    migration.document = j;

    if (auto* v1 = std::get_if<ConfigV1>(&parsed.value())) {
        migration.to = *v1;
        return Result<ConfigMigration>::ok(std::move(migration));
    }

    const auto& legacy = std::get<LegacyProfileConfig>(parsed.value());
    migration.needed = true;
    migration.from = legacy.model_profile;
    migration.to.profile_type = *legacy_profile_type(legacy.model_profile);

    if (!migration.document.contains("profiles")) {
        migration.document["profiles"] = nlohmann::json::object();
    }
    migration.document["profiles"]["profile_type"] = profile_type_to_string(migration.to.profile_type);
    migration.document["profiles"]["models"] = models_to_json(migration.to.models);

    return Result<ConfigMigration>::ok(std::move(migration));
}

// ============================================================================
// ProfileConfigFile
// ============================================================================

ProfileConfigFile::ProfileConfigFile(std::string project_dir)
    : path_(join_path(join_path(project_dir, ".planning"), "config.json")) {}

Result<nlohmann::json> ProfileConfigFile::read() const {
    auto text = read_file_text(path_);
    if (!text) {
        return Result<nlohmann::json>::err(Error(ErrorCode::CONFIG_INVALID, path_ + " not found"));
    }
    try {
        return Result<nlohmann::json>::ok(nlohmann::json::parse(*text));
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json>::err(
            Error(ErrorCode::CONFIG_INVALID, "failed to parse " + path_ + ": " + e.what()));
    }
}

Result<ProfileConfig> ProfileConfigFile::load() const {
    auto doc = read();
    if (doc.isErr()) {
        return Result<ProfileConfig>::err(doc.error());
    }
    return parse_profile_config(doc.value());
}

Result<MigrateOutcome> ProfileConfigFile::migrate(bool dry_run) const {
    auto doc = read();
    if (doc.isErr()) {
        return Result<MigrateOutcome>::err(doc.error());
    }

    auto migration = migrate_config(doc.value());
    if (migration.isErr()) {
        return Result<MigrateOutcome>::err(migration.error().withContext(path_));
    }

    MigrateOutcome outcome;
    outcome.migration = std::move(migration.value());
    if (!outcome.migration.needed || dry_run) {
        return Result<MigrateOutcome>::ok(std::move(outcome));
    }

    auto original = read_file_bytes(path_);
    outcome.backup_path = path_ + ".bak";
    auto backup = original ? atomic_write_file(outcome.backup_path, *original) : AtomicWriteResult{};
    if (!backup.ok) {
        return Result<MigrateOutcome>::err(
            Error(ErrorCode::WRITE_FAILED, "failed to back up " + path_ + ": " + backup.error));
    }

    auto written = atomic_write_file(path_, outcome.migration.document.dump(2) + "\n");
    if (!written.ok) {
        return Result<MigrateOutcome>::err(
            Error(written.permission_denied ? ErrorCode::PERMISSION_DENIED : ErrorCode::WRITE_FAILED,
                  "failed to write " + path_ + ": " + written.error));
    }

    outcome.written = true;
    spdlog::info("migrated {} from {} to {}", path_, outcome.migration.from,
                 profile_type_to_string(outcome.migration.to.profile_type));
    return Result<MigrateOutcome>::ok(std::move(outcome));
}

} // namespace gsd
