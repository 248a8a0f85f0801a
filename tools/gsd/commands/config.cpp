/**
 * gsd-opencode CLI - config command
 *
 * Inspect and migrate the project profile configuration.
 */

#include "../common.hpp"

#include <gsd/config.hpp>

#include <CLI/CLI.hpp>

#include <variant>

namespace gsd::cli::commands {

namespace {

struct ConfigOptions {
    std::string project_dir;
    bool dry_run = false;
};

std::string project_dir_or_cwd(const ConfigOptions& config_opts) {
    return config_opts.project_dir.empty() ? get_current_directory() : config_opts.project_dir;
}

nlohmann::json models_to_json(const ModelAssignment& m) {
    return {{"planning", m.planning}, {"execution", m.execution}, {"verification", m.verification}};
}

int cmd_config_show(const GlobalOptions& opts, const ConfigOptions& config_opts) {
    begin_command(opts);

    ProfileConfigFile file(project_dir_or_cwd(config_opts));
    auto config = file.load();
    if (config.isErr()) {
        return report_error(config.error(), opts.json);
    }

    nlohmann::json j;
    j["ok"] = true;
    j["path"] = file.path();
    if (auto* legacy = std::get_if<LegacyProfileConfig>(&config.value())) {
        j["format"] = "legacy";
        j["model_profile"] = legacy->model_profile;
        print_warning("legacy profile configuration; run 'gsd-opencode config migrate'");
    } else {
        const auto& v1 = std::get<ConfigV1>(config.value());
        j["format"] = "v1";
        j["profile_type"] = profile_type_to_string(v1.profile_type);
        j["models"] = models_to_json(v1.models);
    }

    if (opts.json) {
        output_json(j);
    } else {
        std::cout << "Config: " << file.path() << std::endl;
        if (j["format"] == "legacy") {
            std::cout << "  model_profile: " << j["model_profile"].get<std::string>() << std::endl;
        } else {
            std::cout << "  profile_type:  " << j["profile_type"].get<std::string>() << std::endl;
            for (const auto& [phase, model] : j["models"].items()) {
                std::cout << "  " << phase << ": " << model.get<std::string>() << std::endl;
            }
        }
    }
    return kExitSuccess;
}

int cmd_config_migrate(const GlobalOptions& opts, const ConfigOptions& config_opts) {
    begin_command(opts);

    ProfileConfigFile file(project_dir_or_cwd(config_opts));
    auto outcome = file.migrate(config_opts.dry_run);
    if (outcome.isErr()) {
        return report_error(outcome.error(), opts.json);
    }

    const auto& result = outcome.value();
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["path"] = file.path();
        j["migrated"] = result.migration.needed;
        j["dry_run"] = config_opts.dry_run;
        j["written"] = result.written;
        if (result.migration.needed) {
            j["from"] = result.migration.from;
            j["to"] = profile_type_to_string(result.migration.to.profile_type);
        }
        if (!result.backup_path.empty()) {
            j["backup"] = result.backup_path;
        }
        if (config_opts.dry_run) {
            j["document"] = result.migration.document;
        }
        output_json(j);
    } else if (!result.migration.needed) {
        print_success(file.path() + " is already current", opts.json);
    } else if (config_opts.dry_run) {
        std::cout << "Would migrate model_profile '" << result.migration.from << "' to profile_type '"
                  << profile_type_to_string(result.migration.to.profile_type) << "':" << std::endl;
        std::cout << result.migration.document.dump(2) << std::endl;
    } else {
        print_success("Migrated " + file.path() + " (backup: " + result.backup_path + ")",
                      opts.json);
    }
    return kExitSuccess;
}

} // namespace

void setup_config(CLI::App* app, GlobalOptions& opts) {
    static ConfigOptions config_opts;

    app->require_subcommand(1);
    app->add_option("-p,--project", config_opts.project_dir,
                    "Project directory containing .planning/ (default: current directory)");

    auto* show = app->add_subcommand("show", "Print the profile configuration");
    show->callback([&opts]() {
        std::exit(cmd_config_show(opts, config_opts));
    });

    auto* migrate = app->add_subcommand("migrate", "Convert a legacy profile configuration");
    migrate->add_flag("--dry-run", config_opts.dry_run, "Show the result without writing");
    migrate->callback([&opts]() {
        std::exit(cmd_config_migrate(opts, config_opts));
    });
}

} // namespace gsd::cli::commands
