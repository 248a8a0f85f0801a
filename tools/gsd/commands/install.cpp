/**
 * gsd-opencode CLI - install command
 *
 * Copy the bundle into the global or local OpenCode configuration directory.
 */

#include "../common.hpp"

#include <gsd/installer.hpp>
#include <gsd/manifest.hpp>
#include <gsd/rewrite.hpp>
#include <gsd/scope.hpp>
#include <gsd/structure.hpp>

#include <CLI/CLI.hpp>

namespace gsd::cli::commands {

namespace {

struct InstallOptions {
    bool global = false;
    bool local = false;
    std::string config_dir;
};

int cmd_install(const GlobalOptions& opts, const InstallOptions& install_opts) {
    begin_command(opts);

    PackageLayout layout;
    auto scopes = ScopeManager::from_environment(layout);

    auto root_result = scopes.resolve_flags(
        install_opts.global, install_opts.local,
        install_opts.config_dir.empty() ? std::nullopt
                                        : std::make_optional(install_opts.config_dir));
    if (root_result.isErr()) {
        return report_error(root_result.error(), opts.json);
    }
    const auto& root = root_result.value();

    StructureDetector detector(root.path, layout);
    auto details = detector.details();
    if (details.state == StructureState::Dual) {
        return report_error(Error(ErrorCode::STRUCTURE_CONFLICT,
                                  "both " + details.old_path + " and " + details.new_path +
                                      " exist; " + details.recommended_action),
                            opts.json);
    }

    auto bundle = resolve_bundle(opts, layout);
    if (bundle.isErr()) {
        return report_error(bundle.error(), opts.json);
    }

    // Reinstalling over a readable manifest keeps the previous state on
    // failure and clears out files the new bundle no longer ships.
    ManifestManager manifests(root.path, layout);
    auto previous = manifests.load();
    print_warnings(previous.warnings);
    InstallMode mode = previous.loaded() ? InstallMode::Retain : InstallMode::Fresh;

    std::string prefix = scopes.path_prefix(root);
    Installer installer(bundle.value().dir, root, layout,
                        make_path_rewriter(root.scope), prefix);

    if (!opts.json && !opts.quiet) {
        std::cout << "Installing " << layout.package_name << " " << bundle.value().version
                  << " (" << scope_to_string(root.scope) << ") into " << root.path << std::endl;
    }

    auto result = installer.install(mode, detector.command_dir_for_writes(details.state),
                                    bundle.value().version, previous.entries);
    print_warnings(result.warnings);

    if (!result.ok) {
        Error err = result.error ? *result.error
                                 : Error(ErrorCode::WRITE_FAILED, "installation failed");
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = false;
            j["error"] = err.message();
            j["code"] = error_code_to_string(err.code());
            j["root"] = root.path;
            j["failures"] = failures_to_json(result.failures);
            j["files_written"] = result.entries.size();
            j["discarded"] = result.discarded;
            output_json(j);
        } else {
            std::cerr << "Error: " << err.message() << std::endl;
            for (const auto& f : result.failures) {
                std::cerr << "  failed: " << f.path << ": " << f.error.message() << std::endl;
            }
            if (mode == InstallMode::Fresh) {
                std::cerr << "Removed " << result.discarded.size()
                          << " partially installed file(s)" << std::endl;
            } else {
                std::cerr << "Partial state kept; run 'gsd-opencode repair' to complete it"
                          << std::endl;
            }
        }
        return exit_code_for(err);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["scope"] = scope_to_string(root.scope);
        j["root"] = root.path;
        j["prefix"] = prefix;
        j["version"] = bundle.value().version;
        j["files"] = result.entries.size();
        j["stale_removed"] = result.stale_removed;
        output_json(j);
    } else {
        print_success("Installed " + std::to_string(result.entries.size()) + " files to " +
                          root.path,
                      opts.json);
        if (!result.stale_removed.empty()) {
            print_success("Removed " + std::to_string(result.stale_removed.size()) +
                              " file(s) no longer in the bundle",
                          opts.json);
        }
    }

    return kExitSuccess;
}

} // namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallOptions install_opts;

    app->add_flag("-g,--global", install_opts.global,
                  "Install into ~/.config/opencode (default)");
    app->add_flag("-l,--local", install_opts.local, "Install into ./.opencode");
    app->add_option("-c,--config-dir", install_opts.config_dir,
                    "Install into a custom configuration directory");

    app->callback([&opts]() {
        std::exit(cmd_install(opts, install_opts));
    });
}

} // namespace gsd::cli::commands
