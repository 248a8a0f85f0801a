/**
 * gsd-opencode CLI - uninstall command
 *
 * Remove the files recorded in the installation manifest.
 */

#include "../common.hpp"

#include <gsd/uninstaller.hpp>

#include <CLI/CLI.hpp>

namespace gsd::cli::commands {

namespace {

struct UninstallCmdOptions {
    bool global = false;
    bool local = false;
    bool force = false;
    bool backup = false;
    bool dry_run = false;
};

nlohmann::json plan_to_json(const UninstallPlan& plan) {
    return {
        {"files", plan.to_remove},
        {"already_missing", plan.already_missing},
        {"protected", plan.protected_paths},
        {"directories", plan.directories},
    };
}

void print_plan(const UninstallPlan& plan) {
    std::cout << "Files to remove: " << plan.to_remove.size() << std::endl;
    for (const auto& f : plan.to_remove) {
        std::cout << "  " << f << std::endl;
    }
    if (!plan.directories.empty()) {
        std::cout << "Directories to remove: " << plan.directories.size() << std::endl;
        for (const auto& d : plan.directories) {
            std::cout << "  " << d << "/" << std::endl;
        }
    }
    if (!plan.already_missing.empty()) {
        std::cout << "Already missing: " << plan.already_missing.size() << std::endl;
    }
    if (!plan.protected_paths.empty()) {
        std::cout << "Skipped (outside gsd namespace): " << plan.protected_paths.size()
                  << std::endl;
    }
}

int cmd_uninstall(const GlobalOptions& opts, const UninstallCmdOptions& un_opts) {
    begin_command(opts);

    PackageLayout layout;
    auto scopes = ScopeManager::from_environment(layout);

    auto selected = select_existing_root(scopes, un_opts.global, un_opts.local);
    if (selected.isErr()) {
        return report_error(selected.error(), opts.json);
    }
    if (!selected.value()) {
        if (opts.json) {
            output_json({{"ok", true}, {"installed", false}});
        } else {
            print_success(layout.package_name + " is not installed", opts.json);
        }
        return kExitSuccess;
    }
    const InstallationRoot root = *selected.value();

    Uninstaller uninstaller(root, layout);

    if (!un_opts.dry_run && !un_opts.force) {
        if (opts.json) {
            print_error("uninstall requires --force in JSON mode", opts.json);
            return kExitError;
        }

        std::vector<std::string> plan_warnings;
        auto plan = uninstaller.plan(&plan_warnings);
        if (plan.isErr()) {
            if (plan.error().code() == ErrorCode::NOT_INSTALLED) {
                print_success(layout.package_name + " is not installed at " + root.path, opts.json);
                return kExitSuccess;
            }
            return report_error(plan.error(), opts.json);
        }
        print_warnings(plan_warnings);
        print_plan(plan.value());

        bool confirmed =
            confirm_typed("Remove " + layout.package_name + " from " + root.path + "?", "yes");
        if (interrupt_requested()) {
            return report_interrupt(opts.json);
        }
        if (!confirmed) {
            print_success("Uninstall cancelled", opts.json);
            return kExitError;
        }
    }

    UninstallOptions options;
    options.dry_run = un_opts.dry_run;
    options.backup = un_opts.backup;

    auto result = uninstaller.run(options);
    print_warnings(result.warnings);

    if (!result.installed) {
        if (opts.json) {
            output_json({{"ok", true}, {"installed", false}, {"root", root.path}});
        } else {
            print_success(layout.package_name + " is not installed at " + root.path, opts.json);
        }
        return kExitSuccess;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["root"] = root.path;
        j["dry_run"] = result.dry_run;
        j["plan"] = plan_to_json(result.plan);
        if (!result.dry_run) {
            j["removed_files"] = result.removed_files;
            j["removed_dirs"] = result.removed_dirs;
            j["failures"] = failures_to_json(result.failures);
        }
        if (!result.backup_dir.empty()) {
            j["backup_dir"] = result.backup_dir;
        }
        if (result.error) {
            j["error"] = result.error->message();
            j["code"] = error_code_to_string(result.error->code());
        }
        output_json(j);
    } else if (result.dry_run) {
        std::cout << "Dry run: nothing was removed" << std::endl;
        print_plan(result.plan);
    } else {
        if (!result.backup_dir.empty()) {
            std::cout << "Backup written to " << result.backup_dir << std::endl;
        }
        for (const auto& f : result.failures) {
            std::cerr << "  failed: " << f.path << ": " << f.error.message() << std::endl;
        }
        if (result.ok) {
            print_success("Removed " + std::to_string(result.removed_files.size()) + " files and " +
                              std::to_string(result.removed_dirs.size()) + " directories from " +
                              root.path,
                          opts.json);
        } else if (result.error) {
            std::cerr << "Error: " << result.error->message() << std::endl;
        }
    }

    if (!result.ok) {
        return result.error ? exit_code_for(*result.error) : kExitError;
    }
    return kExitSuccess;
}

} // namespace

void setup_uninstall(CLI::App* app, GlobalOptions& opts) {
    static UninstallCmdOptions uninstall_opts;

    app->add_flag("-g,--global", uninstall_opts.global, "Remove the global installation");
    app->add_flag("-l,--local", uninstall_opts.local, "Remove the local installation");
    app->add_flag("-f,--force", uninstall_opts.force, "Skip the confirmation prompt");
    app->add_flag("--backup", uninstall_opts.backup, "Back up files before removing them");
    app->add_flag("--dry-run", uninstall_opts.dry_run, "Show what would be removed");

    app->callback([&opts]() {
        std::exit(cmd_uninstall(opts, uninstall_opts));
    });
}

} // namespace gsd::cli::commands
