/**
 * gsd-opencode CLI - repair command
 *
 * Restore missing or corrupted files and migrate the legacy command layout.
 */

#include "../common.hpp"

#include <gsd/repairer.hpp>
#include <gsd/rewrite.hpp>

#include <CLI/CLI.hpp>

namespace gsd::cli::commands {

namespace {

struct RepairCmdOptions {
    bool global = false;
    bool local = false;
    bool fix_structure = false;
};

int cmd_repair(const GlobalOptions& opts, const RepairCmdOptions& repair_opts) {
    begin_command(opts);

    PackageLayout layout;
    auto scopes = ScopeManager::from_environment(layout);

    auto selected = select_existing_root(scopes, repair_opts.global, repair_opts.local);
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

    // Repairs that do not need a source (structure migration, a missing
    // version marker) still run without a bundle.
    std::string bundle_dir;
    std::string bundle_version;
    auto bundle = resolve_bundle(opts, layout);
    if (bundle.isOk()) {
        bundle_dir = bundle.value().dir;
        bundle_version = bundle.value().version;
    } else {
        print_warning(bundle.error().message());
    }

    Repairer repairer(root, layout, bundle_dir, bundle_version,
                      make_path_rewriter(root.scope), scopes.path_prefix(root));
    RepairOptions options;
    options.fix_structure = repair_opts.fix_structure;

    auto report = repairer.run(options);
    print_warnings(report.warnings);

    if (!report.installed) {
        if (opts.json) {
            output_json({{"ok", true}, {"installed", false}, {"root", root.path}});
        } else {
            print_success(layout.package_name + " is not installed at " + root.path, opts.json);
        }
        return kExitSuccess;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = report.ok;
        j["root"] = root.path;
        j["fresh_install"] = report.fresh_install;
        j["unchanged"] = report.unchanged;
        j["modified"] = report.modified;
        j["succeeded"] = report.succeeded;
        j["failed"] = failures_to_json(report.failed);
        j["migrated"] = report.migrated;
        j["preserved"] = report.preserved;
        j["version_restored"] = report.version_restored;
        j["manifest_written"] = report.manifest_written;
        j["structure_before"] = structure_to_string(report.structure_before);
        j["structure_after"] = structure_to_string(report.structure_after);
        if (!report.backup_dir.empty()) {
            j["backup_dir"] = report.backup_dir;
        }
        output_json(j);
    } else {
        if (report.fresh_install) {
            std::cout << "Manifest was unusable; reinstalled the bundle" << std::endl;
        }
        for (const auto& f : report.succeeded) {
            std::cout << "  repaired: " << f << std::endl;
        }
        for (const auto& f : report.migrated) {
            std::cout << "  migrated: " << f << std::endl;
        }
        for (const auto& f : report.preserved) {
            std::cout << "  preserved: " << f << std::endl;
        }
        for (const auto& f : report.failed) {
            std::cerr << "  failed: " << f.path << ": " << f.error.message() << std::endl;
        }
        if (report.version_restored) {
            std::cout << "Version marker restored" << std::endl;
        }
        if (!report.backup_dir.empty()) {
            std::cout << "Backups written to " << report.backup_dir << std::endl;
        }
        std::cout << "Unchanged: " << report.unchanged << ", modified: " << report.modified
                  << ", failed: " << report.failed.size() << std::endl;
        if (report.ok) {
            print_success("Repair complete", opts.json);
        }
    }

    if (!report.ok) {
        for (const auto& f : report.failed) {
            int code = exit_code_for(f.error);
            if (code != kExitError) return code;
        }
        return kExitError;
    }
    return kExitSuccess;
}

} // namespace

void setup_repair(CLI::App* app, GlobalOptions& opts) {
    static RepairCmdOptions repair_opts;

    app->add_flag("-g,--global", repair_opts.global, "Repair the global installation");
    app->add_flag("-l,--local", repair_opts.local, "Repair the local installation");
    app->add_flag("--fix-structure", repair_opts.fix_structure,
                  "Migrate command/gsd to commands/gsd");

    app->callback([&opts]() {
        std::exit(cmd_repair(opts, repair_opts));
    });
}

} // namespace gsd::cli::commands
