/**
 * gsd-opencode CLI - Entry Point
 *
 * Installation manager for the gsd-opencode bundle.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace gsd::cli::commands {
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_uninstall(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_repair(CLI::App* app, GlobalOptions& opts);
    void setup_update(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_config(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace gsd::cli;

    CLI::App app{"gsd-opencode - install and maintain the gsd-opencode bundle"};
    app.set_version_flag("-V,--version", GSD_VERSION);
    app.require_subcommand(0, 1);
    app.fallthrough();

    GlobalOptions opts;

    // Global options
    app.add_option("--source", opts.source, "Bundle directory to install from");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* install_cmd = app.add_subcommand("install", "Install the bundle");
    commands::setup_install(install_cmd, opts);

    auto* uninstall_cmd = app.add_subcommand("uninstall", "Remove installed files");
    commands::setup_uninstall(uninstall_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Verify an installation");
    commands::setup_check(check_cmd, opts);

    auto* repair_cmd = app.add_subcommand("repair", "Restore missing or corrupted files");
    commands::setup_repair(repair_cmd, opts);

    auto* update_cmd = app.add_subcommand("update", "Update to another version");
    commands::setup_update(update_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "Show installations");
    commands::setup_list(list_cmd, opts);

    auto* config_cmd = app.add_subcommand("config", "Project profile configuration");
    commands::setup_config(config_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
