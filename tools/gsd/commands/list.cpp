/**
 * gsd-opencode CLI - list command
 *
 * Show the global and local installations.
 */

#include "../common.hpp"

#include <gsd/structure.hpp>

#include <CLI/CLI.hpp>

#include <iomanip>

namespace gsd::cli::commands {

namespace {

struct ListOptions {
    bool global = false;
    bool local = false;
};

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    begin_command(opts);

    PackageLayout layout;
    auto scopes = ScopeManager::from_environment(layout);

    std::vector<Scope> wanted;
    if (list_opts.global || !list_opts.local) wanted.push_back(Scope::Global);
    if (list_opts.local || !list_opts.global) wanted.push_back(Scope::Local);

    nlohmann::json installs = nlohmann::json::array();
    for (Scope scope : wanted) {
        auto root = scopes.resolve(scope);
        if (root.isErr()) {
            print_warning(std::string(scope_to_string(scope)) + ": " + root.error().message());
            continue;
        }

        const auto& r = root.value();
        StructureDetector detector(r.path, layout);
        bool installed = scopes.is_installed(r);
        std::string version = scopes.installed_version(r);
        StructureState structure = detector.detect();

        installs.push_back({
            {"scope", scope_to_string(scope)},
            {"installed", installed},
            {"location", r.path},
            {"prefix", scopes.path_prefix(r)},
            {"version", version},
            {"structure", structure_to_string(structure)},
        });

        if (!opts.json) {
            std::cout << std::left << std::setw(8) << scope_to_string(scope)
                      << (installed ? (version.empty() ? "unknown" : version) : "not installed")
                      << std::endl;
            std::cout << "  location:  " << r.path << std::endl;
            std::cout << "  prefix:    " << scopes.path_prefix(r) << std::endl;
            std::cout << "  structure: " << structure_to_string(structure) << std::endl;
        }
    }

    if (opts.json) {
        output_json({{"ok", true}, {"installations", installs}});
    }
    return kExitSuccess;
}

} // namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    app->add_flag("-g,--global", list_opts.global, "Only the global installation");
    app->add_flag("-l,--local", list_opts.local, "Only the local installation");

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

} // namespace gsd::cli::commands
