/**
 * gsd-opencode CLI - update command
 *
 * Move an installation to the latest, beta or a pinned version.
 */

#include "../common.hpp"

#include <gsd/registry.hpp>
#include <gsd/rewrite.hpp>
#include <gsd/update.hpp>

#include <CLI/CLI.hpp>

#include <memory>

namespace gsd::cli::commands {

namespace {

struct UpdateOptions {
    bool global = false;
    bool local = false;
    bool beta = false;
    std::string version;
    std::string registry = kDefaultRegistryUrl;
};

// With an explicit --source the local bundle is the only available version
class BundleVersionResolver : public VersionResolver {
public:
    BundleVersionResolver(std::string package, std::string version)
        : package_(std::move(package)), version_(std::move(version)) {}

    Result<ResolvedVersion> resolve(const VersionRequest& request) override {
        if (request.channel == UpdateChannel::Pinned && request.version != version_) {
            return Result<ResolvedVersion>::err(
                Error(ErrorCode::VERSION_RESOLUTION_FAILED,
                      "source bundle is " + version_ + ", not " + request.version));
        }
        ResolvedVersion resolved;
        resolved.package = package_;
        resolved.version = version_;
        return Result<ResolvedVersion>::ok(resolved);
    }

private:
    std::string package_;
    std::string version_;
};

int cmd_update(const GlobalOptions& opts, const UpdateOptions& update_opts) {
    begin_command(opts);

    PackageLayout layout;
    auto scopes = ScopeManager::from_environment(layout);

    if (update_opts.beta && !update_opts.version.empty()) {
        print_error("--beta and --version cannot be combined", opts.json);
        return kExitError;
    }

    auto selected = select_existing_root(scopes, update_opts.global, update_opts.local);
    if (selected.isErr()) {
        return report_error(selected.error(), opts.json);
    }
    if (!selected.value()) {
        if (opts.json) {
            output_json({{"ok", true}, {"installed", false}});
        } else {
            print_success(layout.package_name + " is not installed; run 'gsd-opencode install'",
                          opts.json);
        }
        return kExitSuccess;
    }
    const InstallationRoot root = *selected.value();

    VersionRequest request;
    if (!update_opts.version.empty()) {
        request.channel = UpdateChannel::Pinned;
        request.version = update_opts.version;
    } else if (update_opts.beta) {
        request.channel = UpdateChannel::Beta;
    }

    std::unique_ptr<VersionResolver> resolver;
    std::unique_ptr<BundleSource> source;
    if (!opts.source.empty()) {
        auto bundle = resolve_bundle(opts, layout);
        if (bundle.isErr()) {
            return report_error(bundle.error(), opts.json);
        }
        resolver = std::make_unique<BundleVersionResolver>(layout.package_name,
                                                           bundle.value().version);
        source = std::make_unique<LocalBundleSource>(bundle.value().dir);
    } else {
        resolver = std::make_unique<NpmRegistryResolver>(layout, update_opts.registry);
        source = std::make_unique<RegistryBundleSource>(layout);
    }

    UpdateOrchestrator orchestrator(root, layout, *resolver, *source,
                                    make_path_rewriter(root.scope), scopes.path_prefix(root));
    auto report = orchestrator.run(request);
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
        j["from"] = report.from_version;
        j["to"] = report.to_version;
        j["change"] = version_change_to_string(report.change);
        j["already_current"] = report.already_current;
        j["structure"] = structure_to_string(report.structure);
        j["files"] = report.files_installed;
        j["stale_removed"] = report.stale_removed;
        j["failures"] = failures_to_json(report.failures);
        if (report.error) {
            j["error"] = report.error->message();
            j["code"] = error_code_to_string(report.error->code());
        }
        output_json(j);
    } else if (!report.ok) {
        for (const auto& f : report.failures) {
            std::cerr << "  failed: " << f.path << ": " << f.error.message() << std::endl;
        }
        if (report.error) {
            std::cerr << "Error: " << report.error->message() << std::endl;
        }
    } else if (report.already_current) {
        print_success(layout.package_name + " " + report.to_version + " is already current",
                      opts.json);
    } else {
        std::string from = report.from_version.empty() ? "unknown" : report.from_version;
        print_success("Updated " + from + " -> " + report.to_version + " (" +
                          version_change_to_string(report.change) + ", " +
                          std::to_string(report.files_installed) + " files)",
                      opts.json);
        if (!report.stale_removed.empty()) {
            print_success("Removed " + std::to_string(report.stale_removed.size()) +
                              " file(s) no longer in the bundle",
                          opts.json);
        }
    }

    if (!report.ok) {
        return report.error ? exit_code_for(*report.error) : kExitError;
    }
    return kExitSuccess;
}

} // namespace

void setup_update(CLI::App* app, GlobalOptions& opts) {
    static UpdateOptions update_opts;

    app->add_flag("-g,--global", update_opts.global, "Update the global installation");
    app->add_flag("-l,--local", update_opts.local, "Update the local installation");
    app->add_flag("--beta", update_opts.beta, "Use the beta channel");
    app->add_option("--version", update_opts.version, "Install a specific version");
    app->add_option("--registry", update_opts.registry, "npm registry URL")
        ->capture_default_str();

    app->callback([&opts]() {
        std::exit(cmd_update(opts, update_opts));
    });
}

} // namespace gsd::cli::commands
