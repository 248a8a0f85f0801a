#include "gsd/scope.hpp"
#include "gsd/manifest.hpp"
#include "gsd/path_utils.hpp"
#include "gsd/platform.hpp"
#include "gsd/structure.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <utility>

namespace gsd {

namespace {

bool has_parent_component(const std::string& path) {
    std::string p = to_portable_path(path);
    size_t start = 0;
    while (start <= p.size()) {
        size_t end = p.find('/', start);
        if (end == std::string::npos) end = p.size();
        if (p.compare(start, end - start, "..") == 0 && end - start == 2) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

std::string absolute_normal(const std::string& path) {
    return to_portable_path(std::filesystem::path(path).lexically_normal().string());
}

} // namespace

ScopeManager::ScopeManager(PackageLayout layout, std::string home, std::string cwd,
                           std::optional<std::string> env_override)
    : layout_(std::move(layout)), home_(std::move(home)), cwd_(std::move(cwd)),
      env_override_(std::move(env_override)) {}

ScopeManager ScopeManager::from_environment(PackageLayout layout) {
    auto env = get_env(layout.config_dir_env);
    if (env && env->empty()) env.reset();
    return ScopeManager(std::move(layout), get_home_directory(), get_current_directory(), env);
}

Result<std::string> ScopeManager::validate_override(const std::string& dir,
                                                    const std::string& base) const {
    if (dir.find('\0') != std::string::npos) {
        return Result<std::string>::err(
            Error(ErrorCode::PATH_TRAVERSAL, "directory override contains a NUL byte"));
    }
    if (has_parent_component(dir)) {
        return Result<std::string>::err(
            Error(ErrorCode::PATH_TRAVERSAL, "directory override contains '..': " + dir));
    }

    std::string expanded = expand_tilde(dir, home_);
    std::filesystem::path p(expanded);
    if (p.is_relative()) {
        p = std::filesystem::path(base) / p;
    }
    return Result<std::string>::ok(absolute_normal(p.string()));
}

Result<InstallationRoot> ScopeManager::resolve(Scope scope,
                                               const std::optional<std::string>& override_dir) const {
    InstallationRoot root;
    root.scope = scope;

    if (override_dir && !override_dir->empty()) {
        auto validated = validate_override(*override_dir, cwd_);
        if (validated.isErr()) {
            return Result<InstallationRoot>::err(validated.error());
        }
        root.path = validated.value();
        root.overridden = true;
    } else if (scope == Scope::Global && env_override_) {
        // The environment override names a directory relative to $HOME
        auto validated = validate_override(*env_override_, home_);
        if (validated.isErr()) {
            return Result<InstallationRoot>::err(
                validated.error().withContext(layout_.config_dir_env));
        }
        root.path = validated.value();
        root.overridden = true;
    } else if (scope == Scope::Global) {
        if (home_.empty()) {
            return Result<InstallationRoot>::err(
                Error(ErrorCode::INVALID_SCOPE, "cannot resolve global scope: home directory unknown"));
        }
        root.path = absolute_normal(join_path(home_, layout_.global_config_dir));
    } else {
        root.path = absolute_normal(join_path(cwd_, layout_.local_config_dir));
    }

    spdlog::debug("{} scope resolved to {}", scope_to_string(scope), root.path);
    return Result<InstallationRoot>::ok(root);
}

Result<InstallationRoot> ScopeManager::resolve_flags(bool global, bool local,
                                                     const std::optional<std::string>& override_dir) const {
    if (global && local) {
        return Result<InstallationRoot>::err(
            Error(ErrorCode::INVALID_SCOPE, "cannot specify both --global and --local"));
    }
    return resolve(local ? Scope::Local : Scope::Global, override_dir);
}

Result<DetectedScope> ScopeManager::detect_installed() const {
    DetectedScope detected;

    auto global = resolve(Scope::Global);
    auto local = resolve(Scope::Local);
    if (global.isErr()) return Result<DetectedScope>::err(global.error());
    if (local.isErr()) return Result<DetectedScope>::err(local.error());

    bool global_installed = is_installed(global.value());
    bool local_installed = is_installed(local.value());

    // A local root that coincides with the global one is a single installation
    if (global_installed && local_installed && global.value().path != local.value().path) {
        return Result<DetectedScope>::err(
            Error(ErrorCode::INVALID_SCOPE,
                  "installed in both global and local scope; specify --global or --local"));
    }
    if (global_installed) {
        detected.root = global.value();
    } else if (local_installed) {
        detected.root = local.value();
    }
    return Result<DetectedScope>::ok(detected);
}

std::string ScopeManager::path_prefix(const InstallationRoot& root) const {
    if (root.scope == Scope::Local && !root.overridden) {
        return "./" + layout_.local_config_dir;
    }

    if (!home_.empty()) {
        std::string rel = relative_to_root(home_, root.path);
        if (!rel.empty()) {
            return "~/" + rel;
        }
    }
    return root.path;
}

bool ScopeManager::is_installed(const InstallationRoot& root) const {
    ManifestManager manifest(root.path, layout_);
    if (manifest.version_exists() || manifest.manifest_exists()) {
        return true;
    }
    return StructureDetector(root.path, layout_).detect() != StructureState::None;
}

std::string ScopeManager::installed_version(const InstallationRoot& root) const {
    return ManifestManager(root.path, layout_).read_version();
}

} // namespace gsd
