#pragma once

#include "gsd/types.hpp"

#include <optional>
#include <string>

namespace gsd {

// ============================================================================
// Installation Root
// ============================================================================

struct InstallationRoot {
    std::string path;           // absolute
    Scope scope = Scope::Global;
    bool overridden = false;    // explicit or environment directory override
};

// Outcome of scope auto-detection for commands that act on an existing
// installation.
struct DetectedScope {
    std::optional<InstallationRoot> root;   // empty when nothing is installed
};

// ============================================================================
// Scope Manager
// ============================================================================

class ScopeManager {
public:
    // home/cwd/env_override are injected so tests never depend on the
    // process environment.
    ScopeManager(PackageLayout layout, std::string home, std::string cwd,
                 std::optional<std::string> env_override = std::nullopt);

    // Read $HOME, $PWD and OPENCODE_CONFIG_DIR from the process
    static ScopeManager from_environment(PackageLayout layout);

    // Precedence: override_dir > environment override > scope default.
    // PATH_TRAVERSAL when an override fails validation.
    Result<InstallationRoot> resolve(Scope scope,
                                     const std::optional<std::string>& override_dir = std::nullopt) const;

    // Resolve from CLI flags. INVALID_SCOPE when both are set; neither
    // selects global.
    Result<InstallationRoot> resolve_flags(bool global, bool local,
                                           const std::optional<std::string>& override_dir = std::nullopt) const;

    // Pick the installed scope when no flag was given. INVALID_SCOPE when
    // both scopes are installed.
    Result<DetectedScope> detect_installed() const;

    // Prefix substituted into bundle text by the path rewriter
    std::string path_prefix(const InstallationRoot& root) const;

    bool is_installed(const InstallationRoot& root) const;

    // Trimmed version marker content, empty when absent
    std::string installed_version(const InstallationRoot& root) const;

    const PackageLayout& layout() const { return layout_; }
    const std::string& home() const { return home_; }

private:
    Result<std::string> validate_override(const std::string& dir, const std::string& base) const;

    PackageLayout layout_;
    std::string home_;
    std::string cwd_;
    std::optional<std::string> env_override_;
};

} // namespace gsd
