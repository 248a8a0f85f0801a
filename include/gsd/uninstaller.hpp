#pragma once

#include "gsd/scope.hpp"
#include "gsd/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gsd {

// ============================================================================
// Uninstaller
// ============================================================================

struct UninstallOptions {
    bool dry_run = false;
    bool backup = false;
};

struct UninstallPlan {
    std::vector<std::string> to_remove;        // manifest files present on disk
    std::vector<std::string> already_missing;  // manifest files already gone
    std::vector<std::string> protected_paths;  // listed, but outside the namespace
    std::vector<std::string> directories;      // predicted removals, deepest first
};

struct UninstallResult {
    bool ok = false;
    bool installed = true;
    bool dry_run = false;
    UninstallPlan plan;
    std::vector<std::string> removed_files;
    std::vector<std::string> removed_dirs;
    std::vector<FileFailure> failures;
    std::string backup_dir;
    std::vector<std::string> warnings;
    std::optional<Error> error;
};

// Removes exactly the files the manifest lists inside the managed
// namespace. Without a readable manifest nothing is deleted.
class Uninstaller {
public:
    Uninstaller(InstallationRoot root, PackageLayout layout);

    // NOT_INSTALLED when there is no manifest, MANIFEST_CORRUPT when it
    // cannot be parsed.
    Result<UninstallPlan> plan(std::vector<std::string>* warnings = nullptr) const;

    UninstallResult run(const UninstallOptions& options) const;

private:
    std::vector<std::string> predict_directories(const std::vector<std::string>& removal_set) const;

    InstallationRoot root_;
    PackageLayout layout_;
};

} // namespace gsd
