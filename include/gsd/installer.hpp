#pragma once

/**
 * @file installer.hpp
 * @brief Deterministic copy of the source bundle into an installation root
 *
 * Installation happens in three phases:
 *   1. plan()   - walk the bundle (sorted, iterative) into a copy plan
 *   2. copy()   - write each planned file atomically, recording hashes
 *   3. commit() - write the version marker, then the manifest
 *
 * The manifest is never written until every planned file is in place, so an
 * interrupted install leaves no manifest behind.
 */

#include "gsd/manifest.hpp"
#include "gsd/namespace_rules.hpp"
#include "gsd/rewrite.hpp"
#include "gsd/scope.hpp"
#include "gsd/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gsd {

struct InstallPlanItem {
    std::string source;         // absolute path inside the bundle
    std::string relative_path;  // destination, relative to the root
};

enum class InstallMode {
    Fresh,      // no prior manifest: a failed copy discards what it wrote
    Retain      // prior manifest: partial state stays for a later repair
};

struct InstallResult {
    bool ok = false;
    bool interrupted = false;
    std::vector<ManifestEntry> entries;        // files written, in plan order
    std::vector<FileFailure> failures;
    std::vector<std::string> created_files;    // did not exist before this run
    std::vector<std::string> created_dirs;     // absolute, creation order
    std::vector<std::string> discarded;        // removed by discard()
    std::vector<std::string> stale_removed;    // removed after an update commit
    std::vector<std::string> warnings;
    std::optional<Error> error;                // first fatal error
};

class Installer {
public:
    Installer(std::string bundle_dir, InstallationRoot root, PackageLayout layout,
              PathRewriter rewriter, std::string prefix);

    // SOURCE_MISSING when the bundle has none of the managed directories
    Result<std::vector<InstallPlanItem>> plan(const std::string& command_dir,
                                              std::vector<std::string>* warnings = nullptr) const;

    // Copy every item; stops at the first failure or interruption
    InstallResult copy(const std::vector<InstallPlanItem>& items) const;

    // Copy primitive shared with repair. created_dirs receives any
    // directories this call created.
    Result<ManifestEntry> copy_file(const InstallPlanItem& item,
                                    std::vector<std::string>* created_dirs = nullptr) const;

    // Locate the bundle file that produces `relative_path`
    std::optional<InstallPlanItem> find_source(const std::string& relative_path) const;

    // Fresh-mode cleanup: remove files created by this run and prune the
    // directories it created once they are empty. The root stays.
    void discard(InstallResult& result) const;

    // Version marker, then manifest
    Result<void> commit(const std::vector<ManifestEntry>& entries, const std::string& version) const;

    // Remove files listed in `previous` but not in `current`, restricted to
    // the namespace. Returns the removed relative paths.
    std::vector<std::string> remove_stale(const std::vector<ManifestEntry>& previous,
                                          const std::vector<ManifestEntry>& current) const;

    // plan + copy + (discard | commit + remove_stale)
    InstallResult install(InstallMode mode, const std::string& command_dir,
                          const std::string& version,
                          const std::vector<ManifestEntry>& previous = {}) const;

    const std::string& bundle_dir() const { return bundle_dir_; }
    const InstallationRoot& root() const { return root_; }

private:
    std::string bundle_command_dir() const;

    std::string bundle_dir_;
    InstallationRoot root_;
    PackageLayout layout_;
    PathRewriter rewriter_;
    std::string prefix_;
    NamespaceRules rules_;
};

// Version declared by <bundle>/package.json, empty if unavailable
std::string read_bundle_version(const std::string& bundle_dir);

} // namespace gsd
