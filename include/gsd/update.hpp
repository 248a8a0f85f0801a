#pragma once

/**
 * @file update.hpp
 * @brief Version resolution and the update workflow
 *
 * UpdateOrchestrator depends on two collaborators so it can be exercised
 * without network access:
 *   - VersionResolver: maps latest / beta / pinned to a concrete version
 *   - BundleSource:    materializes the bundle for a resolved version
 */

#include "gsd/rewrite.hpp"
#include "gsd/scope.hpp"
#include "gsd/types.hpp"
#include "gsd/version.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gsd {

enum class UpdateChannel {
    Latest,
    Beta,
    Pinned
};

struct VersionRequest {
    UpdateChannel channel = UpdateChannel::Latest;
    std::string version;    // Pinned only
};

struct ResolvedVersion {
    std::string package;
    std::string version;
    std::string tarball_url;
    std::string shasum;     // SHA-1 hex of the tarball, may be empty
};

class VersionResolver {
public:
    virtual ~VersionResolver() = default;

    // VERSION_RESOLUTION_FAILED on any failure
    virtual Result<ResolvedVersion> resolve(const VersionRequest& request) = 0;
};

// A bundle directory on disk for the resolved version
struct FetchedBundle {
    std::string dir;
    std::string staging_dir;    // removed by release(); empty for local sources
};

class BundleSource {
public:
    virtual ~BundleSource() = default;

    virtual Result<FetchedBundle> fetch(const ResolvedVersion& version) = 0;

    // Clean up anything fetch() staged
    virtual void release(const FetchedBundle& bundle) { (void)bundle; }
};

// A bundle that already sits in a local directory
class LocalBundleSource : public BundleSource {
public:
    explicit LocalBundleSource(std::string dir) : dir_(std::move(dir)) {}

    Result<FetchedBundle> fetch(const ResolvedVersion& version) override;

private:
    std::string dir_;
};

struct UpdateReport {
    bool ok = false;
    bool installed = true;
    bool already_current = false;
    std::string from_version;
    std::string to_version;
    VersionChange change = VersionChange::Unknown;
    StructureState structure = StructureState::None;
    size_t files_installed = 0;
    std::vector<std::string> stale_removed;
    std::vector<FileFailure> failures;
    std::vector<std::string> warnings;
    std::optional<Error> error;
};

class UpdateOrchestrator {
public:
    UpdateOrchestrator(InstallationRoot root, PackageLayout layout,
                       VersionResolver& resolver, BundleSource& source,
                       PathRewriter rewriter, std::string prefix);

    UpdateReport run(const VersionRequest& request);

private:
    InstallationRoot root_;
    PackageLayout layout_;
    VersionResolver& resolver_;
    BundleSource& source_;
    PathRewriter rewriter_;
    std::string prefix_;
};

} // namespace gsd
