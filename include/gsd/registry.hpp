#pragma once

#include "gsd/update.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gsd {

// ============================================================================
// HTTP Fetching (libcurl)
// ============================================================================

struct FetchResult {
    bool ok = false;
    std::vector<uint8_t> data;
    std::string error;
    long http_status = 0;
    std::string content_type;
};

FetchResult fetch_https(const std::string& url);

// ============================================================================
// npm Registry
// ============================================================================

constexpr const char* kDefaultRegistryUrl = "https://registry.npmjs.org";

// Resolve a version from a registry packument (the JSON document served at
// <registry>/<package>). Split out so it can be tested without network.
Result<ResolvedVersion> resolve_from_packument(const std::string& package,
                                               const std::string& packument_json,
                                               const VersionRequest& request);

class NpmRegistryResolver : public VersionResolver {
public:
    NpmRegistryResolver(PackageLayout layout, std::string registry_url = kDefaultRegistryUrl);

    Result<ResolvedVersion> resolve(const VersionRequest& request) override;

private:
    PackageLayout layout_;
    std::string registry_url_;
};

// Downloads and unpacks a registry tarball into a staging directory
class RegistryBundleSource : public BundleSource {
public:
    explicit RegistryBundleSource(PackageLayout layout);

    Result<FetchedBundle> fetch(const ResolvedVersion& version) override;
    void release(const FetchedBundle& bundle) override;

    // Verify + unpack already-downloaded tarball bytes
    Result<FetchedBundle> unpack(const ResolvedVersion& version,
                                 const std::vector<uint8_t>& tarball) const;

private:
    PackageLayout layout_;
};

} // namespace gsd
