#include "gsd/registry.hpp"
#include "gsd/archive.hpp"
#include "gsd/hash.hpp"
#include "gsd/platform.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <utility>

namespace gsd {

// ============================================================================
// HTTP Fetching with libcurl
// ============================================================================

namespace {

// Callback for libcurl to write received data
size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(userdata);
    size_t total = size * nmemb;
    buffer->insert(buffer->end(), ptr, ptr + total);
    return total;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

// Scoped package names keep '@' but escape the '/'
std::string encode_package_name(const std::string& name) {
    std::string out;
    for (char c : name) {
        if (c == '/') {
            out += "%2F";
        } else {
            out += c;
        }
    }
    return out;
}

Error resolution_error(const std::string& msg) {
    return Error(ErrorCode::VERSION_RESOLUTION_FAILED, msg);
}

void remove_staging(const std::string& staging_dir) {
    if (staging_dir.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(staging_dir, ec);
    if (ec) {
        spdlog::warn("failed to remove staging directory {}: {}", staging_dir, ec.message());
    }
}

} // namespace

FetchResult fetch_https(const std::string& url) {
    FetchResult result;

    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        result.error = "failed to initialize CURL";
        return result;
    }

    std::vector<uint8_t> buffer;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 300L);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "gsd-opencode/" GSD_VERSION);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        result.error = std::string("HTTP request failed: ") +
                       (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return result;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);

    char* content_type = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);
    if (content_type) {
        result.content_type = content_type;
    }

    if (result.http_status < 200 || result.http_status >= 300) {
        result.error = "HTTP " + std::to_string(result.http_status);
        return result;
    }

    result.data = std::move(buffer);
    result.ok = true;
    return result;
}

// ============================================================================
// Version Resolution
// ============================================================================

Result<ResolvedVersion> resolve_from_packument(const std::string& package,
                                               const std::string& packument_json,
                                               const VersionRequest& request) {
    using ResolveResult = Result<ResolvedVersion>;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(packument_json);
    } catch (const nlohmann::json::parse_error& e) {
        return ResolveResult::err(resolution_error(std::string("invalid registry response: ") + e.what()));
    }
    if (!j.is_object()) {
        return ResolveResult::err(resolution_error("invalid registry response for " + package));
    }

    std::string version;
    if (request.channel == UpdateChannel::Pinned) {
        version = request.version;
    } else {
        if (!j.contains("dist-tags") || !j["dist-tags"].is_object() ||
            !j["dist-tags"].contains("latest") || !j["dist-tags"]["latest"].is_string()) {
            return ResolveResult::err(resolution_error("no latest version published for " + package));
        }
        version = j["dist-tags"]["latest"].get<std::string>();
    }

    if (!j.contains("versions") || !j["versions"].is_object() ||
        !j["versions"].contains(version)) {
        return ResolveResult::err(
            resolution_error("version " + version + " of " + package + " not found in registry"));
    }

    const auto& v = j["versions"][version];
    ResolvedVersion resolved;
    resolved.package = package;
    resolved.version = version;
    if (v.contains("dist") && v["dist"].is_object()) {
        const auto& dist = v["dist"];
        if (dist.contains("tarball") && dist["tarball"].is_string()) {
            resolved.tarball_url = dist["tarball"].get<std::string>();
        }
        if (dist.contains("shasum") && dist["shasum"].is_string()) {
            resolved.shasum = dist["shasum"].get<std::string>();
        }
    }
    if (resolved.tarball_url.empty()) {
        return ResolveResult::err(resolution_error("no tarball for " + package + "@" + version));
    }

    return ResolveResult::ok(std::move(resolved));
}

NpmRegistryResolver::NpmRegistryResolver(PackageLayout layout, std::string registry_url)
    : layout_(std::move(layout)), registry_url_(std::move(registry_url)) {}

Result<ResolvedVersion> NpmRegistryResolver::resolve(const VersionRequest& request) {
    std::string package = request.channel == UpdateChannel::Beta ? layout_.beta_package_name
                                                                 : layout_.package_name;
    std::string url = registry_url_ + "/" + encode_package_name(package);
    spdlog::debug("querying {}", url);

    auto fetched = fetch_https(url);
    if (!fetched.ok) {
        return Result<ResolvedVersion>::err(
            resolution_error("registry query for " + package + " failed: " + fetched.error));
    }

    return resolve_from_packument(package, std::string(fetched.data.begin(), fetched.data.end()),
                                  request);
}

// ============================================================================
// Registry Bundle Source
// ============================================================================

RegistryBundleSource::RegistryBundleSource(PackageLayout layout) : layout_(std::move(layout)) {}

Result<FetchedBundle> RegistryBundleSource::fetch(const ResolvedVersion& version) {
    spdlog::info("downloading {}@{}", version.package, version.version);

    auto fetched = fetch_https(version.tarball_url);
    if (!fetched.ok) {
        return Result<FetchedBundle>::err(
            Error(ErrorCode::SOURCE_MISSING, "download of " + version.tarball_url + " failed: " +
                                                 fetched.error));
    }
    return unpack(version, fetched.data);
}

Result<FetchedBundle> RegistryBundleSource::unpack(const ResolvedVersion& version,
                                                   const std::vector<uint8_t>& tarball) const {
    if (!version.shasum.empty()) {
        auto digest = compute_sha1(tarball);
        std::string expected = version.shasum;
        std::transform(expected.begin(), expected.end(), expected.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!digest.ok || digest.hex_digest != expected) {
            return Result<FetchedBundle>::err(
                Error(ErrorCode::FILE_CORRUPTED, "tarball shasum mismatch: expected " + expected +
                                                     ", got " + digest.hex_digest));
        }
    }

    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return Result<FetchedBundle>::err(Error(ErrorCode::IO_ERROR, "no temporary directory"));
    }

    FetchedBundle bundle;
    bundle.staging_dir = to_portable_path((tmp / (layout_.package_name + "-" + generate_uuid())).string());

    auto extracted = extract_tarball(tarball, bundle.staging_dir);
    if (extracted.isErr()) {
        remove_staging(bundle.staging_dir);
        return Result<FetchedBundle>::err(extracted.error());
    }

    // npm tarballs unpack under package/; the bundle may sit one level deeper
    std::string package_dir = join_path(bundle.staging_dir, "package");
    std::string nested = join_path(package_dir, layout_.package_name);
    bundle.dir = is_directory(nested) ? nested : package_dir;
    if (!is_directory(bundle.dir)) {
        remove_staging(bundle.staging_dir);
        return Result<FetchedBundle>::err(
            Error(ErrorCode::SOURCE_MISSING, "tarball has no package/ directory"));
    }

    spdlog::debug("unpacked {} files into {}", extracted.value().size(), bundle.staging_dir);
    return Result<FetchedBundle>::ok(std::move(bundle));
}

void RegistryBundleSource::release(const FetchedBundle& bundle) {
    remove_staging(bundle.staging_dir);
}

} // namespace gsd
