#include "gsd/manifest.hpp"
#include "gsd/path_utils.hpp"
#include "gsd/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <utility>

namespace gsd {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

Error write_error(const std::string& path, const AtomicWriteResult& r) {
    if (r.permission_denied) {
        return Error(ErrorCode::PERMISSION_DENIED, path + ": " + r.error);
    }
    return Error(ErrorCode::WRITE_FAILED, path + ": " + r.error);
}

} // namespace

const ManifestEntry* Manifest::find(const std::string& relative_path) const {
    for (const auto& e : entries) {
        if (e.relative_path == relative_path) return &e;
    }
    return nullptr;
}

std::string serialize_manifest(const std::vector<ManifestEntry>& entries) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& e : entries) {
        j.push_back({
            {"path", e.path},
            {"relativePath", e.relative_path},
            {"size", e.size},
            {"hash", e.hash},
        });
    }
    return j.dump(2) + "\n";
}

Manifest parse_manifest(const std::string& json_str) {
    Manifest result;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        result.status = ManifestLoadStatus::Corrupt;
        result.error = std::string("invalid JSON: ") + e.what();
        return result;
    }

    if (!j.is_array()) {
        result.status = ManifestLoadStatus::Corrupt;
        result.error = "manifest must be a JSON array";
        return result;
    }

    for (const auto& item : j) {
        if (!item.is_object() || !item.contains("relativePath") ||
            !item["relativePath"].is_string()) {
            result.warnings.push_back("dropped manifest entry without relativePath");
            continue;
        }

        ManifestEntry entry;
        entry.relative_path = item["relativePath"].get<std::string>();
        if (!is_safe_relative_path(entry.relative_path)) {
            result.warnings.push_back("dropped manifest entry with unsafe path: " +
                                      entry.relative_path);
            continue;
        }
        if (item.contains("path") && item["path"].is_string()) {
            entry.path = item["path"].get<std::string>();
        }
        if (item.contains("size") && item["size"].is_number_unsigned()) {
            entry.size = item["size"].get<uint64_t>();
        } else if (item.contains("size") && item["size"].is_number_integer() &&
                   item["size"].get<int64_t>() >= 0) {
            entry.size = static_cast<uint64_t>(item["size"].get<int64_t>());
        }
        if (item.contains("hash") && item["hash"].is_string()) {
            entry.hash = item["hash"].get<std::string>();
        }

        // Unique by relativePath; the later entry wins
        bool replaced = false;
        for (auto& existing : result.entries) {
            if (existing.relative_path == entry.relative_path) {
                existing = entry;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            result.entries.push_back(std::move(entry));
        }
    }

    result.status = ManifestLoadStatus::Loaded;
    return result;
}

// ============================================================================
// ManifestManager
// ============================================================================

ManifestManager::ManifestManager(std::string root, PackageLayout layout)
    : root_(std::move(root)), layout_(std::move(layout)) {}

std::string ManifestManager::manifest_path() const {
    return join_path(root_, layout_.manifest_file);
}

std::string ManifestManager::version_path() const {
    return join_path(root_, layout_.version_file);
}

bool ManifestManager::manifest_exists() const {
    return is_regular_file(manifest_path());
}

bool ManifestManager::version_exists() const {
    return is_regular_file(version_path());
}

Manifest ManifestManager::load() const {
    Manifest result;
    std::string path = manifest_path();

    if (!path_exists(path)) {
        result.status = ManifestLoadStatus::Absent;
        result.version = read_version();
        return result;
    }

    auto text = read_file_text(path);
    if (!text) {
        result.status = ManifestLoadStatus::Corrupt;
        result.error = "failed to read " + path;
    } else {
        result = parse_manifest(*text);
    }
    result.version = read_version();

    if (result.status == ManifestLoadStatus::Corrupt) {
        spdlog::warn("manifest {} is corrupt: {}", path, result.error);
    }
    for (const auto& w : result.warnings) {
        spdlog::warn("{}", w);
    }
    spdlog::debug("loaded manifest {} ({} entries)", path, result.entries.size());
    return result;
}

Result<void> ManifestManager::save(const std::vector<ManifestEntry>& entries,
                                   const std::string& version) const {
    auto marker = write_version(version);
    if (marker.isErr()) {
        return marker;
    }

    std::string path = manifest_path();
    auto dir = atomic_create_directory(get_parent_directory(path));
    if (!dir.ok) {
        return Result<void>::err(write_error(get_parent_directory(path), dir));
    }

    auto written = atomic_write_file(path, serialize_manifest(entries));
    if (!written.ok) {
        return Result<void>::err(write_error(path, written));
    }

    spdlog::debug("wrote manifest {} ({} entries)", path, entries.size());
    return Result<void>::ok();
}

const ManifestEntry& ManifestManager::add_file(const std::string& absolute_path,
                                               const std::string& relative_path,
                                               uint64_t size,
                                               const std::string& hash) {
    for (auto& e : entries_) {
        if (e.relative_path == relative_path) {
            e.path = absolute_path;
            e.size = size;
            e.hash = hash;
            return e;
        }
    }
    entries_.push_back(ManifestEntry{absolute_path, relative_path, size, hash});
    return entries_.back();
}

Result<void> ManifestManager::remove() const {
    for (const auto& path : {version_path(), manifest_path()}) {
        if (!remove_file(path)) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to remove " + path));
        }
    }
    return Result<void>::ok();
}

std::string ManifestManager::read_version() const {
    auto text = read_file_text(version_path());
    if (!text) return "";
    return trim(*text);
}

Result<void> ManifestManager::write_version(const std::string& version) const {
    std::string path = version_path();
    auto dir = atomic_create_directory(get_parent_directory(path));
    if (!dir.ok) {
        return Result<void>::err(write_error(get_parent_directory(path), dir));
    }

    auto written = atomic_write_file(path, version + "\n");
    if (!written.ok) {
        return Result<void>::err(write_error(path, written));
    }
    return Result<void>::ok();
}

} // namespace gsd
