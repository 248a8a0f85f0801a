#include "gsd/installer.hpp"
#include "gsd/hash.hpp"
#include "gsd/path_utils.hpp"
#include "gsd/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <filesystem>
#include <set>
#include <utility>

namespace gsd {

namespace fs = std::filesystem;

namespace {

struct WorkItem {
    std::string src_dir;
    std::string dest_rel;
};

Error write_failure(const std::string& rel, const AtomicWriteResult& r) {
    return Error(r.permission_denied ? ErrorCode::PERMISSION_DENIED : ErrorCode::WRITE_FAILED,
                 rel + ": " + r.error);
}

} // namespace

Installer::Installer(std::string bundle_dir, InstallationRoot root, PackageLayout layout,
                     PathRewriter rewriter, std::string prefix)
    : bundle_dir_(std::move(bundle_dir)), root_(std::move(root)), layout_(std::move(layout)),
      rewriter_(std::move(rewriter)), prefix_(std::move(prefix)),
      rules_(NamespaceRules::from_layout(layout_)) {}

std::string Installer::bundle_command_dir() const {
    // Current bundles ship "commands/", older ones "command/"
    if (is_directory(join_path(bundle_dir_, layout_.new_command_dir))) {
        return layout_.new_command_dir;
    }
    if (is_directory(join_path(bundle_dir_, layout_.old_command_dir))) {
        return layout_.old_command_dir;
    }
    return "";
}

Result<std::vector<InstallPlanItem>> Installer::plan(const std::string& command_dir,
                                                     std::vector<std::string>* warnings) const {
    using PlanResult = Result<std::vector<InstallPlanItem>>;

    if (!is_directory(bundle_dir_)) {
        return PlanResult::err(Error(ErrorCode::SOURCE_MISSING,
                                     "bundle directory not found: " + bundle_dir_));
    }

    auto warn = [&](const std::string& msg) {
        spdlog::warn("{}", msg);
        if (warnings) warnings->push_back(msg);
    };

    std::deque<WorkItem> queue;
    std::vector<std::pair<std::string, std::string>> mapping = {
        {layout_.agents_dir, layout_.agents_dir},
    };
    std::string src_cmd = bundle_command_dir();
    if (!src_cmd.empty()) {
        mapping.emplace_back(src_cmd, command_dir);
    }
    mapping.emplace_back(layout_.owned_dir, layout_.owned_dir);
    mapping.emplace_back(layout_.skills_dir, layout_.skills_dir);

    for (const auto& [src, dest] : mapping) {
        std::string dir = join_path(bundle_dir_, src);
        if (is_directory(dir)) {
            queue.push_back({dir, dest});
        } else {
            spdlog::debug("bundle has no {}/ directory", src);
        }
    }

    if (queue.empty()) {
        return PlanResult::err(Error(ErrorCode::SOURCE_MISSING,
                                     "bundle contains no installable directories: " + bundle_dir_));
    }

    std::vector<InstallPlanItem> items;
    std::set<std::string> seen;

    auto add_item = [&](const std::string& source, const std::string& rel) {
        if (rel == layout_.manifest_file || rel == layout_.version_file) {
            warn("bundle file reserved for installation state skipped: " + rel);
            return;
        }
        if (!rules_.matches(rel)) {
            warn("bundle file outside managed namespaces skipped: " + rel);
            return;
        }
        if (seen.insert(rel).second) {
            items.push_back({source, rel});
        }
    };

    while (!queue.empty()) {
        WorkItem work = queue.front();
        queue.pop_front();

        for (const auto& name : list_directory(work.src_dir)) {
            std::string full = join_path(work.src_dir, name);
            std::string rel = work.dest_rel + "/" + name;

            std::error_code ec;
            auto status = fs::symlink_status(full, ec);
            if (ec) {
                warn("cannot stat bundle entry: " + full);
                continue;
            }
            if (fs::is_symlink(status)) {
                warn("symlink in bundle skipped: " + full);
            } else if (fs::is_directory(status)) {
                queue.push_back({full, rel});
            } else if (fs::is_regular_file(status)) {
                add_item(full, rel);
            } else {
                warn("special file in bundle skipped: " + full);
            }
        }
    }

    std::string package_json = join_path(bundle_dir_, "package.json");
    if (is_regular_file(package_json)) {
        add_item(package_json, layout_.owned_dir + "/package.json");
    }

    spdlog::debug("install plan: {} files from {}", items.size(), bundle_dir_);
    return PlanResult::ok(std::move(items));
}

Result<ManifestEntry> Installer::copy_file(const InstallPlanItem& item,
                                           std::vector<std::string>* created_dirs) const {
    using EntryResult = Result<ManifestEntry>;

    auto dest = normalize_under_root(root_.path, item.relative_path);
    if (!dest.ok) {
        return EntryResult::err(Error(ErrorCode::PATH_TRAVERSAL,
                                      "destination escapes root: " + item.relative_path));
    }

    // Record missing ancestors so a failed fresh install can prune them
    std::vector<std::string> missing;
    for (fs::path p = fs::path(dest.path).parent_path(); !p.empty() && !is_directory(p.string());
         p = p.parent_path()) {
        missing.push_back(to_portable_path(p.string()));
        if (p == p.parent_path()) break;
    }
    if (!missing.empty()) {
        auto made = atomic_create_directory(missing.front());
        if (!made.ok) {
            return EntryResult::err(write_failure(item.relative_path, made));
        }
        if (created_dirs) {
            created_dirs->insert(created_dirs->end(), missing.rbegin(), missing.rend());
        }
    }

    auto bytes = read_file_bytes(item.source);
    if (!bytes) {
        return EntryResult::err(Error(ErrorCode::IO_ERROR, "failed to read " + item.source));
    }

    if (rewriter_ && is_rewritable(item.relative_path, *bytes, layout_)) {
        std::string text = rewriter_(std::string(bytes->begin(), bytes->end()), prefix_);
        bytes->assign(text.begin(), text.end());
    }

    auto written = atomic_write_file(dest.path, *bytes);
    if (!written.ok) {
        return EntryResult::err(write_failure(item.relative_path, written));
    }

    std::string hash = content_hash(*bytes);
    if (hash.empty()) {
        return EntryResult::err(Error(ErrorCode::IO_ERROR, "failed to hash " + item.relative_path));
    }

    spdlog::debug("installed {}", item.relative_path);
    return EntryResult::ok(ManifestEntry{dest.path, item.relative_path,
                                         static_cast<uint64_t>(bytes->size()), hash});
}

InstallResult Installer::copy(const std::vector<InstallPlanItem>& items) const {
    InstallResult result;

    for (const auto& item : items) {
        if (interrupt_requested()) {
            result.interrupted = true;
            Error err(ErrorCode::INTERRUPTED, "interrupted before " + item.relative_path);
            result.failures.push_back({item.relative_path, err});
            result.error = err;
            break;
        }

        bool existed = path_exists(join_path(root_.path, item.relative_path));
        auto copied = copy_file(item, &result.created_dirs);
        if (copied.isErr()) {
            spdlog::warn("copy failed: {}", copied.error().message());
            result.failures.push_back({item.relative_path, copied.error()});
            result.error = copied.error();
            break;
        }

        result.entries.push_back(copied.value());
        if (!existed) {
            result.created_files.push_back(item.relative_path);
        }
    }

    result.ok = result.failures.empty();
    return result;
}

std::optional<InstallPlanItem> Installer::find_source(const std::string& relative_path) const {
    if (!is_safe_relative_path(relative_path)) {
        return std::nullopt;
    }

    auto candidate = [&](const std::string& bundle_rel) -> std::optional<InstallPlanItem> {
        std::string source = join_path(bundle_dir_, bundle_rel);
        std::error_code ec;
        if (fs::is_regular_file(fs::symlink_status(source, ec))) {
            return InstallPlanItem{source, relative_path};
        }
        return std::nullopt;
    };

    // Either installed command dir maps to whichever the bundle ships
    for (const auto& cmd : {layout_.old_command_dir, layout_.new_command_dir}) {
        std::string prefix = cmd + "/";
        if (relative_path.compare(0, prefix.size(), prefix) == 0) {
            std::string src_cmd = bundle_command_dir();
            if (src_cmd.empty()) return std::nullopt;
            return candidate(src_cmd + "/" + relative_path.substr(prefix.size()));
        }
    }

    if (relative_path == layout_.owned_dir + "/package.json") {
        if (auto nested = candidate(relative_path)) return nested;
        return candidate("package.json");
    }

    return candidate(relative_path);
}

void Installer::discard(InstallResult& result) const {
    for (const auto& rel : result.created_files) {
        std::string path = join_path(root_.path, rel);
        if (remove_file(path)) {
            result.discarded.push_back(rel);
        } else {
            spdlog::warn("could not discard partially installed file {}", path);
        }
    }

    std::string root = to_portable_path(fs::path(root_.path).lexically_normal().string());
    for (auto it = result.created_dirs.rbegin(); it != result.created_dirs.rend(); ++it) {
        if (*it == root) continue;
        remove_empty_directory(*it);
    }
    spdlog::info("discarded {} partially installed files", result.discarded.size());
}

Result<void> Installer::commit(const std::vector<ManifestEntry>& entries,
                               const std::string& version) const {
    return ManifestManager(root_.path, layout_).save(entries, version);
}

std::vector<std::string> Installer::remove_stale(const std::vector<ManifestEntry>& previous,
                                                 const std::vector<ManifestEntry>& current) const {
    std::set<std::string> keep;
    for (const auto& e : current) keep.insert(e.relative_path);

    std::vector<std::string> removed;
    for (const auto& e : previous) {
        if (keep.count(e.relative_path) || !rules_.matches(e.relative_path)) continue;

        auto dest = normalize_under_root(root_.path, e.relative_path);
        if (!dest.ok) continue;

        std::error_code ec;
        if (!fs::exists(fs::symlink_status(dest.path, ec))) continue;
        if (fs::is_directory(fs::symlink_status(dest.path, ec))) continue;

        if (remove_file(dest.path)) {
            removed.push_back(e.relative_path);
            prune_empty_parents(root_.path, dest.path);
            spdlog::debug("removed stale file {}", e.relative_path);
        } else {
            spdlog::warn("failed to remove stale file {}", dest.path);
        }
    }
    return removed;
}

InstallResult Installer::install(InstallMode mode, const std::string& command_dir,
                                 const std::string& version,
                                 const std::vector<ManifestEntry>& previous) const {
    std::vector<std::string> warnings;
    auto planned = plan(command_dir, &warnings);
    if (planned.isErr()) {
        InstallResult result;
        result.error = planned.error();
        result.warnings = std::move(warnings);
        return result;
    }

    InstallResult result = copy(planned.value());
    result.warnings.insert(result.warnings.begin(), warnings.begin(), warnings.end());

    if (!result.ok) {
        if (mode == InstallMode::Fresh) {
            discard(result);
        }
        return result;
    }

    ManifestManager manifest(root_.path, layout_);
    bool had_marker = manifest.version_exists();

    auto committed = commit(result.entries, version);
    if (committed.isErr()) {
        result.ok = false;
        result.error = committed.error();
        result.failures.push_back({layout_.manifest_file, committed.error()});
        if (mode == InstallMode::Fresh) {
            if (!had_marker) {
                remove_file(manifest.version_path());
            }
            discard(result);
        }
        return result;
    }

    if (!previous.empty()) {
        result.stale_removed = remove_stale(previous, result.entries);
    }

    spdlog::info("installed {} files into {}", result.entries.size(), root_.path);
    return result;
}

std::string read_bundle_version(const std::string& bundle_dir) {
    auto text = read_file_text(join_path(bundle_dir, "package.json"));
    if (!text) return "";

    try {
        auto j = nlohmann::json::parse(*text);
        if (j.is_object() && j.contains("version") && j["version"].is_string()) {
            return j["version"].get<std::string>();
        }
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("invalid package.json in {}: {}", bundle_dir, e.what());
    }
    return "";
}

} // namespace gsd
