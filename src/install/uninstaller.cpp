#include "gsd/uninstaller.hpp"
#include "gsd/backup.hpp"
#include "gsd/manifest.hpp"
#include "gsd/namespace_rules.hpp"
#include "gsd/path_utils.hpp"
#include "gsd/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <set>
#include <utility>

namespace gsd {

namespace fs = std::filesystem;

namespace {

size_t depth(const std::string& rel) {
    return static_cast<size_t>(std::count(rel.begin(), rel.end(), '/'));
}

} // namespace

Uninstaller::Uninstaller(InstallationRoot root, PackageLayout layout)
    : root_(std::move(root)), layout_(std::move(layout)) {}

Result<UninstallPlan> Uninstaller::plan(std::vector<std::string>* warnings) const {
    ManifestManager store(root_.path, layout_);
    Manifest manifest = store.load();

    if (manifest.status == ManifestLoadStatus::Absent) {
        return Result<UninstallPlan>::err(
            Error(ErrorCode::NOT_INSTALLED, "no installation manifest at " + store.manifest_path()));
    }
    if (manifest.status == ManifestLoadStatus::Corrupt) {
        return Result<UninstallPlan>::err(
            Error(ErrorCode::MANIFEST_CORRUPT,
                  "manifest is corrupt; run 'gsd-opencode repair' first (" + manifest.error + ")"));
    }
    if (warnings) {
        warnings->insert(warnings->end(), manifest.warnings.begin(), manifest.warnings.end());
    }

    auto rules = NamespaceRules::from_layout(layout_);
    UninstallPlan result;

    for (const auto& entry : manifest.entries) {
        if (!rules.matches(entry.relative_path)) {
            result.protected_paths.push_back(entry.relative_path);
            continue;
        }

        auto path = normalize_under_root(root_.path, entry.relative_path);
        if (!path.ok) {
            result.protected_paths.push_back(entry.relative_path);
            continue;
        }

        std::error_code ec;
        auto status = fs::symlink_status(path.path, ec);
        if (!fs::exists(status)) {
            result.already_missing.push_back(entry.relative_path);
        } else if (fs::is_directory(status)) {
            // A directory where a managed file belongs is not ours to remove
            result.protected_paths.push_back(entry.relative_path);
        } else {
            result.to_remove.push_back(entry.relative_path);
        }
    }

    for (const auto& p : result.protected_paths) {
        spdlog::warn("not removing {}: outside the managed namespace", p);
        if (warnings) warnings->push_back("kept " + p + " (outside the managed namespace)");
    }

    std::vector<std::string> removal_set = result.to_remove;
    removal_set.insert(removal_set.end(), result.already_missing.begin(),
                       result.already_missing.end());
    result.directories = predict_directories(removal_set);

    return Result<UninstallPlan>::ok(std::move(result));
}

std::vector<std::string> Uninstaller::predict_directories(
    const std::vector<std::string>& removal_set) const {
    std::set<std::string> files(removal_set.begin(), removal_set.end());
    files.insert(layout_.manifest_file);
    files.insert(layout_.version_file);

    // Every ancestor of a removed file is a candidate
    std::set<std::string> candidates;
    for (const auto& rel : removal_set) {
        for (auto pos = rel.rfind('/'); pos != std::string::npos && pos > 0;
             pos = rel.rfind('/', pos - 1)) {
            candidates.insert(rel.substr(0, pos));
        }
    }

    std::vector<std::string> predicted;
    for (const auto& dir : candidates) {
        std::string abs = join_path(root_.path, dir);
        if (!is_directory(abs)) continue;

        bool removable = true;
        std::error_code ec;
        for (fs::recursive_directory_iterator it(abs, ec), end; !ec && it != end; it.increment(ec)) {
            std::string rel = dir + "/" + to_portable_path(
                it->path().lexically_relative(fs::path(abs)).string());
            auto status = it->symlink_status(ec);
            bool ok = fs::is_directory(status) ? candidates.count(rel) > 0
                                               : files.count(rel) > 0;
            if (!ok) {
                removable = false;
                break;
            }
        }
        if (ec) removable = false;
        if (removable) predicted.push_back(dir);
    }

    std::sort(predicted.begin(), predicted.end(), [](const std::string& a, const std::string& b) {
        if (depth(a) != depth(b)) return depth(a) > depth(b);
        return a < b;
    });
    return predicted;
}

UninstallResult Uninstaller::run(const UninstallOptions& options) const {
    UninstallResult result;
    result.dry_run = options.dry_run;

    auto planned = plan(&result.warnings);
    if (planned.isErr()) {
        if (planned.error().code() == ErrorCode::NOT_INSTALLED) {
            result.installed = false;
            result.ok = true;
        } else {
            result.error = planned.error();
        }
        return result;
    }
    result.plan = planned.value();

    if (options.dry_run) {
        result.ok = true;
        return result;
    }

    if (interrupt_requested()) {
        result.error = Error(ErrorCode::INTERRUPTED, "interrupted before anything was removed");
        return result;
    }

    if (options.backup) {
        BackupManager backups(root_.path, layout_);
        std::vector<std::string> to_backup = result.plan.to_remove;
        to_backup.push_back(layout_.manifest_file);
        for (const auto& rel : to_backup) {
            auto saved = backups.backup_file(rel);
            if (saved.isErr()) {
                // Nothing has been deleted yet
                result.error = saved.error();
                return result;
            }
        }
        result.backup_dir = backups.session_dir();
    }

    bool interrupted = false;
    for (const auto& rel : result.plan.to_remove) {
        if (interrupt_requested()) {
            interrupted = true;
            break;
        }
        std::string path = join_path(root_.path, rel);
        if (remove_file(path)) {
            result.removed_files.push_back(rel);
        } else {
            Error err(ErrorCode::IO_ERROR, "failed to remove " + path);
            spdlog::warn("{}", err.message());
            result.failures.push_back({rel, err});
        }
    }

    std::set<std::string> removed_dirs;
    auto remove_predicted = [&]() {
        for (const auto& dir : result.plan.directories) {
            if (removed_dirs.count(dir)) continue;
            if (remove_empty_directory(join_path(root_.path, dir))) {
                removed_dirs.insert(dir);
                result.removed_dirs.push_back(dir);
            }
        }
    };
    remove_predicted();

    // Keep the manifest so the uninstall can be re-run
    if (interrupted) {
        result.error = Error(ErrorCode::INTERRUPTED,
                             "interrupted after removing " +
                                 std::to_string(result.removed_files.size()) + " of " +
                                 std::to_string(result.plan.to_remove.size()) + " files");
        return result;
    }
    if (!result.failures.empty()) {
        result.error = result.failures.front().error;
        return result;
    }

    ManifestManager store(root_.path, layout_);
    auto removed = store.remove();
    if (removed.isErr()) {
        result.error = removed.error();
        return result;
    }

    // The owned directory empties only once the manifest is gone
    remove_predicted();
    std::string owned = join_path(root_.path, layout_.owned_dir);
    if (!removed_dirs.count(layout_.owned_dir) && remove_empty_directory(owned)) {
        result.removed_dirs.push_back(layout_.owned_dir);
    }

    spdlog::info("removed {} files and {} directories from {}",
                 result.removed_files.size(), result.removed_dirs.size(), root_.path);
    result.ok = true;
    return result;
}

} // namespace gsd
