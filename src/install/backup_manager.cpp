#include "gsd/backup.hpp"
#include "gsd/path_utils.hpp"
#include "gsd/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace gsd {

std::string backup_timestamp() {
    // get_current_timestamp() is "YYYY-MM-DDTHH:MM:SSZ"
    std::string ts = get_current_timestamp().substr(0, 19);
    std::replace(ts.begin(), ts.end(), ':', '-');
    return ts;
}

BackupManager::BackupManager(std::string root, PackageLayout layout)
    : root_(std::move(root)), layout_(std::move(layout)) {}

Result<std::string> BackupManager::ensure_session() {
    if (!session_dir_.empty()) {
        return Result<std::string>::ok(session_dir_);
    }

    std::string base = join_path(join_path(root_, layout_.backup_dir), backup_timestamp());
    std::string dir = base;
    for (int suffix = 1; path_exists(dir); ++suffix) {
        dir = base + "-" + std::to_string(suffix);
    }

    auto made = atomic_create_directory(dir);
    if (!made.ok) {
        return Result<std::string>::err(
            Error(made.permission_denied ? ErrorCode::PERMISSION_DENIED : ErrorCode::WRITE_FAILED,
                  "cannot create backup directory " + dir + ": " + made.error));
    }

    session_dir_ = dir;
    spdlog::debug("backup session {}", session_dir_);
    return Result<std::string>::ok(session_dir_);
}

Result<std::string> BackupManager::backup_file(const std::string& relative_path) {
    auto source = normalize_under_root(root_, relative_path);
    if (!source.ok) {
        return Result<std::string>::err(
            Error(ErrorCode::PATH_TRAVERSAL, "backup path escapes root: " + relative_path));
    }
    if (!is_regular_file(source.path)) {
        return Result<std::string>::ok("");
    }

    auto session = ensure_session();
    if (session.isErr()) {
        return session;
    }

    std::string target = join_path(session.value(), relative_path);
    if (!create_directories(get_parent_directory(target)) || !copy_file(source.path, target)) {
        return Result<std::string>::err(
            Error(ErrorCode::WRITE_FAILED, "failed to back up " + relative_path));
    }

    ++count_;
    spdlog::debug("backed up {} -> {}", relative_path, target);
    return Result<std::string>::ok(target);
}

} // namespace gsd
