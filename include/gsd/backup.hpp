#pragma once

#include "gsd/types.hpp"

#include <string>

namespace gsd {

// ============================================================================
// Backup Manager
// ============================================================================

// Copies files into <root>/.backups/<timestamp>/<relativePath> before they
// are deleted or overwritten. Backups are for manual restore only.
class BackupManager {
public:
    BackupManager(std::string root, PackageLayout layout);

    // Copy root/relative_path into the session directory, creating it on
    // first use. Returns the backup path; empty when the source is absent.
    Result<std::string> backup_file(const std::string& relative_path);

    // Session directory, empty until the first backup
    const std::string& session_dir() const { return session_dir_; }
    int backed_up() const { return count_; }

private:
    Result<std::string> ensure_session();

    std::string root_;
    PackageLayout layout_;
    std::string session_dir_;
    int count_ = 0;
};

// UTC "YYYY-MM-DDTHH-MM-SS", portable as a directory name
std::string backup_timestamp();

} // namespace gsd
