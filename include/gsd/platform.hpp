#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gsd {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    bool permission_denied = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// The temp file lives in the destination directory so the rename never
// crosses a filesystem boundary.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// Create a directory tree (mkdir -p with fsync on the parent)
AtomicWriteResult atomic_create_directory(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes. Manifest paths are always stored
// in this form.
std::string to_portable_path(const std::string& path);

std::string get_parent_directory(const std::string& path);
std::string get_filename(const std::string& path);

// Lowercase extension including the dot, or empty
std::string get_extension(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// List directory entry names (not full paths), sorted
std::vector<std::string> list_directory(const std::string& path);

bool create_directories(const std::string& path);

// Remove a file. Returns true if the file is gone afterwards
// (an already-absent file counts as removed).
bool remove_file(const std::string& path);

// Remove a directory only if it is empty
bool remove_empty_directory(const std::string& path);

bool copy_file(const std::string& src, const std::string& dst);

// Remove now-empty directories from the parent of `path` upwards, stopping
// before `root`. Returns the removed directories, deepest first.
std::vector<std::string> prune_empty_parents(const std::string& root, const std::string& path);

// Read a whole file as bytes / text
std::optional<std::vector<uint8_t>> read_file_bytes(const std::string& path);
std::optional<std::string> read_file_text(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// $HOME (or %USERPROFILE%), empty if neither is set
std::string get_home_directory();

std::string get_current_directory();

// Directory containing the running executable, empty if unknown
std::string get_executable_directory();

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Generate a UUID string
std::string generate_uuid();

// ============================================================================
// Interruption
// ============================================================================

// Install SIGINT/SIGTERM handlers that only set a flag. Long-running
// operations poll interrupt_requested() between files.
void install_interrupt_handlers();
bool interrupt_requested();
void reset_interrupt_flag();

} // namespace gsd
