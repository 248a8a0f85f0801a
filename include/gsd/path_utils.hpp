#pragma once

#include <string>

namespace gsd {

enum class PathError {
    None,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
    ContainsDotSegment,
};

struct PathResult {
    bool ok;
    std::string path;  // normalized absolute path when ok
    PathError error;
};

// Normalize a path relative to a root without following symlinks (string-based).
// - Rejects NUL bytes
// - Rejects absolute relative_path when allow_absolute is false
// - Collapses "." and ".." segments
// - Fails if resulting path would escape root
PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute = false);

// A manifest-safe relative path: non-empty, '/' separated, not absolute,
// no NUL, no empty, "." or ".." segments.
bool is_safe_relative_path(const std::string& relative_path);

// Relative path of `path` under `root` in portable form, or empty if
// `path` is not below `root`.
std::string relative_to_root(const std::string& root, const std::string& path);

// Expand a leading "~" or "~/" to `home`.
std::string expand_tilde(const std::string& path, const std::string& home);

} // namespace gsd
