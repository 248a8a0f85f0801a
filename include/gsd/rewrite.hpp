#pragma once

#include "gsd/types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace gsd {

// ============================================================================
// Path Rewriting
// ============================================================================

// Rewrites bundle-relative references in text content to the concrete
// installation prefix. Must be pure: same input, same output.
using PathRewriter = std::function<std::string(const std::string& text,
                                               const std::string& prefix)>;

// Default rewriter for a scope. Replaces "@gsd-opencode/" and
// "~/.config/opencode/" with "<prefix>/"; local scope also replaces
// "@~/.config/opencode/". Replacement is literal and single-pass.
PathRewriter make_path_rewriter(Scope scope);

// A rewriter that returns its input unchanged
PathRewriter identity_rewriter();

// True when the content is text eligible for rewriting: extension in the
// layout's rewrite set and no NUL byte in the first 8 KiB.
bool is_rewritable(const std::string& path, const std::vector<uint8_t>& content,
                   const PackageLayout& layout);

} // namespace gsd
