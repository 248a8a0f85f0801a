#pragma once

#include "gsd/types.hpp"

#include <string>
#include <vector>

namespace gsd {

// ============================================================================
// Namespace Rules
// ============================================================================

// Predicate deciding whether a relative path belongs to the managed bundle.
// A path matches when it is manifest-safe and starts with one of the
// namespace prefixes. Anything else is user content and is never touched.
class NamespaceRules {
public:
    NamespaceRules() = default;
    explicit NamespaceRules(std::vector<std::string> prefixes);

    static NamespaceRules from_layout(const PackageLayout& layout);

    bool matches(const std::string& relative_path) const;

    const std::vector<std::string>& prefixes() const { return prefixes_; }

private:
    std::vector<std::string> prefixes_;
};

} // namespace gsd
