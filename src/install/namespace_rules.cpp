#include "gsd/namespace_rules.hpp"
#include "gsd/path_utils.hpp"

#include <utility>

namespace gsd {

NamespaceRules::NamespaceRules(std::vector<std::string> prefixes)
    : prefixes_(std::move(prefixes)) {}

NamespaceRules NamespaceRules::from_layout(const PackageLayout& layout) {
    return NamespaceRules(layout.namespaces);
}

bool NamespaceRules::matches(const std::string& relative_path) const {
    if (!is_safe_relative_path(relative_path)) {
        return false;
    }
    for (const auto& prefix : prefixes_) {
        if (!prefix.empty() && relative_path.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace gsd
