#include "gsd/types.hpp"

namespace gsd {

std::optional<Scope> parse_scope(const std::string& str) {
    if (str == "global") return Scope::Global;
    if (str == "local") return Scope::Local;
    return std::nullopt;
}

} // namespace gsd
