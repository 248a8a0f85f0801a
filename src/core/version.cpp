#include "gsd/version.hpp"

#include <cctype>

namespace gsd {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

} // namespace

std::optional<Version> parse_version(const std::string& str) {
    std::string s = trim(str);
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) {
        s.erase(s.begin());
    }
    if (s.empty()) return std::nullopt;

    try {
        return semver::version::parse(s);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

VersionChange classify_change(const std::string& installed, const std::string& target) {
    if (trim(installed) == trim(target)) return VersionChange::Same;

    auto from = parse_version(installed);
    auto to = parse_version(target);
    if (!from || !to) return VersionChange::Unknown;

    if (*from == *to) return VersionChange::Same;
    return *from < *to ? VersionChange::Upgrade : VersionChange::Downgrade;
}

} // namespace gsd
