#include "gsd/path_utils.hpp"
#include "gsd/platform.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace gsd {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

std::string join_components(const std::string& root, const std::vector<std::string>& comps) {
    std::filesystem::path p(root);
    for (const auto& c : comps) {
        p /= c;
    }
    return to_portable_path(p.lexically_normal().string());
}

} // namespace

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::string rel = to_portable_path(relative_path);
    if (!rel.empty() && rel[0] == '/') {
        if (!allow_absolute) {
            return {false, {}, PathError::AbsoluteNotAllowed};
        }
        while (!rel.empty() && rel[0] == '/') {
            rel.erase(rel.begin());
        }
    }

    std::vector<std::string> normalized;
    for (const auto& part : split(rel, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    std::string out = join_components(root, normalized);

    // Lexical containment check, the filesystem is not consulted
    auto lex_root = std::filesystem::path(root).lexically_normal();
    auto lex_out = std::filesystem::path(out).lexically_normal();
    auto root_it = lex_root.begin();
    auto out_it = lex_out.begin();
    for (; root_it != lex_root.end() && out_it != lex_out.end(); ++root_it, ++out_it) {
        if (root_it->empty()) break;  // trailing separator on root
        if (*root_it != *out_it) {
            return {false, {}, PathError::EscapesRoot};
        }
    }
    if (root_it != lex_root.end() && !root_it->empty()) {
        return {false, {}, PathError::EscapesRoot};
    }

    return {true, out, PathError::None};
}

bool is_safe_relative_path(const std::string& relative_path) {
    if (relative_path.empty() || contains_nul(relative_path)) return false;
    if (relative_path.find('\\') != std::string::npos) return false;
    if (relative_path[0] == '/') return false;
    if (relative_path.size() >= 2 && relative_path[1] == ':') return false;

    for (const auto& part : split(relative_path, '/')) {
        if (part.empty() || part == "." || part == "..") return false;
    }
    // split() drops a trailing empty segment
    return relative_path.back() != '/';
}

std::string relative_to_root(const std::string& root, const std::string& path) {
    auto lex_root = std::filesystem::path(root).lexically_normal();
    auto lex_path = std::filesystem::path(path).lexically_normal();
    auto rel = lex_path.lexically_relative(lex_root);
    std::string out = to_portable_path(rel.string());
    if (out.empty() || out == "." || out == ".." || out.rfind("../", 0) == 0) {
        return "";
    }
    return out;
}

std::string expand_tilde(const std::string& path, const std::string& home) {
    if (path == "~") return home;
    if (path.rfind("~/", 0) == 0 || path.rfind("~\\", 0) == 0) {
        return join_path(home, path.substr(2));
    }
    return path;
}

} // namespace gsd
