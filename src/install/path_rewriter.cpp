#include "gsd/rewrite.hpp"
#include "gsd/platform.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace gsd {

namespace {

constexpr size_t kBinarySniffBytes = 8192;

std::string replace_patterns(const std::string& text, const std::string& replacement,
                             const std::vector<std::string>& patterns) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        bool matched = false;
        for (const auto& pattern : patterns) {
            if (text.compare(i, pattern.size(), pattern) == 0) {
                out += replacement;
                i += pattern.size();
                matched = true;
                break;
            }
        }
        if (!matched) {
            out.push_back(text[i]);
            ++i;
        }
    }
    return out;
}

} // namespace

PathRewriter make_path_rewriter(Scope scope) {
    // Longest pattern first so "@~/..." is not consumed as "~/..."
    std::vector<std::string> patterns;
    if (scope == Scope::Local) {
        patterns.push_back("@~/.config/opencode/");
    }
    patterns.push_back("@gsd-opencode/");
    patterns.push_back("~/.config/opencode/");

    return [patterns = std::move(patterns)](const std::string& text, const std::string& prefix) {
        return replace_patterns(text, prefix + "/", patterns);
    };
}

PathRewriter identity_rewriter() {
    return [](const std::string& text, const std::string&) { return text; };
}

bool is_rewritable(const std::string& path, const std::vector<uint8_t>& content,
                   const PackageLayout& layout) {
    std::string ext = get_extension(path);
    if (std::find(layout.rewrite_extensions.begin(), layout.rewrite_extensions.end(), ext) ==
        layout.rewrite_extensions.end()) {
        return false;
    }

    size_t limit = std::min(content.size(), kBinarySniffBytes);
    return std::find(content.begin(), content.begin() + static_cast<std::ptrdiff_t>(limit),
                     uint8_t{0}) == content.begin() + static_cast<std::ptrdiff_t>(limit);
}

} // namespace gsd
