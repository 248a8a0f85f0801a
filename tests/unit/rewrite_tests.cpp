#include <doctest/doctest.h>
#include <gsd/rewrite.hpp>

using namespace gsd;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST_CASE("global rewriter substitutes bundle references") {
    auto rewrite = make_path_rewriter(Scope::Global);
    CHECK(rewrite("see @gsd-opencode/get-shit-done/x.md", "~/.config/opencode") ==
          "see ~/.config/opencode/get-shit-done/x.md");
    CHECK(rewrite("load ~/.config/opencode/agents/gsd-a.md", "/opt/oc") ==
          "load /opt/oc/agents/gsd-a.md");
}

TEST_CASE("local rewriter also handles the @~ form") {
    auto rewrite = make_path_rewriter(Scope::Local);
    CHECK(rewrite("@~/.config/opencode/get-shit-done/x.md", "./.opencode") ==
          "./.opencode/get-shit-done/x.md");
    CHECK(rewrite("~/.config/opencode/a and @gsd-opencode/b", "./.opencode") ==
          "./.opencode/a and ./.opencode/b");
}

TEST_CASE("global rewriter leaves the @ marker of the local form") {
    auto rewrite = make_path_rewriter(Scope::Global);
    CHECK(rewrite("@~/.config/opencode/a", "/opt/oc") == "@/opt/oc/a");
}

TEST_CASE("replacement is literal and single pass") {
    auto rewrite = make_path_rewriter(Scope::Global);
    CHECK(rewrite("@gsd-opencode/x", "/tmp/$1/&") == "/tmp/$1/&/x");

    // A prefix that itself contains a pattern is not rewritten again
    CHECK(rewrite("@gsd-opencode/x", "@gsd-opencode") == "@gsd-opencode/x");
}

TEST_CASE("rewriting is pure") {
    auto rewrite = make_path_rewriter(Scope::Local);
    std::string text = "a @gsd-opencode/b ~/.config/opencode/c";
    CHECK(rewrite(text, "./.opencode") == rewrite(text, "./.opencode"));
    CHECK(rewrite("no references here", "./.opencode") == "no references here");
}

TEST_CASE("identity rewriter") {
    CHECK(identity_rewriter()("@gsd-opencode/x", "/p") == "@gsd-opencode/x");
}

TEST_CASE("is_rewritable requires a text extension and no NUL") {
    PackageLayout layout;
    CHECK(is_rewritable("agents/gsd-a.md", bytes("# text"), layout));
    CHECK(is_rewritable("agents/GSD-A.MD", bytes("# text"), layout));
    CHECK_FALSE(is_rewritable("get-shit-done/logo.png", bytes("# text"), layout));
    CHECK_FALSE(is_rewritable("agents/gsd-a.md", bytes(std::string("a\0b", 3)), layout));

    // NUL beyond the sniff window does not make it binary
    std::string late(9000, 'a');
    late[8500] = '\0';
    CHECK(is_rewritable("agents/gsd-a.md", bytes(late), layout));
}
