#include <doctest/doctest.h>
#include <gsd/path_utils.hpp>

using gsd::PathError;
using gsd::normalize_under_root;

TEST_CASE("normalize simple relative path under root") {
    auto r = normalize_under_root("/home/u/.config/opencode", "agents/gsd-planner.md");
    REQUIRE(r.ok);
    CHECK(r.path == "/home/u/.config/opencode/agents/gsd-planner.md");
}

TEST_CASE("collapse dot and dotdot segments") {
    auto r = normalize_under_root("/root/oc", "./commands/../agents/./gsd-x.md");
    REQUIRE(r.ok);
    CHECK(r.path == "/root/oc/agents/gsd-x.md");
}

TEST_CASE("reject escape above root") {
    auto r = normalize_under_root("/root/oc", "../../etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);
}

TEST_CASE("reject absolute when not allowed") {
    auto r = normalize_under_root("/root/oc", "/abs/path");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::AbsoluteNotAllowed);
}

TEST_CASE("reject NUL bytes") {
    std::string bad = std::string("agents/\0gsd", 11);
    auto r = normalize_under_root("/root/oc", bad);
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::ContainsNul);
}

TEST_CASE("normalize handles multiple consecutive slashes") {
    auto r = normalize_under_root("/root/oc", "commands//gsd///plan.md");
    REQUIRE(r.ok);
    CHECK(r.path.find("//") == std::string::npos);
}

TEST_CASE("sibling directory sharing a name prefix is outside the root") {
    auto r = normalize_under_root("/root/oc", "../oc-other/file");
    CHECK_FALSE(r.ok);
}

// ============================================================================
// Manifest-safe relative paths
// ============================================================================

TEST_CASE("is_safe_relative_path accepts plain relative paths") {
    CHECK(gsd::is_safe_relative_path("agents/gsd-planner.md"));
    CHECK(gsd::is_safe_relative_path("get-shit-done/VERSION"));
}

TEST_CASE("is_safe_relative_path rejects unsafe forms") {
    CHECK_FALSE(gsd::is_safe_relative_path(""));
    CHECK_FALSE(gsd::is_safe_relative_path("/etc/passwd"));
    CHECK_FALSE(gsd::is_safe_relative_path("../agents/gsd-x.md"));
    CHECK_FALSE(gsd::is_safe_relative_path("agents/../../x"));
    CHECK_FALSE(gsd::is_safe_relative_path("agents/./gsd-x.md"));
    CHECK_FALSE(gsd::is_safe_relative_path("agents//gsd-x.md"));
    CHECK_FALSE(gsd::is_safe_relative_path("agents\\gsd-x.md"));
    CHECK_FALSE(gsd::is_safe_relative_path("C:/Windows"));
    CHECK_FALSE(gsd::is_safe_relative_path("agents/"));
}

TEST_CASE("relative_to_root") {
    CHECK(gsd::relative_to_root("/home/u", "/home/u/.config/opencode") == ".config/opencode");
    CHECK(gsd::relative_to_root("/home/u", "/opt/opencode").empty());
    CHECK(gsd::relative_to_root("/home/u", "/home/u").empty());
}

TEST_CASE("expand_tilde") {
    CHECK(gsd::expand_tilde("~", "/home/u") == "/home/u");
    CHECK(gsd::expand_tilde("~/oc", "/home/u") == "/home/u/oc");
    CHECK(gsd::expand_tilde("/abs/~/x", "/home/u") == "/abs/~/x");
    CHECK(gsd::expand_tilde("~other/x", "/home/u") == "~other/x");
}
