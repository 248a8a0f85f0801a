#include <doctest/doctest.h>
#include <gsd/manifest.hpp>
#include <gsd/namespace_rules.hpp>

using namespace gsd;

TEST_CASE("managed paths match the namespace") {
    auto rules = NamespaceRules::from_layout(PackageLayout{});
    CHECK(rules.matches("agents/gsd-planner.md"));
    CHECK(rules.matches("command/gsd/plan.md"));
    CHECK(rules.matches("commands/gsd/plan.md"));
    CHECK(rules.matches("skills/gsd-research/SKILL.md"));
    CHECK(rules.matches("get-shit-done/VERSION"));
    CHECK(rules.matches("get-shit-done/workflows/plan.md"));
}

TEST_CASE("user content is outside the namespace") {
    auto rules = NamespaceRules::from_layout(PackageLayout{});
    CHECK_FALSE(rules.matches("agents/my-agent.md"));
    CHECK_FALSE(rules.matches("commands/deploy.md"));
    CHECK_FALSE(rules.matches("commands/gsdx/plan.md"));
    CHECK_FALSE(rules.matches("skills/research/SKILL.md"));
    CHECK_FALSE(rules.matches("opencode.json"));
    CHECK_FALSE(rules.matches("get-shit-done"));
}

TEST_CASE("unsafe paths never match even with a managed prefix") {
    auto rules = NamespaceRules::from_layout(PackageLayout{});
    CHECK_FALSE(rules.matches("get-shit-done/../opencode.json"));
    CHECK_FALSE(rules.matches("/agents/gsd-planner.md"));
    CHECK_FALSE(rules.matches(""));
}

TEST_CASE("custom prefixes") {
    NamespaceRules rules(std::vector<std::string>{"tools/acme-"});
    CHECK(rules.matches("tools/acme-x"));
    CHECK_FALSE(rules.matches("agents/gsd-planner.md"));
    CHECK(ManifestManager::is_in_namespace("tools/acme-y", rules));
    CHECK(NamespaceRules().prefixes().empty());
    CHECK_FALSE(NamespaceRules().matches("anything"));
}
