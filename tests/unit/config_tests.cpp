#include <doctest/doctest.h>
#include <gsd/config.hpp>

#include "../test_helpers.hpp"

using namespace gsd;
using namespace gsd::test;
using nlohmann::json;

TEST_CASE("parse_profile_config recognizes both shapes") {
    SUBCASE("legacy") {
        auto r = parse_profile_config(json{{"model_profile", "balanced"}});
        REQUIRE(r.isOk());
        REQUIRE(std::holds_alternative<LegacyProfileConfig>(r.value()));
        CHECK(std::get<LegacyProfileConfig>(r.value()).model_profile == "balanced");
    }

    SUBCASE("v1") {
        json j = {{"profiles", {{"profile_type", "genius"},
                                {"models", {{"planning", "anthropic/opus"}}}}}};
        auto r = parse_profile_config(j);
        REQUIRE(r.isOk());
        REQUIRE(std::holds_alternative<ConfigV1>(r.value()));
        const auto& v1 = std::get<ConfigV1>(r.value());
        CHECK(v1.profile_type == ProfileType::Genius);
        CHECK(v1.models.planning == "anthropic/opus");
        CHECK(v1.models.execution == kDefaultModel);
    }

    SUBCASE("v1 wins over a leftover model_profile") {
        json j = {{"model_profile", "budget"}, {"profiles", {{"profile_type", "smart"}}}};
        auto r = parse_profile_config(j);
        REQUIRE(r.isOk());
        CHECK(std::holds_alternative<ConfigV1>(r.value()));
    }
}

TEST_CASE("parse_profile_config rejects unknown shapes") {
    CHECK(parse_profile_config(json::array()).isErr());
    CHECK(parse_profile_config(json{{"model_profile", "turbo"}}).isErr());
    CHECK(parse_profile_config(json{{"profiles", {{"profile_type", "mega"}}}}).isErr());
    CHECK(parse_profile_config(json{{"profiles", "smart"}}).isErr());

    auto r = parse_profile_config(json{{"workflow", {{"research", true}}}});
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::CONFIG_INVALID);
}

TEST_CASE("legacy profiles map to profile types") {
    struct Case {
        const char* legacy;
        ProfileType expected;
    };
    for (auto c : {Case{"quality", ProfileType::Genius}, Case{"balanced", ProfileType::Smart},
                   Case{"budget", ProfileType::Simple}}) {
        CAPTURE(c.legacy);
        auto m = migrate_config(json{{"model_profile", c.legacy}});
        REQUIRE(m.isOk());
        CHECK(m.value().needed);
        CHECK(m.value().from == c.legacy);
        CHECK(m.value().to.profile_type == c.expected);
    }
}

TEST_CASE("migration keeps unrelated keys and model_profile") {
    json j = {{"model_profile", "quality"}, {"mode", "yolo"}, {"workflow", {{"research", false}}}};
    auto m = migrate_config(j);
    REQUIRE(m.isOk());

    const auto& doc = m.value().document;
    CHECK(doc["mode"] == "yolo");
    CHECK(doc["workflow"]["research"] == false);
    CHECK(doc["model_profile"] == "quality");
    CHECK(doc["profiles"]["profile_type"] == "genius");
    CHECK(doc["profiles"]["models"]["verification"] == kDefaultModel);
}

TEST_CASE("migration of a v1 document is a no-op") {
    json j = {{"profiles", {{"profile_type", "simple"}}}};
    auto m = migrate_config(j);
    REQUIRE(m.isOk());
    CHECK_FALSE(m.value().needed);
    CHECK(m.value().document == j);
}

// ============================================================================
// ProfileConfigFile
// ============================================================================

TEST_CASE("ProfileConfigFile migrates with a backup") {
    TempDir tmp;
    ProfileConfigFile file(tmp.path());
    std::string original = "{\"model_profile\": \"budget\", \"mode\": \"interactive\"}\n";
    write_text(file.path(), original);

    auto outcome = file.migrate(false);
    REQUIRE(outcome.isOk());
    CHECK(outcome.value().written);
    CHECK(outcome.value().backup_path == file.path() + ".bak");
    CHECK(read_text(outcome.value().backup_path) == original);

    auto loaded = file.load();
    REQUIRE(loaded.isOk());
    REQUIRE(std::holds_alternative<ConfigV1>(loaded.value()));
    CHECK(std::get<ConfigV1>(loaded.value()).profile_type == ProfileType::Simple);

    auto again = file.migrate(false);
    REQUIRE(again.isOk());
    CHECK_FALSE(again.value().migration.needed);
    CHECK_FALSE(again.value().written);
}

TEST_CASE("ProfileConfigFile dry run leaves the file alone") {
    TempDir tmp;
    ProfileConfigFile file(tmp.path());
    std::string original = "{\"model_profile\": \"quality\"}\n";
    write_text(file.path(), original);

    auto outcome = file.migrate(true);
    REQUIRE(outcome.isOk());
    CHECK(outcome.value().migration.needed);
    CHECK_FALSE(outcome.value().written);
    CHECK(read_text(file.path()) == original);
    CHECK_FALSE(path_exists(file.path() + ".bak"));
}

TEST_CASE("ProfileConfigFile reports missing and malformed files") {
    TempDir tmp;
    ProfileConfigFile file(tmp.path());
    CHECK(file.path() == tmp.sub(".planning/config.json"));

    auto missing = file.load();
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::CONFIG_INVALID);

    write_text(file.path(), "{ not json");
    auto broken = file.migrate(false);
    REQUIRE(broken.isErr());
    CHECK(broken.error().code() == ErrorCode::CONFIG_INVALID);
}
