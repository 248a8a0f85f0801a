#include <doctest/doctest.h>
#include <gsd/health.hpp>

#include "../test_helpers.hpp"

using namespace gsd;
using namespace gsd::test;

namespace {

HealthReport check_root(const std::string& root, const std::string& expected = "1.2.0") {
    return HealthChecker(local_root(root), PackageLayout{}).check(expected);
}

} // namespace

TEST_CASE("nothing installed is informational") {
    TempDir tmp;
    auto report = check_root(tmp.path());
    CHECK_FALSE(report.installed);
    CHECK(report.passed);
    CHECK(report.manifest_status == ManifestLoadStatus::Absent);
}

TEST_CASE("fresh installation is healthy") {
    TempDir tmp;
    make_bundle(tmp.sub("bundle"), "1.2.0");
    REQUIRE(install_bundle(tmp.sub("bundle"), tmp.sub("root")).ok);

    auto report = check_root(tmp.sub("root"));
    CHECK(report.installed);
    CHECK(report.passed);
    CHECK(report.files.checks.size() == kBundleFiles);
    CHECK(report.integrity.checks.size() == kBundleFiles);
    CHECK(report.installed_version == "1.2.0");
    CHECK(report.structure_details.state == StructureState::New);
    CHECK(report.missing().empty());
    CHECK(report.corrupted().empty());
}

TEST_CASE("deleted file is reported missing") {
    TempDir tmp;
    make_bundle(tmp.sub("bundle"), "1.2.0");
    std::string root = tmp.sub("root");
    REQUIRE(install_bundle(tmp.sub("bundle"), root).ok);
    REQUIRE(remove_file(join_path(root, "agents/gsd-executor.md")));

    auto report = check_root(root);
    CHECK_FALSE(report.passed);
    CHECK_FALSE(report.files.passed);
    CHECK_FALSE(report.integrity.passed);
    CHECK(report.version.passed);
    CHECK(report.structure.passed);
    CHECK(report.missing() == std::vector<std::string>{"agents/gsd-executor.md"});
    CHECK(report.corrupted().empty());
}

TEST_CASE("modified file is reported corrupted") {
    TempDir tmp;
    make_bundle(tmp.sub("bundle"), "1.2.0");
    std::string root = tmp.sub("root");
    REQUIRE(install_bundle(tmp.sub("bundle"), root).ok);
    write_text(join_path(root, "commands/gsd/plan.md"), "edited by hand\n");

    auto report = check_root(root);
    CHECK_FALSE(report.passed);
    CHECK(report.files.passed);
    CHECK_FALSE(report.integrity.passed);
    CHECK(report.corrupted() == std::vector<std::string>{"commands/gsd/plan.md"});
    CHECK(report.missing().empty());
}

TEST_CASE("version category") {
    TempDir tmp;
    make_bundle(tmp.sub("bundle"), "1.2.0");
    std::string root = tmp.sub("root");
    REQUIRE(install_bundle(tmp.sub("bundle"), root).ok);

    SUBCASE("mismatch fails with the installed value") {
        auto report = check_root(root, "1.3.0");
        CHECK_FALSE(report.version.passed);
        REQUIRE(report.version.checks.size() == 1);
        CHECK(report.version.checks[0].detail.find("1.2.0") != std::string::npos);
    }

    SUBCASE("no expected version only requires a marker") {
        CHECK(check_root(root, "").version.passed);
    }

    SUBCASE("missing marker fails") {
        REQUIRE(remove_file(join_path(root, "get-shit-done/VERSION")));
        auto report = check_root(root, "");
        CHECK_FALSE(report.version.passed);
        CHECK(report.version.checks[0].detail == "installed: none");
    }
}

TEST_CASE("corrupt manifest is unhealthy without crashing") {
    TempDir tmp;
    make_bundle(tmp.sub("bundle"), "1.2.0");
    std::string root = tmp.sub("root");
    REQUIRE(install_bundle(tmp.sub("bundle"), root).ok);
    write_text(join_path(root, "get-shit-done/INSTALLED_FILES.json"), "[{\"oops\"");

    auto report = check_root(root);
    CHECK(report.installed);
    CHECK_FALSE(report.passed);
    CHECK(report.manifest_status == ManifestLoadStatus::Corrupt);
    REQUIRE(report.files.checks.size() == 1);
    CHECK(report.files.checks[0].name == "manifest");
    CHECK(report.files.checks[0].status == CheckStatus::Fail);
    CHECK(report.missing().empty());
}

TEST_CASE("structure category") {
    TempDir tmp;
    make_bundle(tmp.sub("bundle"), "1.2.0");
    std::string root = tmp.sub("root");

    SUBCASE("old layout passes with a warning") {
        REQUIRE(install_bundle(tmp.sub("bundle"), root, "command").ok);
        auto report = check_root(root);
        CHECK(report.passed);
        REQUIRE(report.structure.checks.size() == 1);
        CHECK(report.structure.checks[0].status == CheckStatus::Warn);
    }

    SUBCASE("dual layout fails") {
        REQUIRE(install_bundle(tmp.sub("bundle"), root).ok);
        create_directories(join_path(root, "command/gsd"));
        auto report = check_root(root);
        CHECK_FALSE(report.passed);
        CHECK_FALSE(report.structure.passed);
        CHECK(report.files.passed);
    }
}

TEST_CASE("check never mutates the root") {
    TempDir tmp;
    make_bundle(tmp.sub("bundle"), "1.2.0");
    std::string root = tmp.sub("root");
    REQUIRE(install_bundle(tmp.sub("bundle"), root).ok);
    REQUIRE(remove_file(join_path(root, "agents/gsd-executor.md")));
    std::string manifest = read_text(join_path(root, "get-shit-done/INSTALLED_FILES.json"));

    check_root(root);
    CHECK_FALSE(path_exists(join_path(root, "agents/gsd-executor.md")));
    CHECK(read_text(join_path(root, "get-shit-done/INSTALLED_FILES.json")) == manifest);
    CHECK_FALSE(path_exists(join_path(root, ".backups")));
}
