#include <doctest/doctest.h>
#include <gsd/structure.hpp>

#include "../test_helpers.hpp"

using namespace gsd;
using gsd::test::TempDir;

TEST_CASE("structure classification") {
    TempDir tmp;
    StructureDetector detector(tmp.path(), PackageLayout{});

    SUBCASE("none") {
        CHECK(detector.detect() == StructureState::None);
        CHECK(detector.command_dir_for_writes(StructureState::None) == "commands");
    }

    SUBCASE("old only") {
        create_directories(tmp.sub("command/gsd"));
        CHECK(detector.detect() == StructureState::Old);
        CHECK(detector.command_dir_for_writes(StructureState::Old) == "command");
        CHECK(StructureDetector::is_healthy(StructureState::Old));
    }

    SUBCASE("new only") {
        create_directories(tmp.sub("commands/gsd"));
        CHECK(detector.detect() == StructureState::New);
        CHECK(detector.command_dir_for_writes(StructureState::New) == "commands");
    }

    SUBCASE("dual") {
        create_directories(tmp.sub("command/gsd"));
        create_directories(tmp.sub("commands/gsd"));
        CHECK(detector.detect() == StructureState::Dual);
        CHECK(detector.command_dir_for_writes(StructureState::Dual) == "commands");
        CHECK_FALSE(StructureDetector::is_healthy(StructureState::Dual));
    }
}

TEST_CASE("command directories without the gsd namespace do not count") {
    TempDir tmp;
    create_directories(tmp.sub("command/other"));
    create_directories(tmp.sub("commands"));
    CHECK(StructureDetector(tmp.path(), PackageLayout{}).detect() == StructureState::None);
}

TEST_CASE("details report both probes and a recommendation") {
    TempDir tmp;
    create_directories(tmp.sub("command/gsd"));
    create_directories(tmp.sub("commands/gsd"));

    auto d = StructureDetector(tmp.path(), PackageLayout{}).details();
    CHECK(d.state == StructureState::Dual);
    CHECK(d.old_exists);
    CHECK(d.new_exists);
    CHECK(d.old_path == tmp.sub("command/gsd"));
    CHECK(d.new_path == tmp.sub("commands/gsd"));
    CHECK(d.recommended_action.find("--fix-structure") != std::string::npos);
}

TEST_CASE("detection is never cached") {
    TempDir tmp;
    StructureDetector detector(tmp.path(), PackageLayout{});
    CHECK(detector.detect() == StructureState::None);
    create_directories(tmp.sub("commands/gsd"));
    CHECK(detector.detect() == StructureState::New);
}
