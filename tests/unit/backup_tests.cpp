#include <doctest/doctest.h>
#include <gsd/backup.hpp>

#include "../test_helpers.hpp"

using namespace gsd;
using namespace gsd::test;

TEST_CASE("backup_timestamp is portable") {
    auto ts = backup_timestamp();
    CHECK(ts.size() == 19);
    CHECK(ts[10] == 'T');
    CHECK(ts.find(':') == std::string::npos);
}

TEST_CASE("backup_file preserves the relative tree") {
    TempDir tmp;
    write_text(tmp.sub("agents/gsd-a.md"), "agent");
    write_text(tmp.sub("commands/gsd/plan.md"), "plan");

    BackupManager backups(tmp.path(), PackageLayout{});
    CHECK(backups.session_dir().empty());

    auto a = backups.backup_file("agents/gsd-a.md");
    auto b = backups.backup_file("commands/gsd/plan.md");
    REQUIRE(a.isOk());
    REQUIRE(b.isOk());

    CHECK(backups.session_dir().rfind(tmp.sub(".backups/"), 0) == 0);
    CHECK(a.value() == join_path(backups.session_dir(), "agents/gsd-a.md"));
    CHECK(read_text(b.value()) == "plan");
    CHECK(backups.backed_up() == 2);

    // Originals are untouched
    CHECK(read_text(tmp.sub("agents/gsd-a.md")) == "agent");
}

TEST_CASE("backup of an absent file is a no-op") {
    TempDir tmp;
    BackupManager backups(tmp.path(), PackageLayout{});
    auto r = backups.backup_file("agents/gsd-missing.md");
    REQUIRE(r.isOk());
    CHECK(r.value().empty());
    CHECK(backups.session_dir().empty());
    CHECK_FALSE(path_exists(tmp.sub(".backups")));
}

TEST_CASE("backup rejects paths escaping the root") {
    TempDir tmp;
    BackupManager backups(tmp.sub("root"), PackageLayout{});
    auto r = backups.backup_file("../outside");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::PATH_TRAVERSAL);
}

TEST_CASE("sessions never share a directory") {
    TempDir tmp;
    write_text(tmp.sub("agents/gsd-a.md"), "agent");

    BackupManager first(tmp.path(), PackageLayout{});
    BackupManager second(tmp.path(), PackageLayout{});
    REQUIRE(first.backup_file("agents/gsd-a.md").isOk());
    REQUIRE(second.backup_file("agents/gsd-a.md").isOk());
    CHECK(first.session_dir() != second.session_dir());
}
