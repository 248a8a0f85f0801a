#include <doctest/doctest.h>
#include <gsd/platform.hpp>

#include <csignal>

#include "../test_helpers.hpp"

using namespace gsd;
using gsd::test::TempDir;
using gsd::test::write_text;

TEST_CASE("atomic_write_file writes content and leaves no temp files") {
    TempDir tmp;
    std::string path = tmp.sub("out.json");

    auto r = atomic_write_file(path, std::string("[]\n"));
    REQUIRE(r.ok);
    CHECK(read_file_text(path).value_or("") == "[]\n");

    auto r2 = atomic_write_file(path, std::string("[1]\n"));
    REQUIRE(r2.ok);
    CHECK(read_file_text(path).value_or("") == "[1]\n");

    auto entries = list_directory(tmp.path());
    REQUIRE(entries.size() == 1);
    CHECK(entries[0] == "out.json");
}

TEST_CASE("atomic_write_file fails when the directory does not exist") {
    TempDir tmp;
    auto r = atomic_write_file(tmp.sub("missing/out.txt"), std::string("x"));
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.error.empty());
}

TEST_CASE("remove_file treats an absent file as removed") {
    TempDir tmp;
    CHECK(remove_file(tmp.sub("never-existed")));

    write_text(tmp.sub("a.txt"), "a");
    CHECK(remove_file(tmp.sub("a.txt")));
    CHECK_FALSE(path_exists(tmp.sub("a.txt")));
}

TEST_CASE("remove_empty_directory keeps non-empty directories") {
    TempDir tmp;
    write_text(tmp.sub("d/file"), "x");
    CHECK_FALSE(remove_empty_directory(tmp.sub("d")));
    CHECK(is_directory(tmp.sub("d")));

    create_directories(tmp.sub("e"));
    CHECK(remove_empty_directory(tmp.sub("e")));
    CHECK_FALSE(path_exists(tmp.sub("e")));
}

TEST_CASE("prune_empty_parents stops at the root") {
    TempDir tmp;
    std::string file = tmp.sub("a/b/c.txt");
    write_text(file, "c");
    write_text(tmp.sub("keep.txt"), "k");
    REQUIRE(remove_file(file));

    auto removed = prune_empty_parents(tmp.path(), file);
    REQUIRE(removed.size() == 2);
    CHECK(removed[0] == tmp.sub("a/b"));
    CHECK(removed[1] == tmp.sub("a"));
    CHECK(is_directory(tmp.path()));
}

TEST_CASE("prune_empty_parents leaves directories holding other files") {
    TempDir tmp;
    write_text(tmp.sub("a/b/c.txt"), "c");
    write_text(tmp.sub("a/user.txt"), "u");
    REQUIRE(remove_file(tmp.sub("a/b/c.txt")));

    auto removed = prune_empty_parents(tmp.path(), tmp.sub("a/b/c.txt"));
    REQUIRE(removed.size() == 1);
    CHECK(is_directory(tmp.sub("a")));
}

TEST_CASE("list_directory returns sorted names") {
    TempDir tmp;
    write_text(tmp.sub("b"), "");
    write_text(tmp.sub("a"), "");
    write_text(tmp.sub("c/x"), "");

    auto entries = list_directory(tmp.path());
    REQUIRE(entries.size() == 3);
    CHECK(entries[0] == "a");
    CHECK(entries[1] == "b");
    CHECK(entries[2] == "c");
    CHECK(list_directory(tmp.sub("absent")).empty());
}

TEST_CASE("get_extension is lowercase") {
    CHECK(get_extension("agents/GSD.MD") == ".md");
    CHECK(get_extension("VERSION").empty());
}

TEST_CASE("generate_uuid has the canonical form") {
    auto a = generate_uuid();
    auto b = generate_uuid();
    CHECK(a.size() == 36);
    CHECK(a[14] == '4');
    CHECK(a != b);
}

TEST_CASE("interrupt flag is set by the signal handler") {
    install_interrupt_handlers();
    reset_interrupt_flag();
    CHECK_FALSE(interrupt_requested());
    std::raise(SIGINT);
    CHECK(interrupt_requested());
    reset_interrupt_flag();
    CHECK_FALSE(interrupt_requested());
}
