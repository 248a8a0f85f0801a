#include <doctest/doctest.h>

#include "common.hpp"

#include <sstream>

using namespace gsd;
using namespace gsd::cli;

TEST_CASE("exit codes follow the error code") {
    CHECK(exit_code_for(Error(ErrorCode::PERMISSION_DENIED, "denied")) == 2);
    CHECK(exit_code_for(Error(ErrorCode::PATH_TRAVERSAL, "escape")) == 3);
    CHECK(exit_code_for(Error(ErrorCode::INTERRUPTED, "ctrl-c")) == 130);
    CHECK(exit_code_for(Error(ErrorCode::WRITE_FAILED, "disk full")) == kExitError);
    CHECK(exit_code_for(Error(ErrorCode::MANIFEST_CORRUPT, "bad json")) == kExitError);
}

TEST_CASE("confirm_typed accepts only the exact word") {
    std::ostringstream out;

    std::istringstream yes("yes\n");
    CHECK(confirm_typed("Remove?", "yes", yes, out));
    CHECK(out.str().find("Type 'yes'") != std::string::npos);

    std::istringstream y("y\n");
    CHECK_FALSE(confirm_typed("Remove?", "yes", y, out));

    std::istringstream closed("");
    CHECK_FALSE(confirm_typed("Remove?", "yes", closed, out));
}

TEST_CASE("warnings are collected in JSON mode") {
    init_warning_collector(true, false);
    print_warnings({"first", "second"});
    print_warning("third");

    auto& collector = get_warning_collector();
    CHECK(collector.warnings == std::vector<std::string>{"first", "second", "third"});
    CHECK(collector.to_json().size() == 3);

    init_warning_collector(false, false);
    CHECK(get_warning_collector().empty());
}
