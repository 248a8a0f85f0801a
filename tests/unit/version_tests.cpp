#include <doctest/doctest.h>
#include <gsd/version.hpp>

using gsd::VersionChange;
using gsd::classify_change;
using gsd::parse_version;

TEST_CASE("parse_version accepts SemVer 2.0.0") {
    CHECK(parse_version("1.2.3").has_value());
    CHECK(parse_version("1.0.0-beta.2+build.5").has_value());
    CHECK(parse_version(" v1.2.3\n").has_value());
}

TEST_CASE("parse_version rejects malformed versions") {
    CHECK_FALSE(parse_version("").has_value());
    CHECK_FALSE(parse_version("latest").has_value());
    CHECK_FALSE(parse_version("1.2").has_value());
}

TEST_CASE("classify_change direction") {
    CHECK(classify_change("1.2.0", "1.2.0") == VersionChange::Same);
    CHECK(classify_change("1.2.0\n", "1.2.0") == VersionChange::Same);
    CHECK(classify_change("1.2.0", "1.3.0") == VersionChange::Upgrade);
    CHECK(classify_change("1.3.0", "1.2.9") == VersionChange::Downgrade);
    CHECK(classify_change("1.3.0-beta.1", "1.3.0") == VersionChange::Upgrade);
    CHECK(classify_change("", "1.3.0") == VersionChange::Unknown);
    CHECK(classify_change("dev", "1.3.0") == VersionChange::Unknown);
}

TEST_CASE("version_change_to_string") {
    CHECK(std::string(gsd::version_change_to_string(VersionChange::Upgrade)) == "upgrade");
    CHECK(std::string(gsd::version_change_to_string(VersionChange::Downgrade)) == "downgrade");
}
