#include <doctest/doctest.h>
#include <clikit/semver.hpp>
#include <clikit/update.hpp>

using namespace clikit;

// ============================================================================
// Version Parsing
// ============================================================================

TEST_CASE("parse_version accepts MAJOR.MINOR.PATCH") {
    auto v = parse_version("1.2.3");
    REQUIRE(v);
    CHECK(v->major() == 1);
    CHECK(v->minor() == 2);
    CHECK(v->patch() == 3);
    CHECK_FALSE(v->is_prerelease());
}

TEST_CASE("parse_version strips whitespace and a leading v") {
    auto v = parse_version("  v2.0.1 ");
    REQUIRE(v);
    CHECK(v->major() == 2);
    CHECK(v->patch() == 1);
    CHECK(parse_version("V1.0.0"));
}

TEST_CASE("parse_version keeps pre-release and build metadata") {
    auto v = parse_version("1.0.0-beta.2+build.456");
    REQUIRE(v);
    CHECK(v->is_prerelease());
    CHECK(v->prerelease() == "beta.2");
    CHECK(v->build_meta() == "build.456");
}

TEST_CASE("parse_version rejects invalid versions") {
    CHECK_FALSE(parse_version(""));
    CHECK_FALSE(parse_version("v"));
    CHECK_FALSE(parse_version("1.2"));
    CHECK_FALSE(parse_version("not.a.version"));
}

TEST_CASE("versions order by SemVer precedence") {
    CHECK(*parse_version("1.10.0") > *parse_version("1.9.9"));
    CHECK(*parse_version("1.0.0") > *parse_version("1.0.0-rc.1"));
    CHECK(*parse_version("2.0.0") == *parse_version("v2.0.0"));
}

// ============================================================================
// Release Documents
// ============================================================================

TEST_CASE("extract_latest_version reads GitHub releases") {
    CHECK(extract_latest_version(R"({"tag_name": "v1.4.0", "name": "Release"})") ==
          std::optional<std::string>("1.4.0"));
    CHECK(extract_latest_version(R"({"tag_name": "2.0.0"})") == std::optional<std::string>("2.0.0"));
}

TEST_CASE("extract_latest_version reads package index documents") {
    CHECK(extract_latest_version(R"({"info": {"version": "0.9.1"}})") ==
          std::optional<std::string>("0.9.1"));
}

TEST_CASE("extract_latest_version without a version") {
    CHECK_FALSE(extract_latest_version("{}"));
    CHECK_FALSE(extract_latest_version("[]"));
    CHECK_FALSE(extract_latest_version("not json"));
    CHECK_FALSE(extract_latest_version(R"({"tag_name": ""})"));
}

TEST_CASE("evaluate_release compares with the running version") {
    auto newer = evaluate_release("1.0.0", R"({"tag_name": "v1.1.0"})");
    CHECK(newer.status == UpdateStatus::Available);
    CHECK(newer.latest == "1.1.0");
    CHECK(newer.current == "1.0.0");

    CHECK(evaluate_release("1.1.0", R"({"tag_name": "v1.1.0"})").status == UpdateStatus::UpToDate);
    CHECK(evaluate_release("2.0.0", R"({"tag_name": "v1.1.0"})").status == UpdateStatus::UpToDate);
}

TEST_CASE("evaluate_release failures") {
    auto no_version = evaluate_release("1.0.0", "{}");
    CHECK(no_version.status == UpdateStatus::CheckFailed);
    CHECK_FALSE(no_version.error.empty());

    auto bad_tag = evaluate_release("1.0.0", R"({"tag_name": "nightly"})");
    CHECK(bad_tag.status == UpdateStatus::CheckFailed);
    CHECK(bad_tag.error.find("nightly") != std::string::npos);

    auto bad_current = evaluate_release("dev", R"({"tag_name": "v1.0.0"})");
    CHECK(bad_current.status == UpdateStatus::CheckFailed);
}

TEST_CASE("check_for_update reports unreachable feeds as failed checks") {
    auto check = check_for_update("1.0.0", "http://127.0.0.1:9/release.json", 1);
    CHECK(check.status == UpdateStatus::CheckFailed);
    CHECK_FALSE(check.error.empty());
}
