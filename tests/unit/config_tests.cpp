#include <doctest/doctest.h>
#include <clikit/config.hpp>
#include <clikit/platform.hpp>

#include "../test_helpers.hpp"

using namespace clikit;
using clikit_test::TempDir;

TEST_CASE("default_config_paths live in the project root") {
    auto paths = default_config_paths("/proj");
    CHECK(paths.base_file == "/proj/global_config.json");
    CHECK(paths.override_file == "/proj/.global_config.json");
}

TEST_CASE("load_config without files yields the built-in defaults") {
    TempDir dir;
    auto loaded = load_config(default_config_paths(dir.path()));
    REQUIRE(loaded.ok);
    CHECK(loaded.sources.empty());
    CHECK(loaded.config == builtin_config_defaults());
    CHECK(config_string(loaded.config, "cli.name") == "clikit");
    CHECK(config_string(loaded.config, "commands.source_dir") == "extensions");
}

TEST_CASE("load_config merges base then override over the defaults") {
    TempDir dir;
    dir.write("global_config.json", R"({"cli": {"name": "acme", "emoji": "*"}, "extra": {"x": 1}})");
    dir.write(".global_config.json", R"({"cli": {"name": "acme-local"}})");

    auto loaded = load_config(default_config_paths(dir.path()));
    REQUIRE(loaded.ok);
    CHECK(loaded.sources.size() == 2);
    CHECK(config_string(loaded.config, "cli.name") == "acme-local");
    CHECK(config_string(loaded.config, "cli.emoji") == "*");
    CHECK(config_string(loaded.config, "cli.primary_color") == "cyan");
    CHECK(lookup_key(loaded.config, "extra.x").value_or(nullptr) == 1);
}

TEST_CASE("an override set to null keeps the key with a null value") {
    TempDir dir;
    auto paths = default_config_paths(dir.path());

    auto written = set_override(paths, "cli.name", "null");
    REQUIRE(written.ok);
    CHECK(written.value.is_null());

    auto loaded = load_config(paths);
    REQUIRE(loaded.ok);
    auto value = lookup_key(loaded.config, "cli.name");
    REQUIRE(value);
    CHECK(value->is_null());
    CHECK(config_string(loaded.config, "cli.name", "fallback") == "fallback");
    CHECK(config_string(loaded.config, "cli.primary_color") == "cyan");
}

TEST_CASE("a scalar layer value replaces a default object") {
    TempDir dir;
    dir.write("global_config.json", R"({"update": 7})");

    auto loaded = load_config(default_config_paths(dir.path()));
    REQUIRE(loaded.ok);
    CHECK(lookup_key(loaded.config, "update").value_or(nullptr) == 7);
    CHECK_FALSE(lookup_key(loaded.config, "update.url"));
}

TEST_CASE("load_config reports the file that failed to parse") {
    TempDir dir;
    dir.write("global_config.json", "{ not json");

    auto loaded = load_config(default_config_paths(dir.path()));
    CHECK_FALSE(loaded.ok);
    CHECK(loaded.error.find("global_config.json") != std::string::npos);
}

TEST_CASE("load_config rejects a non-object layer") {
    TempDir dir;
    dir.write(".global_config.json", "[1, 2, 3]");

    auto loaded = load_config(default_config_paths(dir.path()));
    CHECK_FALSE(loaded.ok);
    CHECK(loaded.error.find("must be an object") != std::string::npos);
}

TEST_CASE("lookup_key resolves dotted paths") {
    nlohmann::json config = {{"a", {{"b", {{"c", 3}}}}}, {"s", "str"}};
    CHECK(lookup_key(config, "a.b.c").value_or(nullptr) == 3);
    CHECK(lookup_key(config, "a.b")->is_object());
    CHECK_FALSE(lookup_key(config, "a.x"));
    CHECK_FALSE(lookup_key(config, "s.deeper"));
    CHECK(config_string(config, "a.b.c", "fallback") == "fallback");
    CHECK(config_string(config, "s") == "str");
}

TEST_CASE("coerce_value") {
    CHECK(coerce_value("true") == nlohmann::json(true));
    CHECK(coerce_value("Yes") == nlohmann::json(true));
    CHECK(coerce_value("false") == nlohmann::json(false));
    CHECK(coerce_value("no") == nlohmann::json(false));
    CHECK(coerce_value("null").is_null());
    CHECK(coerce_value("42") == nlohmann::json(42));
    CHECK(coerce_value("-7") == nlohmann::json(-7));
    CHECK(coerce_value("2.5") == nlohmann::json(2.5));
    CHECK(coerce_value("12abc") == nlohmann::json("12abc"));
    CHECK(coerce_value("hello") == nlohmann::json("hello"));
    CHECK(coerce_value("") == nlohmann::json(""));
    CHECK(coerce_value("inf") == nlohmann::json("inf"));
}

TEST_CASE("set_override creates nested objects and keeps other keys") {
    TempDir dir;
    auto paths = default_config_paths(dir.path());
    dir.write(".global_config.json", R"({"keep": "me", "update": "scalar"})");

    auto written = set_override(paths, "update.timeout_seconds", "10");
    REQUIRE(written.ok);
    CHECK(written.value == nlohmann::json(10));

    auto stored = nlohmann::json::parse(*read_file(paths.override_file));
    CHECK(stored["keep"] == "me");
    CHECK(stored["update"]["timeout_seconds"] == 10);

    auto loaded = load_config(paths);
    REQUIRE(loaded.ok);
    CHECK(lookup_key(loaded.config, "update.timeout_seconds").value_or(nullptr) == 10);
}

TEST_CASE("set_override dry run leaves the file untouched") {
    TempDir dir;
    auto paths = default_config_paths(dir.path());

    auto written = set_override(paths, "cli.name", "preview", true);
    CHECK(written.ok);
    CHECK(written.value == nlohmann::json("preview"));
    CHECK_FALSE(path_exists(paths.override_file));
}

TEST_CASE("set_override rejects empty key segments") {
    TempDir dir;
    auto paths = default_config_paths(dir.path());
    CHECK_FALSE(set_override(paths, "cli..name", "x").ok);
    CHECK_FALSE(set_override(paths, "", "x").ok);
}
