#include <doctest/doctest.h>
#include <clikit/output.hpp>

#include "../test_helpers.hpp"

using namespace clikit;
using clikit_test::CapturedContext;

TEST_CASE("display_value strips JSON quoting from scalars") {
    CHECK(display_value("abc") == "abc");
    CHECK(display_value(nullptr) == "");
    CHECK(display_value(42) == "42");
    CHECK(display_value(true) == "true");
    CHECK(display_value(nlohmann::json::array({1, 2})) == "[1,2]");
}

TEST_CASE("render json format pretty-prints") {
    CapturedContext c(Verbosity::Normal, OutputFormat::Json);
    render({{"name", "clikit"}}, "Title", c.ctx);
    CHECK(c.out.str() == "{\n  \"name\": \"clikit\"\n}\n");
}

TEST_CASE("render plain format prints title and key: value lines") {
    CapturedContext c(Verbosity::Normal, OutputFormat::Plain);
    render({{"a", 1}, {"b", "two"}}, "Title", c.ctx);
    CHECK(c.out.str() == "Title\na: 1\nb: two\n");
}

TEST_CASE("render plain separates array records") {
    CapturedContext c(Verbosity::Normal, OutputFormat::Plain);
    nlohmann::json rows = nlohmann::json::array();
    rows.push_back(nlohmann::json{{"k", "x"}});
    rows.push_back(nlohmann::json{{"k", "y"}});
    render(rows, "", c.ctx);
    CHECK(c.out.str() == "k: x\n---\nk: y\n---\n");
}

TEST_CASE("render table aligns a Key/Value table for objects") {
    CapturedContext c;
    render({{"a", 1}, {"long_key", "v"}}, "Config", c.ctx);
    CHECK(c.out.str() ==
          "Config\n"
          "Key       Value\n"
          "--------  -----\n"
          "a         1\n"
          "long_key  v\n");
}

TEST_CASE("render table uses one column per key for arrays of objects") {
    CapturedContext c;
    nlohmann::json rows = nlohmann::json::array();
    rows.push_back(nlohmann::json{{"Check", "Git repo"}, {"Status", "pass"}});
    rows.push_back(nlohmann::json{{"Check", "API keys"}, {"Status", "warn"}});
    render(rows, "", c.ctx);
    CHECK(c.out.str() ==
          "Check     Status\n"
          "--------  ------\n"
          "Git repo  pass\n"
          "API keys  warn\n");
}

TEST_CASE("render table falls back to plain for scalars") {
    CapturedContext c;
    render("just text", "", c.ctx);
    CHECK(c.out.str() == "just text\n");
}
