#include <doctest/doctest.h>
#include <clikit/onboarding.hpp>
#include <clikit/platform.hpp>
#include <clikit/prompt.hpp>

#include "../test_helpers.hpp"

using namespace clikit;
using clikit_test::CapturedContext;
using clikit_test::TempDir;

// ============================================================================
// Prompts
// ============================================================================

TEST_CASE("Prompter::ask returns the answer or the default") {
    CapturedContext c(Verbosity::Normal, OutputFormat::Table, false, "acme\n\n");
    Prompter prompter(c.ctx);

    CHECK(prompter.ask("Name", "clikit") == std::optional<std::string>("acme"));
    CHECK(prompter.ask("Name", "clikit") == std::optional<std::string>("clikit"));
    CHECK_FALSE(prompter.ask("Name"));
    CHECK(c.err.str().find("Name [clikit]: ") != std::string::npos);
}

TEST_CASE("Prompter::choose re-asks until the answer is in range") {
    CapturedContext c(Verbosity::Normal, OutputFormat::Table, false, "9\nabc\n2\n");
    Prompter prompter(c.ctx);

    auto pick = prompter.choose("Pick", {"one", "two", "three"});
    REQUIRE(pick);
    CHECK(*pick == 1);
    CHECK(c.err.str().find("  2) two") != std::string::npos);
    CHECK(c.err.str().find("Please enter a number between 1 and 3.") != std::string::npos);
}

TEST_CASE("Prompter keeps every prompt off stdout") {
    CapturedContext c(Verbosity::Normal, OutputFormat::Table, false, "x\n1\ny\nkey\n");
    Prompter prompter(c.ctx);

    REQUIRE(prompter.ask("Name", "clikit"));
    REQUIRE(prompter.choose("Pick", {"a", "b"}));
    REQUIRE(prompter.confirm("Go?", false));
    REQUIRE(prompter.ask_secret("Token"));

    CHECK(c.out.str().empty());
    CHECK(c.err.str().find("Name [clikit]: ") != std::string::npos);
    CHECK(c.err.str().find("Choice [1]: ") != std::string::npos);
    CHECK(c.err.str().find("Go? [y/N]: ") != std::string::npos);
    CHECK(c.err.str().find("Token: ") != std::string::npos);
}

TEST_CASE("Prompter::choose empty answer picks the default") {
    CapturedContext c(Verbosity::Normal, OutputFormat::Table, false, "\n");
    CHECK(Prompter(c.ctx).choose("Pick", {"a", "b"}, 1) == std::optional<size_t>(1));
}

TEST_CASE("Prompter::confirm") {
    CapturedContext c(Verbosity::Normal, OutputFormat::Table, false, "y\nNO\n\nmaybe\nyes\n");
    Prompter prompter(c.ctx);

    CHECK(prompter.confirm("Go?", false) == std::optional<bool>(true));
    CHECK(prompter.confirm("Go?", true) == std::optional<bool>(false));
    CHECK(prompter.confirm("Go?", true) == std::optional<bool>(true));
    CHECK(prompter.confirm("Go?", false) == std::optional<bool>(true));
    CHECK_FALSE(prompter.confirm("Go?", false));
}

TEST_CASE("Prompter::ask_secret reads from a non-terminal stream") {
    CapturedContext c(Verbosity::Normal, OutputFormat::Table, false, "  s3cret  \n");
    CHECK(Prompter(c.ctx).ask_secret("Token") == std::optional<std::string>("s3cret"));
}

// ============================================================================
// Branding
// ============================================================================

TEST_CASE("branding presets") {
    CHECK(color_palettes().size() == 8);
    CHECK(color_palettes().front().name == "Ocean");
    CHECK(preset_emojis().size() == 16);
}

TEST_CASE("save_branding writes cli overrides") {
    TempDir dir;
    auto paths = default_config_paths(dir.path());

    REQUIRE(save_branding(paths, "*", "bright_green", "green", false).ok);

    auto loaded = load_config(paths);
    REQUIRE(loaded.ok);
    CHECK(config_string(loaded.config, "cli.emoji") == "*");
    CHECK(config_string(loaded.config, "cli.primary_color") == "bright_green");
    CHECK(config_string(loaded.config, "cli.secondary_color") == "green");
    CHECK(config_string(loaded.config, "cli.name") == "clikit");
}

TEST_CASE("save_branding dry run writes nothing") {
    TempDir dir;
    auto paths = default_config_paths(dir.path());
    CHECK(save_branding(paths, "", "cyan", "blue", true).ok);
    CHECK_FALSE(path_exists(paths.override_file));
}

// ============================================================================
// CLI Name
// ============================================================================

TEST_CASE("validate_cli_name") {
    CHECK(validate_cli_name("my-tool").empty());
    CHECK(validate_cli_name("tool2").empty());
    CHECK(validate_cli_name("a-b-3").empty());

    CHECK(validate_cli_name("") == "CLI name cannot be empty.");
    for (const char* bad : {"My-tool", "my_tool", "my tool", "2tool", "-tool", "tool-", "my--tool"}) {
        CAPTURE(bad);
        CHECK(validate_cli_name(bad).find("Must be lowercase") == 0);
    }
}

TEST_CASE("save_cli_name writes the cli.name override") {
    TempDir dir;
    auto paths = default_config_paths(dir.path());

    REQUIRE(save_cli_name(paths, "acme", true).ok);
    CHECK_FALSE(path_exists(paths.override_file));

    REQUIRE(save_cli_name(paths, "acme", false).ok);
    auto loaded = load_config(paths);
    REQUIRE(loaded.ok);
    CHECK(config_string(loaded.config, "cli.name") == "acme");
}

// ============================================================================
// Environment File
// ============================================================================

TEST_CASE("render_env_file follows the example's key order") {
    std::vector<DotenvEntry> example = {{"A", "a-..."}, {"B", ""}, {"C", "c-default"}};
    std::map<std::string, std::string> existing = {{"B", "kept"}, {"EXTRA", "x y"}};
    std::map<std::string, std::string> values = {{"A", "new-a"}};

    CHECK(render_env_file(example, existing, values) ==
          "A=new-a\n"
          "B=kept\n"
          "C=c-default\n"
          "EXTRA=\"x y\"\n");
}

TEST_CASE("is_real_env_value") {
    CHECK(is_real_env_value("sk-real", "sk-..."));
    CHECK_FALSE(is_real_env_value("", "sk-..."));
    CHECK_FALSE(is_real_env_value("sk-...", "sk-..."));
}
