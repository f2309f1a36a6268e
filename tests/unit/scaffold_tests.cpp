#include <doctest/doctest.h>
#include <clikit/platform.hpp>
#include <clikit/scaffold.hpp>

#include "../test_helpers.hpp"

using namespace clikit;
using clikit_test::TempDir;

TEST_CASE("render_command_template substitutes every placeholder") {
    auto source = render_command_template("deploy_app", "Deploy the \"app\"");

    CHECK(source.find("${") == std::string::npos);
    CHECK(source.find("class DeployAppCommand : public clikit::Action") != std::string::npos);
    CHECK(source.find("return \"Deploy the \\\"app\\\"\";") != std::string::npos);
    CHECK(source.find("deploy-app: ") != std::string::npos);
    CHECK(source.find("CLIKIT_COMMAND_MAIN(DeployAppCommand)") != std::string::npos);
}

TEST_CASE("render_command_template handles digits in the identifier") {
    auto source = render_command_template("v2_sync", "Sync");
    CHECK(source.find("class V2SyncCommand") != std::string::npos);
}

TEST_CASE("scaffold_command writes the new extension source") {
    TempDir dir;
    auto result = scaffold_command(dir.file("extensions"), "my_command", "Does things", false);

    REQUIRE(result.ok);
    CHECK(result.command_token == "my-command");
    CHECK(result.path == dir.file("extensions/my_command.cpp"));

    auto content = read_file(result.path);
    REQUIRE(content);
    CHECK(*content == render_command_template("my_command", "Does things"));
}

TEST_CASE("scaffold_command refuses to overwrite") {
    TempDir dir;
    dir.write("extensions/taken.cpp", "// mine\n");

    auto result = scaffold_command(dir.file("extensions"), "taken", "x", false);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("File already exists:") == 0);
    CHECK(*read_file(dir.file("extensions/taken.cpp")) == "// mine\n");
}

TEST_CASE("scaffold_command validates the name") {
    TempDir dir;
    for (const char* bad : {"BadName", "my-command", "1st", "_hidden", ""}) {
        auto result = scaffold_command(dir.path(), bad, "x", false);
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("Invalid name") == 0);
    }
}

TEST_CASE("scaffold_command dry run writes nothing") {
    TempDir dir;
    auto result = scaffold_command(dir.path(), "preview", "x", true);
    CHECK(result.ok);
    CHECK_FALSE(path_exists(result.path));
}
