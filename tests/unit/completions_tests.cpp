#include <doctest/doctest.h>
#include <clikit/completions.hpp>
#include <clikit/platform.hpp>

#include "../test_helpers.hpp"

using namespace clikit;
using clikit_test::TempDir;

namespace {

class Noop : public Action {
public:
    explicit Noop(std::string summary) : summary_(std::move(summary)) {}
    std::string summary() const override { return summary_; }
    void configure(CLI::App&) override {}
    int run(const ExecutionContext&) override { return 0; }

private:
    std::string summary_;
};

std::unique_ptr<CommandGroup> sample_root() {
    auto root = std::make_unique<CommandGroup>();
    root->add_action("doctor", std::make_unique<Noop>("Run checks"));
    auto config = std::make_unique<CommandGroup>("Manage config");
    config->add_action("get", std::make_unique<Noop>("Get a value"));
    config->add_action("set", std::make_unique<Noop>("Set a value"));
    root->add_group("config", std::move(config));
    return root;
}

} // namespace

TEST_CASE("parse_shell") {
    CHECK(parse_shell("bash") == Shell::Bash);
    CHECK(parse_shell("zsh") == Shell::Zsh);
    CHECK(parse_shell("fish") == Shell::Fish);
    CHECK_FALSE(parse_shell("powershell"));
}

TEST_CASE("bash script completes each level of the tree") {
    auto root = sample_root();
    auto script = completion_script(Shell::Bash, "acme", *root);

    CHECK(script.find("complete -F _acme_completions acme") != std::string::npos);
    CHECK(script.find("\"\") words=\"config doctor --verbose") != std::string::npos);
    CHECK(script.find("\"config\") words=\"get set\"") != std::string::npos);
}

TEST_CASE("zsh script registers a completion function") {
    auto root = sample_root();
    auto script = completion_script(Shell::Zsh, "acme", *root);

    CHECK(script.find("#compdef acme") == 0);
    CHECK(script.find("compdef _acme acme") != std::string::npos);
    CHECK(script.find("\"config\") candidates=(get set)") != std::string::npos);
}

TEST_CASE("fish script carries help text") {
    auto root = sample_root();
    auto script = completion_script(Shell::Fish, "acme", *root);

    CHECK(script.find("complete -c acme -n '__fish_use_subcommand' -a 'doctor' -d 'Run checks'") !=
          std::string::npos);
    CHECK(script.find("-n '__fish_seen_subcommand_from config' -a 'get'") != std::string::npos);
}

TEST_CASE("completion_snippet and rc files") {
    CHECK(completion_snippet(Shell::Bash, "acme") == "source <(acme completions show bash)");
    CHECK(completion_snippet(Shell::Fish, "acme") == "acme completions show fish | source");
    CHECK(completion_rc_file(Shell::Zsh, "/home/u") == "/home/u/.zshrc");
    CHECK(completion_rc_file(Shell::Fish, "/home/u") == "/home/u/.config/fish/config.fish");
}

TEST_CASE("install_completions appends once") {
    TempDir home;
    home.write(".bashrc", "export PATH=$PATH\n");

    auto first = install_completions(Shell::Bash, "acme", home.path(), false);
    REQUIRE(first.ok);
    CHECK_FALSE(first.already_installed);
    CHECK(*read_file(home.file(".bashrc")) ==
          "export PATH=$PATH\n\n# acme completions\nsource <(acme completions show bash)\n");

    auto second = install_completions(Shell::Bash, "acme", home.path(), false);
    CHECK(second.ok);
    CHECK(second.already_installed);
}

TEST_CASE("install_completions dry run and fish directories") {
    TempDir home;
    auto dry = install_completions(Shell::Fish, "acme", home.path(), true);
    CHECK(dry.ok);
    CHECK_FALSE(path_exists(dry.rc_file));

    auto real = install_completions(Shell::Fish, "acme", home.path(), false);
    REQUIRE(real.ok);
    CHECK(path_exists(home.file(".config/fish/config.fish")));
}

TEST_CASE("install_completions needs a home directory") {
    auto result = install_completions(Shell::Zsh, "acme", "", false);
    CHECK_FALSE(result.ok);
}
