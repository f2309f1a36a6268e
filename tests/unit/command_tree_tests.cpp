#include <doctest/doctest.h>
#include <clikit/command_tree.hpp>

#include "../test_helpers.hpp"

using namespace clikit;
using clikit_test::CapturedContext;

namespace {

// Records how it was invoked
class Probe : public Action {
public:
    Probe(std::string summary, int* runs, int status = 0)
        : summary_(std::move(summary)), runs_(runs), status_(status) {}

    std::string summary() const override { return summary_; }

    void configure(CLI::App& cmd) override {
        cmd.add_option("value", value_, "Optional value");
    }

    int run(const ExecutionContext& ctx) override {
        ++*runs_;
        ctx.out() << summary_ << ":" << value_ << "\n";
        return status_;
    }

private:
    std::string summary_;
    int* runs_;
    int status_;
    std::string value_;
};

} // namespace

TEST_CASE("dispatch with no arguments prints root help and exits 0") {
    int runs = 0;
    CommandTree tree("clikit", "Test CLI");
    tree.register_action("alpha", std::make_unique<Probe>("alpha", &runs));

    CapturedContext c;
    auto result = tree.dispatch({}, c.ctx);

    CHECK(result.exit_code == 0);
    CHECK_FALSE(result.executed);
    CHECK(result.command_path.empty());
    CHECK(c.out.str().find("Test CLI") != std::string::npos);
    CHECK(c.out.str().find("alpha") != std::string::npos);
    CHECK(runs == 0);
}

TEST_CASE("dispatch runs the matching action with its arguments") {
    int runs = 0;
    CommandTree tree("clikit", "Test CLI");
    tree.register_action("alpha", std::make_unique<Probe>("alpha", &runs, 3));

    CapturedContext c;
    auto result = tree.dispatch({"alpha", "42"}, c.ctx);

    CHECK(result.executed);
    CHECK(result.exit_code == 3);
    CHECK(result.command_path == "alpha");
    CHECK(c.out.str() == "alpha:42\n");
    CHECK(runs == 1);
}

TEST_CASE("dispatch of an unknown token fails without running anything") {
    int runs = 0;
    CommandTree tree("clikit", "Test CLI");
    tree.register_action("status", std::make_unique<Probe>("status", &runs));
    tree.register_action("start", std::make_unique<Probe>("start", &runs));

    CapturedContext c;
    auto result = tree.dispatch({"statsu"}, c.ctx);

    CHECK(result.exit_code != 0);
    CHECK_FALSE(result.executed);
    CHECK(runs == 0);
    CHECK(c.err.str().find("statsu") != std::string::npos);
    CHECK(c.err.str().find("Did you mean: status") != std::string::npos);
}

TEST_CASE("dispatch of a far-off token gives no suggestions") {
    int runs = 0;
    CommandTree tree("clikit", "Test CLI");
    tree.register_action("status", std::make_unique<Probe>("status", &runs));

    CapturedContext c;
    auto result = tree.dispatch({"completely-different"}, c.ctx);

    CHECK(result.exit_code != 0);
    CHECK(c.err.str().find("Did you mean") == std::string::npos);
}

TEST_CASE("dispatch into groups") {
    int runs = 0;
    CommandTree tree("clikit", "Test CLI");

    auto group = std::make_unique<CommandGroup>("Admin helpers");
    group->add_action("status", std::make_unique<Probe>("status", &runs));
    auto nested = std::make_unique<CommandGroup>("Deeper");
    nested->add_action("leaf", std::make_unique<Probe>("leaf", &runs));
    group->add_group("inner", std::move(nested));
    tree.register_group("admin-tools", std::move(group));

    SUBCASE("sub-action runs") {
        CapturedContext c;
        auto result = tree.dispatch({"admin-tools", "status"}, c.ctx);
        CHECK(result.exit_code == 0);
        CHECK(result.command_path == "admin-tools status");
        CHECK(runs == 1);
    }

    SUBCASE("nested groups route to the deepest action") {
        CapturedContext c;
        auto result = tree.dispatch({"admin-tools", "inner", "leaf", "x"}, c.ctx);
        CHECK(result.exit_code == 0);
        CHECK(result.command_path == "admin-tools inner leaf");
        CHECK(c.out.str() == "leaf:x\n");
    }

    SUBCASE("group without a sub-command is a usage error") {
        CapturedContext c;
        auto result = tree.dispatch({"admin-tools"}, c.ctx);
        CHECK(result.exit_code != 0);
        CHECK_FALSE(result.executed);
        CHECK(runs == 0);
    }

    SUBCASE("unknown sub-command suggests siblings") {
        CapturedContext c;
        auto result = tree.dispatch({"admin-tools", "stat"}, c.ctx);
        CHECK(result.exit_code != 0);
        CHECK(runs == 0);
        CHECK(c.err.str().find("Did you mean: status") != std::string::npos);
    }

    SUBCASE("--help on a group prints its help and exits 0") {
        CapturedContext c;
        auto result = tree.dispatch({"admin-tools", "--help"}, c.ctx);
        CHECK(result.exit_code == 0);
        CHECK_FALSE(result.executed);
        CHECK(c.out.str().find("status") != std::string::npos);
        CHECK(c.out.str().find("inner") != std::string::npos);
    }
}

TEST_CASE("group default action runs on a bare group invocation") {
    int default_runs = 0;
    int step_runs = 0;
    CommandTree tree("clikit", "Test CLI");

    auto group = std::make_unique<CommandGroup>("Setup");
    group->add_action("step", std::make_unique<Probe>("step", &step_runs));
    group->set_default_action(std::make_unique<Probe>("all", &default_runs));
    tree.register_group("onboard", std::move(group));

    CapturedContext bare;
    auto result = tree.dispatch({"onboard"}, bare.ctx);
    CHECK(result.exit_code == 0);
    CHECK(result.command_path == "onboard");
    CHECK(default_runs == 1);
    CHECK(step_runs == 0);

    CapturedContext step;
    tree.dispatch({"onboard", "step"}, step.ctx);
    CHECK(step_runs == 1);
    CHECK(default_runs == 1);
}

TEST_CASE("registering a token twice keeps the later unit") {
    int first = 0;
    int second = 0;
    CommandTree tree("clikit", "Test CLI");
    tree.register_action("dup", std::make_unique<Probe>("first", &first));
    tree.register_action("dup", std::make_unique<Probe>("second", &second));

    CHECK(tree.tokens().size() == 1);
    CHECK(tree.find("dup")->help == "second");

    CapturedContext c;
    tree.dispatch({"dup"}, c.ctx);
    CHECK(first == 0);
    CHECK(second == 1);
}

TEST_CASE("registration phases are tracked on the tree") {
    CommandTree tree("clikit", "Test CLI");
    CHECK_FALSE(tree.phase_complete(RegistrationPhase::Builtins));
    CHECK_FALSE(tree.phase_complete(RegistrationPhase::Discovered));

    tree.complete_phase(RegistrationPhase::Builtins);
    CHECK(tree.phase_complete(RegistrationPhase::Builtins));
    CHECK_FALSE(tree.phase_complete(RegistrationPhase::Discovered));
}

TEST_CASE("help_text lists registered commands with their summaries") {
    int runs = 0;
    CommandTree tree("clikit", "Test CLI");
    tree.register_action("alpha", std::make_unique<Probe>("Alpha does things", &runs));

    auto help = tree.help_text();
    CHECK(help.find("alpha") != std::string::npos);
    CHECK(help.find("Alpha does things") != std::string::npos);
    CHECK(help.find("--dry-run") != std::string::npos);
}

// ============================================================================
// Suggestions
// ============================================================================

TEST_CASE("levenshtein_distance") {
    CHECK(levenshtein_distance("", "") == 0);
    CHECK(levenshtein_distance("abc", "") == 3);
    CHECK(levenshtein_distance("", "abc") == 3);
    CHECK(levenshtein_distance("status", "status") == 0);
    CHECK(levenshtein_distance("statsu", "status") == 2);
    CHECK(levenshtein_distance("kitten", "sitting") == 3);
}

TEST_CASE("find_similar_commands returns at most three, closest first") {
    std::vector<std::string> commands = {"config", "confirm", "conf", "configs", "doctor"};
    auto similar = find_similar_commands("confg", commands);

    REQUIRE(similar.size() == 3);
    CHECK(similar[0] == "config");
    for (const auto& s : similar) CHECK(s != "doctor");
}

TEST_CASE("find_similar_commands respects the distance limit") {
    CHECK(find_similar_commands("xyz", {"doctor", "update"}).empty());
    CHECK(find_similar_commands("updte", {"doctor", "update"}, 1) == std::vector<std::string>{"update"});
}
