#include "clikit/command_tree.hpp"
#include "clikit/discovery.hpp"
#include "clikit/global_flags.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>

namespace clikit {

namespace {

// Maps mounted CLI11 apps back to the units they were built from
struct MountState {
    std::unordered_map<const CLI::App*, Action*> actions;
    std::unordered_map<const CLI::App*, const CommandGroup*> groups;
};

void mount_group(CLI::App& parent, CommandGroup& group, MountState& state) {
    state.groups[&parent] = &group;
    for (auto& [token, node] : group.nodes()) {
        auto* sub = parent.add_subcommand(token, node.help);
        if (node.kind == UnitKind::ActionGroup) {
            if (Action* fallback = node.group->default_action()) {
                sub->require_subcommand(0, 1);
                fallback->configure(*sub);
                state.actions[sub] = fallback;
            } else {
                sub->require_subcommand(1);
            }
            mount_group(*sub, *node.group, state);
        } else if (node.kind == UnitKind::SingleAction) {
            node.action->configure(*sub);
            state.actions[sub] = node.action.get();
        }
    }
}

void build_app(CLI::App& app, CommandGroup& root, MountState& state) {
    app.require_subcommand(0, 1);
    app.failure_message(CLI::FailureMessage::help);

    // Global flags are consumed before dispatch; declared here for --help only
    static GlobalOptions help_only;
    add_global_flags(app, help_only);

    mount_group(app, root, state);
}

const CLI::App* deepest_selected(const CLI::App& app, std::string* path) {
    const CLI::App* current = &app;
    while (true) {
        auto subs = current->get_subcommands();
        if (subs.empty()) break;
        current = subs.front();
        if (path) {
            if (!path->empty()) *path += " ";
            *path += current->get_name();
        }
    }
    return current;
}

void print_suggestions(const CLI::App& app, const MountState& state, const ExecutionContext& ctx) {
    const CLI::App* deepest = deepest_selected(app, nullptr);
    auto group_it = state.groups.find(deepest);
    if (group_it == state.groups.end()) return;

    std::string unknown;
    for (const auto& arg : app.remaining(true)) {
        if (!arg.empty() && arg[0] != '-') {
            unknown = arg;
            break;
        }
    }
    if (unknown.empty()) return;

    auto similar = find_similar_commands(unknown, group_it->second->tokens());
    if (similar.empty()) return;

    ctx.err() << "\nDid you mean: ";
    for (size_t i = 0; i < similar.size(); ++i) {
        if (i > 0) ctx.err() << ", ";
        ctx.err() << similar[i];
    }
    ctx.err() << "?" << std::endl;
}

} // namespace

// ============================================================================
// CommandTree
// ============================================================================

CommandTree::CommandTree(std::string name, std::string description)
    : name_(std::move(name)),
      description_(std::move(description)),
      root_(std::make_unique<CommandGroup>()) {}

CommandTree::~CommandTree() {
    // Units first, then the modules whose code they live in
    root_.reset();
    modules_.clear();
}

void CommandTree::register_action(const std::string& token, std::unique_ptr<Action> action) {
    if (root_->contains(token)) {
        spdlog::debug("command '{}' registered twice; keeping the later unit", token);
    }
    root_->add_action(token, std::move(action));
}

void CommandTree::register_group(const std::string& token, std::unique_ptr<CommandGroup> group,
                                 const std::string& help_text) {
    if (root_->contains(token)) {
        spdlog::debug("command '{}' registered twice; keeping the later unit", token);
    }
    root_->add_group(token, std::move(group), help_text);
}

void CommandTree::adopt_module(std::shared_ptr<ModuleHandle> module) {
    if (module) {
        modules_.push_back(std::move(module));
    }
}

bool CommandTree::phase_complete(RegistrationPhase phase) const {
    return phase == RegistrationPhase::Builtins ? builtins_done_ : discovered_done_;
}

void CommandTree::complete_phase(RegistrationPhase phase) {
    if (phase == RegistrationPhase::Builtins) {
        builtins_done_ = true;
    } else {
        discovered_done_ = true;
    }
}

const CommandNode* CommandTree::find(const std::string& token) const {
    return static_cast<const CommandGroup&>(*root_).find(token);
}

std::vector<std::string> CommandTree::tokens() const {
    return root_->tokens();
}

std::string CommandTree::help_text() const {
    CLI::App app{description_, name_};
    MountState state;
    build_app(app, *root_, state);
    return app.help();
}

DispatchResult CommandTree::dispatch(const std::vector<std::string>& args,
                                     const ExecutionContext& ctx) const {
    DispatchResult result;

    CLI::App app{description_, name_};
    MountState state;
    build_app(app, *root_, state);

    // CLI11 consumes arguments from the back
    std::vector<std::string> reversed(args.rbegin(), args.rend());
    try {
        app.parse(reversed);
    } catch (const CLI::ParseError& e) {
        result.exit_code = app.exit(e, ctx.out(), ctx.err());
        // Unknown root tokens surface as extras; unknown group members as a
        // missing required sub-command
        if (e.get_name() == "ExtrasError" || e.get_name() == "RequiredError") {
            print_suggestions(app, state, ctx);
        }
        return result;
    }

    const CLI::App* selected = deepest_selected(app, &result.command_path);
    if (selected == &app) {
        ctx.out() << app.help();
        return result;
    }

    auto action_it = state.actions.find(selected);
    if (action_it == state.actions.end()) {
        // A group without a sub-command is rejected by CLI11; keep a fallback
        ctx.err() << selected->help();
        result.exit_code = 2;
        return result;
    }

    spdlog::debug("dispatching '{}'", result.command_path);
    result.executed = true;
    result.exit_code = action_it->second->run(ctx);
    return result;
}

// ============================================================================
// Suggestions
// ============================================================================

int levenshtein_distance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.size(), n = s2.size();
    if (m == 0) return static_cast<int>(n);
    if (n == 0) return static_cast<int>(m);

    std::vector<std::vector<int>> dp(m + 1, std::vector<int>(n + 1));
    for (size_t i = 0; i <= m; ++i) dp[i][0] = static_cast<int>(i);
    for (size_t j = 0; j <= n; ++j) dp[0][j] = static_cast<int>(j);

    for (size_t i = 1; i <= m; ++i) {
        for (size_t j = 1; j <= n; ++j) {
            int cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
            dp[i][j] = std::min({dp[i - 1][j] + 1, dp[i][j - 1] + 1, dp[i - 1][j - 1] + cost});
        }
    }
    return dp[m][n];
}

std::vector<std::string> find_similar_commands(const std::string& input,
                                               const std::vector<std::string>& valid_commands,
                                               int max_distance) {
    std::vector<std::pair<int, std::string>> candidates;
    for (const auto& cmd : valid_commands) {
        int dist = levenshtein_distance(input, cmd);
        if (dist <= max_distance) {
            candidates.push_back({dist, cmd});
        }
    }
    std::sort(candidates.begin(), candidates.end());

    std::vector<std::string> result;
    for (const auto& [dist, cmd] : candidates) {
        result.push_back(cmd);
        if (result.size() >= 3) break;
    }
    return result;
}

} // namespace clikit
