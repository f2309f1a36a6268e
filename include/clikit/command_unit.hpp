#pragma once

/**
 * @file command_unit.hpp
 * @brief The extension contract: single actions and action groups
 *
 * A command unit is either an Action (one runnable entry point) or a
 * CommandGroup (a nested sub-dispatcher holding further named units).
 * Built-in units are registered directly; extension modules expose one of
 * the two shapes through an exported factory symbol, which the discovery
 * engine looks up at load time.
 *
 * This header is self-contained so extension modules can be built against
 * it without linking the clikit library.
 *
 * @example
 * ```cpp
 * #include <clikit/command_unit.hpp>
 *
 * class Hello : public clikit::Action {
 * public:
 *     std::string summary() const override { return "Say hello"; }
 *     void configure(CLI::App& cmd) override {
 *         cmd.add_option("name", name_, "Who to greet")->required();
 *     }
 *     int run(const clikit::ExecutionContext& ctx) override {
 *         ctx.out() << "Hello, " << name_ << "!\n";
 *         return 0;
 *     }
 * private:
 *     std::string name_;
 * };
 *
 * CLIKIT_COMMAND_MAIN(Hello)
 * ```
 */

#include "clikit/execution_context.hpp"
#include "clikit/export.hpp"

#include <CLI/CLI.hpp>

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace clikit {

// ============================================================================
// Unit Kinds
// ============================================================================

enum class UnitKind {
    SingleAction,
    ActionGroup,
    Invalid
};

inline const char* unit_kind_to_string(UnitKind kind) {
    switch (kind) {
        case UnitKind::SingleAction: return "action";
        case UnitKind::ActionGroup: return "group";
        case UnitKind::Invalid: return "invalid";
    }
    return "invalid";
}

// ============================================================================
// Action
// ============================================================================

/**
 * @brief A single runnable command
 *
 * configure() is called once when the dispatcher mounts the action; the
 * options it declares bind to members of the action. run() is called at
 * most once per process, after parsing succeeded.
 */
class Action {
public:
    virtual ~Action() = default;

    /// One-line description shown in the parent's command list
    virtual std::string summary() const = 0;

    /// Declare positional arguments and options
    virtual void configure(CLI::App& cmd) = 0;

    /// Execute with the parsed arguments; returns the exit status
    virtual int run(const ExecutionContext& ctx) = 0;
};

class CommandGroup;

/**
 * @brief One entry of a command group: exactly one of action / group is set
 */
struct CommandNode {
    UnitKind kind = UnitKind::Invalid;
    std::unique_ptr<Action> action;
    std::unique_ptr<CommandGroup> group;
    std::string help;
};

// ============================================================================
// Command Group
// ============================================================================

/**
 * @brief A named collection of actions and nested groups
 *
 * Lookup is by exact token. Registering a token twice replaces the earlier
 * entry. Without a default action, invoking the group with no sub-command
 * is a usage error.
 */
class CommandGroup {
public:
    CommandGroup() = default;
    explicit CommandGroup(std::string help) : help_(std::move(help)) {}
    virtual ~CommandGroup() = default;

    CommandGroup(const CommandGroup&) = delete;
    CommandGroup& operator=(const CommandGroup&) = delete;

    void add_action(const std::string& token, std::unique_ptr<Action> action) {
        CommandNode node;
        node.kind = UnitKind::SingleAction;
        node.help = action->summary();
        node.action = std::move(action);
        nodes_[token] = std::move(node);
    }

    void add_group(const std::string& token, std::unique_ptr<CommandGroup> group,
                   std::string help = "") {
        CommandNode node;
        node.kind = UnitKind::ActionGroup;
        node.help = help.empty() ? group->help() : std::move(help);
        node.group = std::move(group);
        nodes_[token] = std::move(node);
    }

    const CommandNode* find(const std::string& token) const {
        auto it = nodes_.find(token);
        return it == nodes_.end() ? nullptr : &it->second;
    }

    CommandNode* find(const std::string& token) {
        auto it = nodes_.find(token);
        return it == nodes_.end() ? nullptr : &it->second;
    }

    bool contains(const std::string& token) const { return nodes_.count(token) > 0; }
    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

    std::vector<std::string> tokens() const {
        std::vector<std::string> result;
        result.reserve(nodes_.size());
        for (const auto& entry : nodes_) {
            result.push_back(entry.first);
        }
        return result;
    }

    const std::map<std::string, CommandNode>& nodes() const { return nodes_; }
    std::map<std::string, CommandNode>& nodes() { return nodes_; }

    const std::string& help() const { return help_; }
    void set_help(std::string help) { help_ = std::move(help); }

    /// Action run when the group is invoked without a sub-command
    void set_default_action(std::unique_ptr<Action> action) { default_action_ = std::move(action); }
    Action* default_action() const { return default_action_.get(); }

private:
    std::string help_;
    std::map<std::string, CommandNode> nodes_;
    std::unique_ptr<Action> default_action_;
};

// ============================================================================
// Extension Module Entry Points
// ============================================================================

// Exported symbol names looked up by the discovery engine
constexpr const char* kGroupSymbol = "clikit_command_app";
constexpr const char* kActionSymbol = "clikit_command_main";
constexpr const char* kDocSymbol = "clikit_command_doc";

// Factories return heap objects; ownership passes to the caller
using GroupFactoryFn = CommandGroup* (*)();
using ActionFactoryFn = Action* (*)();
using DocFn = const char* (*)();

} // namespace clikit

/// Export a CommandGroup subclass as the module's group shape
#define CLIKIT_COMMAND_GROUP(GroupType)                                      \
    extern "C" CLIKIT_PLUGIN_EXPORT clikit::CommandGroup* clikit_command_app() { \
        return new GroupType();                                               \
    }

/// Export an Action subclass as the module's single-action shape
#define CLIKIT_COMMAND_MAIN(ActionType)                                    \
    extern "C" CLIKIT_PLUGIN_EXPORT clikit::Action* clikit_command_main() { \
        return new ActionType();                                            \
    }

/// Export the module's descriptive text (used as group help)
#define CLIKIT_COMMAND_DOC(text)                                          \
    extern "C" CLIKIT_PLUGIN_EXPORT const char* clikit_command_doc() {     \
        return text;                                                      \
    }
