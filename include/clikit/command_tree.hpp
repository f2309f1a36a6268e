#pragma once

/**
 * @file command_tree.hpp
 * @brief Root command registry and dispatcher
 *
 * The CommandTree owns every registered unit (built-ins and discovered
 * extensions) and the module handles those units came from. It is built
 * once at startup and only read by dispatch().
 *
 * @example
 * ```cpp
 * clikit::CommandTree tree("clikit", "A batteries-included C++ CLI");
 * clikit::cli::register_builtin_commands(tree, env);
 * clikit::discover_commands(tree, commands_dir);
 *
 * int status = tree.dispatch({"greet", "Alice"}, ctx);
 * ```
 */

#include "clikit/command_unit.hpp"
#include "clikit/execution_context.hpp"

#include <memory>
#include <string>
#include <vector>

namespace clikit {

class ModuleHandle;

// ============================================================================
// Registration Phases
// ============================================================================

/// Built-ins are registered before discovered units; each phase runs once
enum class RegistrationPhase {
    Builtins,
    Discovered
};

// ============================================================================
// Dispatch Result
// ============================================================================

struct DispatchResult {
    int exit_code = 0;
    std::string command_path;   // e.g. "admin-tools status"; empty when nothing ran
    bool executed = false;      // true when a unit's run() was invoked
};

// ============================================================================
// Command Tree
// ============================================================================

class CommandTree {
public:
    CommandTree(std::string name, std::string description);
    ~CommandTree();

    CommandTree(const CommandTree&) = delete;
    CommandTree& operator=(const CommandTree&) = delete;

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }

    // Registration
    void register_action(const std::string& token, std::unique_ptr<Action> action);
    void register_group(const std::string& token, std::unique_ptr<CommandGroup> group,
                        const std::string& help_text = "");

    /// Keep a loaded module alive for as long as the tree exists
    void adopt_module(std::shared_ptr<ModuleHandle> module);

    bool phase_complete(RegistrationPhase phase) const;
    void complete_phase(RegistrationPhase phase);

    // Lookup
    const CommandNode* find(const std::string& token) const;
    std::vector<std::string> tokens() const;
    const CommandGroup& root() const { return *root_; }

    /**
     * @brief Route an argument list (without program name and global flags)
     *        to the matching unit and run it.
     * @return the unit's exit status, 0 after printing help, or a non-zero
     *         usage status when no unit matches
     */
    DispatchResult dispatch(const std::vector<std::string>& args,
                            const ExecutionContext& ctx) const;

    /// Root help text as shown by --help
    std::string help_text() const;

private:
    std::string name_;
    std::string description_;
    bool builtins_done_ = false;
    bool discovered_done_ = false;
    // Declared before root_ so units are destroyed before their modules unload
    std::vector<std::shared_ptr<ModuleHandle>> modules_;
    std::unique_ptr<CommandGroup> root_;
};

// ============================================================================
// Suggestions
// ============================================================================

/// Levenshtein edit distance between two tokens
int levenshtein_distance(const std::string& s1, const std::string& s2);

/// Up to three candidates within max_distance edits, closest first
std::vector<std::string> find_similar_commands(const std::string& input,
                                               const std::vector<std::string>& valid_commands,
                                               int max_distance = 3);

} // namespace clikit
