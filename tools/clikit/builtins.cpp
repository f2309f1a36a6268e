/**
 * clikit CLI - built-in command registration
 */

#include "builtins.hpp"

#include <spdlog/spdlog.h>

// Forward declarations for commands
namespace clikit::cli::commands {
    void register_config_command(CommandTree& tree, const CliEnvironment& env);
    void register_doctor_command(CommandTree& tree, const CliEnvironment& env);
    void register_secrets_command(CommandTree& tree, const CliEnvironment& env);
    void register_telemetry_command(CommandTree& tree, const CliEnvironment& env);
    void register_update_command(CommandTree& tree, const CliEnvironment& env);
    void register_completions_command(CommandTree& tree, const CliEnvironment& env);
    void register_init_command(CommandTree& tree, const CliEnvironment& env);
    void register_onboard_command(CommandTree& tree, const CliEnvironment& env);
}

namespace clikit::cli {

void register_builtin_commands(CommandTree& tree, const CliEnvironment& env) {
    if (tree.phase_complete(RegistrationPhase::Builtins)) {
        return;
    }
    tree.complete_phase(RegistrationPhase::Builtins);

    commands::register_config_command(tree, env);
    commands::register_doctor_command(tree, env);
    commands::register_secrets_command(tree, env);
    commands::register_telemetry_command(tree, env);
    commands::register_update_command(tree, env);
    commands::register_completions_command(tree, env);
    commands::register_init_command(tree, env);
    commands::register_onboard_command(tree, env);

    spdlog::debug("registered {} built-in commands", tree.tokens().size());
}

} // namespace clikit::cli
