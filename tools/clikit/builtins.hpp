/**
 * clikit CLI - built-in command registration
 */

#pragma once

#include "common.hpp"

namespace clikit::cli {

/**
 * Register every built-in command unit. Runs once per tree; later calls
 * leave the tree untouched.
 */
void register_builtin_commands(CommandTree& tree, const CliEnvironment& env);

} // namespace clikit::cli
