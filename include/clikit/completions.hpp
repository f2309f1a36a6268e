#pragma once

/**
 * @file completions.hpp
 * @brief Shell completion scripts generated from the live command tree
 *
 * Scripts complete command tokens level by level (root commands, then the
 * members of the selected group) and the global flags at the root.
 */

#include "clikit/command_unit.hpp"

#include <optional>
#include <string>

namespace clikit {

enum class Shell {
    Bash,
    Zsh,
    Fish
};

std::optional<Shell> parse_shell(const std::string& name);
const char* shell_to_string(Shell shell);

/// Completion script for `program` covering every unit under `root`
std::string completion_script(Shell shell, const std::string& program, const CommandGroup& root);

/// Line appended to the rc file to load the script
std::string completion_snippet(Shell shell, const std::string& program);

/// ~/.bashrc, ~/.zshrc or ~/.config/fish/config.fish
std::string completion_rc_file(Shell shell, const std::string& home_dir);

struct CompletionInstallResult {
    bool ok = false;
    std::string error;
    bool already_installed = false;
    std::string rc_file;
};

/**
 * @brief Append the sourcing snippet to the shell's rc file.
 *
 * Nothing is written when the rc file already contains the snippet or when
 * dry_run is set.
 */
CompletionInstallResult install_completions(Shell shell, const std::string& program,
                                            const std::string& home_dir, bool dry_run);

} // namespace clikit
