#pragma once

#include <optional>
#include <string>
#include <vector>

namespace clikit {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

Platform get_current_platform();

const char* platform_to_string(Platform platform);

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// Parent directories are created. `mode` applies on POSIX only.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned mode = 0644);

// ============================================================================
// Files
// ============================================================================

// Read a whole file; nullopt when it cannot be opened
std::optional<std::string> read_file(const std::string& path);

bool path_exists(const std::string& path);

bool create_directories(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// True when the variable is set to 1, true or yes (case-insensitive)
bool env_flag_enabled(const std::string& name);

// User home directory, empty when unknown
std::string get_home_dir();

/**
 * Per-user state directory.
 * Priority: CLIKIT_STATE_DIR > $XDG_CONFIG_HOME/clikit > ~/.config/clikit
 */
std::string get_state_dir();

/**
 * Project root holding config files, .env and extension sources.
 * Priority: CLIKIT_PROJECT_ROOT > current directory
 */
std::string get_project_root();

// Locate an executable on PATH
std::optional<std::string> find_executable(const std::string& name);

// ============================================================================
// Processes
// ============================================================================

struct ShellResult {
    bool ok = false;        // the shell ran and the command terminated
    std::string error;
    int exit_code = -1;
};

// Run a command line through the system shell and wait for it
ShellResult run_shell_command(const std::string& command);

// Quote one word for a POSIX shell command line: 'it'\''s'
std::string shell_quote(const std::string& word);

// Host name of this machine, empty when unavailable
std::string get_hostname();

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

} // namespace clikit
