/**
 * clikit CLI - Common utilities and types
 */

#pragma once

#include <clikit/command_tree.hpp>
#include <clikit/config.hpp>
#include <clikit/execution_context.hpp>
#include <clikit/platform.hpp>
#include <clikit/secrets.hpp>

#include <nlohmann/json.hpp>

#include <string>

#ifndef CLIKIT_VERSION
#define CLIKIT_VERSION "0.0.0"
#endif

#ifndef CLIKIT_COMMANDS_DIR
#define CLIKIT_COMMANDS_DIR "commands"
#endif

namespace clikit::cli {

/**
 * Everything the built-in commands need besides the execution context.
 * Owned by the launcher; outlives the command tree.
 */
struct CliEnvironment {
    std::string project_root;
    std::string state_dir;
    std::string home_dir;
    std::string commands_dir;
    std::string version = CLIKIT_VERSION;
    ConfigPaths config_paths;
    nlohmann::json config;                  // merged at startup
    SecretBackend* secrets = nullptr;       // not owned
    const CommandTree* tree = nullptr;      // set once the tree exists
};

/**
 * Resolve the commands directory.
 * Priority: CLIKIT_COMMANDS_PATH env > commands.path config > compiled default
 */
inline std::string resolve_commands_dir(const nlohmann::json& config) {
    // 1. Environment variable
    if (auto env = get_env("CLIKIT_COMMANDS_PATH"); env && !env->empty()) {
        return *env;
    }

    // 2. Config key
    std::string configured = config_string(config, "commands.path");
    if (!configured.empty()) {
        return configured;
    }

    // 3. Compiled default
    return CLIKIT_COMMANDS_DIR;
}

/**
 * Name shown in banners and --version, prefixed by the configured emoji.
 */
inline std::string display_name(const nlohmann::json& config) {
    std::string name = config_string(config, "cli.name", "clikit");
    std::string emoji = config_string(config, "cli.emoji");
    return emoji.empty() ? name : emoji + " " + name;
}

/**
 * Output utilities.
 */
inline void print_error(const ExecutionContext& ctx, const std::string& msg) {
    if (ctx.format() == OutputFormat::Json) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        ctx.out() << j.dump(2) << std::endl;
    } else {
        ctx.err() << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const ExecutionContext& ctx, const std::string& msg) {
    if (!ctx.is_quiet()) {
        ctx.err() << "Warning: " << msg << std::endl;
    }
}

inline void print_success(const ExecutionContext& ctx, const std::string& msg) {
    if (!ctx.is_quiet() && ctx.format() != OutputFormat::Json) {
        ctx.out() << msg << std::endl;
    }
}

inline void print_dry_run(const ExecutionContext& ctx, const std::string& what) {
    ctx.out() << "[DRY RUN] Would " << what << std::endl;
}

} // namespace clikit::cli
