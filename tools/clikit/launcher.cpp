/**
 * clikit CLI - process entry flow
 */

#include "launcher.hpp"
#include "builtins.hpp"

#include <clikit/discovery.hpp>
#include <clikit/errors.hpp>
#include <clikit/global_flags.hpp>
#include <clikit/logging.hpp>
#include <clikit/telemetry.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>

namespace clikit::cli {

namespace {

CliEnvironment make_environment(const ExecutionContext& ctx) {
    CliEnvironment env;
    env.project_root = get_project_root();
    env.state_dir = get_state_dir();
    env.home_dir = get_home_dir();
    env.config_paths = default_config_paths(env.project_root);

    auto loaded = load_config(env.config_paths);
    if (loaded.ok) {
        env.config = std::move(loaded.config);
    } else {
        // `doctor` reports the parse error in detail
        if (!ctx.is_quiet()) {
            ctx.err() << "Warning: ignoring configuration: " << loaded.error << std::endl;
        }
        env.config = builtin_config_defaults();
    }

    std::filesystem::path commands_dir(resolve_commands_dir(env.config));
    if (commands_dir.is_relative()) {
        commands_dir = std::filesystem::path(env.project_root) / commands_dir;
    }
    env.commands_dir = commands_dir.string();
    return env;
}

void record_telemetry(const CliEnvironment& env, const DispatchResult& result, double seconds) {
    if (!result.executed) return;

    Telemetry telemetry(env.state_dir, env.version);
    auto recorded = telemetry.record({result.command_path, seconds, result.exit_code == 0});
    if (!recorded.ok) {
        spdlog::debug("telemetry not recorded: {}", recorded.error);
    }
}

} // namespace

int run_launcher(const std::vector<std::string>& args, LauncherIO io,
                 const LauncherOptions& options) {
    if (options.install_signal_handlers) {
        install_interrupt_handler();
    }

    auto flags = parse_global_flags(args);
    if (!flags.ok) {
        io.err << "Error: " << flags.error << std::endl;
        return 2;
    }

    ExecutionContext ctx = make_execution_context(flags.options);
    ctx.with_streams(io.out, io.err, io.in);
    if (&io.in != &std::cin) {
        ctx.with_interactive(false);
    }

    configure_logging(ctx.verbosity());

    CliEnvironment env = make_environment(ctx);

    if (flags.options.version) {
        io.out << display_name(env.config) << " " << env.version << std::endl;
        return 0;
    }

    std::unique_ptr<SecretBackend> default_secrets;
    if (options.secrets) {
        env.secrets = options.secrets;
    } else {
        std::string backend = config_string(env.config, "secrets.backend", kKeyringBackend);
        default_secrets = make_secret_backend(backend, env.state_dir);
        if (!default_secrets && !ctx.is_quiet()) {
            ctx.err() << "Warning: unknown secrets.backend '" << backend
                      << "' (use keyring or file)" << std::endl;
        }
        env.secrets = default_secrets.get();
    }

    // Outlives the handler below: exceptions thrown by extension code must be
    // reported while their module is still loaded
    CommandTree tree(config_string(env.config, "cli.name", "clikit"),
                     "A batteries-included C++ command-line scaffold");
    env.tree = &tree;

    try {
        register_builtin_commands(tree, env);
        discover_commands(tree, env.commands_dir);

        Telemetry telemetry(env.state_dir, env.version);
        if (!ctx.is_quiet() && telemetry.enabled()) {
            telemetry.show_first_run_notice(ctx.err(), tree.name());
        }

        auto start = std::chrono::steady_clock::now();
        auto result = tree.dispatch(flags.remaining, ctx);
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

        record_telemetry(env, result, elapsed.count());
        return result.exit_code;
    } catch (const std::exception& e) {
        return report_uncaught(e, ctx);
    }
}

} // namespace clikit::cli
