/**
 * clikit CLI - telemetry command
 */

#include "../common.hpp"

#include <clikit/telemetry.hpp>

namespace clikit::cli::commands {

namespace {

class TelemetryStatus : public Action {
public:
    explicit TelemetryStatus(const CliEnvironment& env) : env_(env) {}

    std::string summary() const override { return "Show telemetry status"; }
    void configure(CLI::App&) override {}

    int run(const ExecutionContext& ctx) override {
        Telemetry telemetry(env_.state_dir, env_.version);
        bool enabled = telemetry.enabled();
        size_t events = telemetry.event_count();

        if (ctx.format() == OutputFormat::Json) {
            nlohmann::json j;
            j["enabled"] = enabled;
            j["events"] = events;
            j["file"] = telemetry.events_file();
            ctx.out() << j.dump(2) << std::endl;
            return 0;
        }

        ctx.out() << "Telemetry is " << (enabled ? "enabled" : "disabled") << std::endl;
        if (events > 0) {
            ctx.out() << "Local events recorded: " << events << std::endl;
        }
        if (env_flag_enabled(kTelemetryDisabledEnv)) {
            ctx.out() << "(disabled by " << kTelemetryDisabledEnv << ")" << std::endl;
        }
        return 0;
    }

private:
    const CliEnvironment& env_;
};

class TelemetryToggle : public Action {
public:
    TelemetryToggle(const CliEnvironment& env, bool enable) : env_(env), enable_(enable) {}

    std::string summary() const override {
        return enable_ ? "Enable anonymous telemetry" : "Disable anonymous telemetry";
    }
    void configure(CLI::App&) override {}

    int run(const ExecutionContext& ctx) override {
        if (ctx.dry_run()) {
            print_dry_run(ctx, std::string(enable_ ? "enable" : "disable") + " telemetry");
            return 0;
        }

        Telemetry telemetry(env_.state_dir, env_.version);
        auto result = telemetry.set_enabled(enable_);
        if (!result.ok) {
            print_error(ctx, result.error);
            return 1;
        }
        print_success(ctx, enable_ ? "Telemetry enabled." : "Telemetry disabled.");
        return 0;
    }

private:
    const CliEnvironment& env_;
    bool enable_;
};

} // anonymous namespace

void register_telemetry_command(CommandTree& tree, const CliEnvironment& env) {
    auto group = std::make_unique<CommandGroup>("Manage anonymous usage telemetry");
    group->add_action("status", std::make_unique<TelemetryStatus>(env));
    group->add_action("enable", std::make_unique<TelemetryToggle>(env, true));
    group->add_action("disable", std::make_unique<TelemetryToggle>(env, false));
    tree.register_group("telemetry", std::move(group));
}

} // namespace clikit::cli::commands
