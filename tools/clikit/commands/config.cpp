/**
 * clikit CLI - config command
 *
 * Show, read and override project configuration.
 */

#include "../common.hpp"

#include <clikit/output.hpp>

#include <filesystem>

namespace clikit::cli::commands {

namespace {

class ConfigShow : public Action {
public:
    explicit ConfigShow(const CliEnvironment& env) : env_(env) {}

    std::string summary() const override { return "Show the full configuration"; }
    void configure(CLI::App&) override {}

    int run(const ExecutionContext& ctx) override {
        auto loaded = load_config(env_.config_paths);
        if (!loaded.ok) {
            print_error(ctx, loaded.error);
            return 1;
        }
        render(loaded.config, "Configuration", ctx);
        return 0;
    }

private:
    const CliEnvironment& env_;
};

class ConfigGet : public Action {
public:
    explicit ConfigGet(const CliEnvironment& env) : env_(env) {}

    std::string summary() const override { return "Get a value by dot-separated key"; }

    void configure(CLI::App& cmd) override {
        cmd.add_option("key", key_, "Dot-separated key, e.g. update.timeout_seconds")->required();
    }

    int run(const ExecutionContext& ctx) override {
        auto loaded = load_config(env_.config_paths);
        if (!loaded.ok) {
            print_error(ctx, loaded.error);
            return 1;
        }

        auto value = lookup_key(loaded.config, key_);
        if (!value) {
            ctx.err() << "Key not found: " << key_ << std::endl;
            return 1;
        }

        if (value->is_object()) {
            render(*value, key_, ctx);
        } else if (ctx.format() == OutputFormat::Json) {
            ctx.out() << value->dump() << std::endl;
        } else {
            ctx.out() << display_value(*value) << std::endl;
        }
        return 0;
    }

private:
    const CliEnvironment& env_;
    std::string key_;
};

class ConfigSet : public Action {
public:
    explicit ConfigSet(const CliEnvironment& env) : env_(env) {}

    std::string summary() const override {
        return "Set a configuration override (writes .global_config.json)";
    }

    void configure(CLI::App& cmd) override {
        cmd.add_option("key", key_, "Dot-separated key to set")->required();
        cmd.add_option("value", value_, "Value to set")->required();
    }

    int run(const ExecutionContext& ctx) override {
        auto written = set_override(env_.config_paths, key_, value_, ctx.dry_run());
        if (!written.ok) {
            print_error(ctx, written.error);
            return 1;
        }

        std::string file = std::filesystem::path(env_.config_paths.override_file).filename().string();
        if (ctx.dry_run()) {
            print_dry_run(ctx, "set " + key_ + " = " + written.value.dump() + " in " + file);
            return 0;
        }
        print_success(ctx, "Set " + key_ + " = " + written.value.dump() + " in " + file);
        return 0;
    }

private:
    const CliEnvironment& env_;
    std::string key_;
    std::string value_;
};

} // anonymous namespace

void register_config_command(CommandTree& tree, const CliEnvironment& env) {
    auto group = std::make_unique<CommandGroup>("Manage project configuration");
    group->add_action("show", std::make_unique<ConfigShow>(env));
    group->add_action("get", std::make_unique<ConfigGet>(env));
    group->add_action("set", std::make_unique<ConfigSet>(env));
    tree.register_group("config", std::move(group));
}

} // namespace clikit::cli::commands
