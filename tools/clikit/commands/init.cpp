/**
 * clikit CLI - init command
 *
 * Scaffold a new extension command from the built-in template.
 */

#include "../common.hpp"

#include <clikit/discovery.hpp>
#include <clikit/scaffold.hpp>

#include <filesystem>

namespace clikit::cli::commands {

namespace {

class InitAction : public Action {
public:
    explicit InitAction(const CliEnvironment& env) : env_(env) {}

    std::string summary() const override { return "Scaffold a new command from the built-in template"; }

    void configure(CLI::App& cmd) override {
        cmd.add_option("name", name_, "snake_case name for the new command")->required();
        cmd.add_option("-d,--desc", desc_, "Short description of the command")->capture_default_str();
    }

    int run(const ExecutionContext& ctx) override {
        std::string source_dir = config_string(env_.config, "commands.source_dir", "extensions");
        std::filesystem::path dir(source_dir);
        if (dir.is_relative()) {
            dir = std::filesystem::path(env_.project_root) / dir;
        }

        auto result = scaffold_command(dir.string(), name_, desc_, ctx.dry_run());
        if (!result.ok) {
            print_error(ctx, result.error);
            return 1;
        }

        if (ctx.dry_run()) {
            print_dry_run(ctx, "create " + result.path);
            return 0;
        }

        std::string program = env_.tree ? env_.tree->name() : "clikit";
        if (ctx.format() == OutputFormat::Json) {
            nlohmann::json j;
            j["ok"] = true;
            j["path"] = result.path;
            j["command"] = result.command_token;
            ctx.out() << j.dump(2) << std::endl;
        } else {
            ctx.out() << "Created " << result.path << std::endl;
            ctx.out() << std::endl;
            ctx.out() << "Next steps:" << std::endl;
            ctx.out() << "  Rebuild to produce " << name_ << module_suffix() << std::endl;
            ctx.out() << "  Run it with: " << program << " " << result.command_token << std::endl;
        }
        return 0;
    }

private:
    const CliEnvironment& env_;
    std::string name_;
    std::string desc_ = "A new CLI command";
};

} // anonymous namespace

void register_init_command(CommandTree& tree, const CliEnvironment& env) {
    tree.register_action("init", std::make_unique<InitAction>(env));
}

} // namespace clikit::cli::commands
