/**
 * clikit CLI - completions command
 */

#include "../common.hpp"

#include <clikit/completions.hpp>

namespace clikit::cli::commands {

namespace {

const std::vector<std::string> kShells = {"bash", "zsh", "fish"};

class CompletionsShow : public Action {
public:
    explicit CompletionsShow(const CliEnvironment& env) : env_(env) {}

    std::string summary() const override { return "Print the completion script"; }

    void configure(CLI::App& cmd) override {
        cmd.add_option("shell", shell_, "Shell to show completions for")
            ->required()
            ->check(CLI::IsMember(kShells));
    }

    int run(const ExecutionContext& ctx) override {
        auto shell = parse_shell(shell_);
        if (!shell || !env_.tree) {
            print_error(ctx, "unsupported shell: " + shell_);
            return 1;
        }
        ctx.out() << completion_script(*shell, env_.tree->name(), env_.tree->root());
        return 0;
    }

private:
    const CliEnvironment& env_;
    std::string shell_;
};

class CompletionsInstall : public Action {
public:
    explicit CompletionsInstall(const CliEnvironment& env) : env_(env) {}

    std::string summary() const override { return "Install shell completions"; }

    void configure(CLI::App& cmd) override {
        cmd.add_option("shell", shell_, "Shell to install completions for")
            ->required()
            ->check(CLI::IsMember(kShells));
    }

    int run(const ExecutionContext& ctx) override {
        auto shell = parse_shell(shell_);
        if (!shell) {
            print_error(ctx, "unsupported shell: " + shell_);
            return 1;
        }

        std::string program = env_.tree ? env_.tree->name() : "clikit";
        auto result = install_completions(*shell, program, env_.home_dir, ctx.dry_run());
        if (!result.ok) {
            print_error(ctx, result.error);
            return 1;
        }

        if (result.already_installed) {
            print_warning(ctx, "Completions already installed in " + result.rc_file);
            return 0;
        }
        if (ctx.dry_run()) {
            print_dry_run(ctx, "append completions to " + result.rc_file);
            return 0;
        }

        print_success(ctx, "Completions installed! Restart your shell or run:\n  source " +
                               result.rc_file);
        return 0;
    }

private:
    const CliEnvironment& env_;
    std::string shell_;
};

} // anonymous namespace

void register_completions_command(CommandTree& tree, const CliEnvironment& env) {
    auto group = std::make_unique<CommandGroup>("Shell completion scripts");
    group->add_action("show", std::make_unique<CompletionsShow>(env));
    group->add_action("install", std::make_unique<CompletionsInstall>(env));
    tree.register_group("completions", std::move(group));
}

} // namespace clikit::cli::commands
