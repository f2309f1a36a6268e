/**
 * clikit CLI - update command
 *
 * Check the release feed for a newer version and optionally upgrade.
 */

#include "../common.hpp"

#include <clikit/update.hpp>

namespace clikit::cli::commands {

namespace {

class UpdateAction : public Action {
public:
    explicit UpdateAction(const CliEnvironment& env) : env_(env) {}

    std::string summary() const override {
        return "Check for updates and upgrade if a newer version is available";
    }
    void configure(CLI::App&) override {}

    int run(const ExecutionContext& ctx) override {
        std::string url = config_string(env_.config, "update.url");
        std::string upgrade = config_string(env_.config, "update.command");
        long timeout = 5;
        if (auto t = lookup_key(env_.config, "update.timeout_seconds"); t && t->is_number_integer()) {
            timeout = t->get<long>();
        }

        if (!ctx.is_quiet()) {
            ctx.err() << "Current version: " << env_.version << std::endl;
        }

        if (url.empty()) {
            print_warning(ctx, "update.url is not configured; cannot check for updates.");
            return 0;
        }

        auto check = check_for_update(env_.version, url, timeout);
        switch (check.status) {
            case UpdateStatus::CheckFailed:
                print_warning(ctx, "Could not check for updates: " + check.error);
                return 0;
            case UpdateStatus::UpToDate:
                print_success(ctx, "Already up to date! (" + env_.version + ")");
                return 0;
            case UpdateStatus::Available:
                break;
        }

        ctx.out() << "New version available: " << check.latest << std::endl;

        if (upgrade.empty()) {
            ctx.out() << "Download it from: " << url << std::endl;
            return 0;
        }

        if (ctx.dry_run()) {
            print_dry_run(ctx, "run: " + upgrade);
            return 0;
        }

        auto ran = run_shell_command(upgrade);
        if (!ran.ok || ran.exit_code != 0) {
            print_error(ctx, "Update failed. Try manually: " + upgrade);
            return 1;
        }
        print_success(ctx, "Updated to " + check.latest + "!");
        return 0;
    }

private:
    const CliEnvironment& env_;
};

} // anonymous namespace

void register_update_command(CommandTree& tree, const CliEnvironment& env) {
    tree.register_action("update", std::make_unique<UpdateAction>(env));
}

} // namespace clikit::cli::commands
