/**
 * greet - example single-action extension
 *
 * Built into the commands directory as greet.so and invoked as
 * `clikit greet [name]`.
 */

#include <clikit/command_unit.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace {

class Greet : public clikit::Action {
public:
    std::string summary() const override { return "Greet someone by name"; }

    void configure(CLI::App& cmd) override {
        cmd.add_option("name", name_, "Name to greet");
        cmd.add_flag("-s,--shout", shout_, "Shout the greeting");
        cmd.add_option("-t,--times", times_, "Number of times to greet")
            ->check(CLI::PositiveNumber);
    }

    int run(const clikit::ExecutionContext& ctx) override {
        if (name_.empty()) {
            if (!ctx.interactive()) {
                ctx.err() << "Error: a name is required (greet <name>)" << std::endl;
                return 2;
            }
            ctx.err() << "Who should I greet? " << std::flush;
            if (!std::getline(ctx.in(), name_) || name_.empty()) {
                ctx.err() << "Error: a name is required" << std::endl;
                return 2;
            }
        }

        if (ctx.dry_run()) {
            ctx.out() << "[DRY RUN] Would greet " << name_ << std::endl;
            return 0;
        }

        std::string message = "Hello, " + name_ + "!";
        if (shout_) {
            std::transform(message.begin(), message.end(), message.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        }

        if (ctx.is_verbose()) {
            ctx.out() << "Greeting Details" << std::endl;
            ctx.out() << "  name: " << name_ << std::endl;
            ctx.out() << "  times: " << times_ << std::endl;
            ctx.out() << "  shout: " << (shout_ ? "true" : "false") << std::endl;
        }

        for (int i = 0; i < times_; ++i) {
            ctx.out() << message << std::endl;
        }
        return 0;
    }

private:
    std::string name_;
    bool shout_ = false;
    int times_ = 1;
};

} // namespace

CLIKIT_COMMAND_MAIN(Greet)
