/**
 * admin_tools - example group extension
 *
 * Built as admin_tools.so; its sub-commands are reached as
 * `clikit admin-tools <sub>`.
 */

#include <clikit/command_unit.hpp>

#include <memory>
#include <string>

namespace {

class Status : public clikit::Action {
public:
    std::string summary() const override { return "Show the current execution context"; }
    void configure(CLI::App&) override {}

    int run(const clikit::ExecutionContext& ctx) override {
        if (ctx.format() == clikit::OutputFormat::Json) {
            ctx.out() << "{\n"
                      << "  \"dry_run\": " << (ctx.dry_run() ? "true" : "false") << ",\n"
                      << "  \"format\": \"" << clikit::output_format_to_string(ctx.format()) << "\",\n"
                      << "  \"verbosity\": \"" << clikit::verbosity_to_string(ctx.verbosity()) << "\"\n"
                      << "}" << std::endl;
            return 0;
        }

        ctx.out() << "verbosity: " << clikit::verbosity_to_string(ctx.verbosity()) << std::endl;
        ctx.out() << "format: " << clikit::output_format_to_string(ctx.format()) << std::endl;
        ctx.out() << "dry_run: " << (ctx.dry_run() ? "true" : "false") << std::endl;
        return 0;
    }
};

class AdminTools : public clikit::CommandGroup {
public:
    AdminTools() : clikit::CommandGroup("Administrative helpers") {
        add_action("status", std::make_unique<Status>());
    }
};

} // namespace

CLIKIT_COMMAND_GROUP(AdminTools)
CLIKIT_COMMAND_DOC("Administrative tools for the current project")
