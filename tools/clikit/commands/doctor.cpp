/**
 * clikit CLI - doctor command
 *
 * Run health checks on the project environment.
 */

#include "../common.hpp"

#include <clikit/doctor.hpp>
#include <clikit/output.hpp>

namespace clikit::cli::commands {

namespace {

class DoctorAction : public Action {
public:
    explicit DoctorAction(const CliEnvironment& env) : env_(env) {}

    std::string summary() const override { return "Run health checks on your project environment"; }

    void configure(CLI::App& cmd) override {
        cmd.add_flag("--fix", fix_, "Attempt to auto-fix fixable issues");
    }

    int run(const ExecutionContext& ctx) override {
        auto doctor_env = make_doctor_environment(env_.project_root, env_.commands_dir, env_.config);
        auto results = run_all_checks(doctor_env);

        if (fix_) {
            if (ctx.dry_run()) {
                for (const auto& r : results) {
                    if (r.status != CheckStatus::Pass && r.fixable && find_fixer(r.name)) {
                        print_dry_run(ctx, "fix: " + r.name);
                    }
                }
            } else {
                results = attempt_fixes(results, doctor_env, ctx.is_quiet() ? nullptr : &ctx.err());
            }
        }

        bool failed = has_failures(results);

        if (ctx.is_quiet()) {
            ctx.out() << "doctor: " << (failed ? "FAIL" : "OK") << std::endl;
            for (const auto& r : results) {
                if (r.status == CheckStatus::Fail) {
                    ctx.out() << "  " << r.name << ": " << r.message << std::endl;
                }
            }
        } else {
            render(results_to_rows(results, ctx.is_verbose()), "Doctor", ctx);
        }

        return failed ? 1 : 0;
    }

private:
    const CliEnvironment& env_;
    bool fix_ = false;
};

} // anonymous namespace

void register_doctor_command(CommandTree& tree, const CliEnvironment& env) {
    tree.register_action("doctor", std::make_unique<DoctorAction>(env));
}

} // namespace clikit::cli::commands
