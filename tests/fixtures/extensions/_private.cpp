// Private helper module: never enumerated even though it exports an action
#include <clikit/command_unit.hpp>

namespace {

class Hidden : public clikit::Action {
public:
    std::string summary() const override { return "Must never be registered"; }
    void configure(CLI::App&) override {}
    int run(const clikit::ExecutionContext& ctx) override {
        ctx.out() << "hidden" << std::endl;
        return 0;
    }
};

} // namespace

CLIKIT_COMMAND_MAIN(Hidden)
