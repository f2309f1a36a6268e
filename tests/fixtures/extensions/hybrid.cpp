// Exports both shapes; discovery must register the group
#include <clikit/command_unit.hpp>

#include <memory>

namespace {

class Echo : public clikit::Action {
public:
    explicit Echo(std::string text) : text_(std::move(text)) {}
    std::string summary() const override { return "Print " + text_; }
    void configure(CLI::App&) override {}
    int run(const clikit::ExecutionContext& ctx) override {
        ctx.out() << text_ << std::endl;
        return 0;
    }

private:
    std::string text_;
};

class HybridAction : public Echo {
public:
    HybridAction() : Echo("from-action") {}
};

class HybridGroup : public clikit::CommandGroup {
public:
    HybridGroup() : clikit::CommandGroup("Hybrid group") {
        add_action("which", std::make_unique<Echo>("from-group"));
    }
};

} // namespace

CLIKIT_COMMAND_GROUP(HybridGroup)
CLIKIT_COMMAND_MAIN(HybridAction)
