/**
 * clikit CLI - onboard command
 *
 * Interactive project setup. `onboard` alone walks through every step;
 * `onboard <step>` runs a single one.
 */

#include "../common.hpp"

#include <clikit/doctor.hpp>
#include <clikit/onboarding.hpp>
#include <clikit/prompt.hpp>

#include <filesystem>
#include <map>

namespace clikit::cli::commands {

namespace {

namespace fs = std::filesystem;

constexpr const char* kCustomEmoji = "Enter custom emoji";
constexpr const char* kCustomColors = "Enter custom colours";

// Shared by the step actions and the orchestrator; returns the exit status
int run_branding(const CliEnvironment& env, const ExecutionContext& ctx) {
    Prompter prompter(ctx);

    auto emojis = preset_emojis();
    std::vector<std::string> emoji_choices = emojis;
    emoji_choices.push_back(kCustomEmoji);
    emoji_choices.push_back("None");

    auto emoji_pick = prompter.choose("Pick an emoji for your CLI:", emoji_choices);
    if (!emoji_pick) return 1;

    std::string emoji;
    if (*emoji_pick < emojis.size()) {
        emoji = emojis[*emoji_pick];
    } else if (emoji_choices[*emoji_pick] == kCustomEmoji) {
        auto custom = prompter.ask("Enter your emoji");
        if (!custom) return 1;
        emoji = *custom;
    }

    const auto& palettes = color_palettes();
    std::vector<std::string> palette_choices;
    for (const auto& p : palettes) {
        palette_choices.push_back(p.name + " - " + p.description);
    }
    palette_choices.push_back(kCustomColors);

    auto palette_pick = prompter.choose("Pick a colour scheme:", palette_choices);
    if (!palette_pick) return 1;

    std::string primary;
    std::string secondary;
    if (*palette_pick < palettes.size()) {
        primary = palettes[*palette_pick].primary;
        secondary = palettes[*palette_pick].secondary;
    } else {
        auto p = prompter.ask("Primary colour", "cyan");
        if (!p) return 1;
        auto s = prompter.ask("Secondary colour", "blue");
        if (!s) return 1;
        primary = *p;
        secondary = *s;
    }

    auto saved = save_branding(env.config_paths, emoji, primary, secondary, ctx.dry_run());
    if (!saved.ok) {
        print_error(ctx, saved.error);
        return 1;
    }

    if (ctx.dry_run()) {
        print_dry_run(ctx, "save branding (" + primary + "/" + secondary + ")");
    } else {
        print_success(ctx, "Branding saved: " + (emoji.empty() ? "" : emoji + " ") +
                               primary + " / " + secondary);
    }
    return 0;
}

int run_cli_name(const CliEnvironment& env, const ExecutionContext& ctx) {
    std::string current = config_string(env.config, "cli.name", kDefaultCliName);
    if (current != kDefaultCliName) {
        ctx.out() << "CLI already renamed to '" << current << "'. Skipping." << std::endl;
        return 0;
    }

    Prompter prompter(ctx);
    std::string name;
    while (true) {
        auto answer = prompter.ask("CLI command name (e.g. my-tool)", kDefaultCliName);
        if (!answer) return 1;

        auto problem = validate_cli_name(*answer);
        if (problem.empty()) {
            name = *answer;
            break;
        }
        print_warning(ctx, problem);
    }

    if (name == kDefaultCliName) {
        ctx.out() << "Keeping default name '" << kDefaultCliName << "'." << std::endl;
        return 0;
    }

    auto saved = save_cli_name(env.config_paths, name, ctx.dry_run());
    if (!saved.ok) {
        print_error(ctx, saved.error);
        return 1;
    }

    if (ctx.dry_run()) {
        print_dry_run(ctx, "rename CLI from " + current + " to " + name);
    } else {
        print_success(ctx, "Renamed CLI from " + current + " to " + name);
    }
    return 0;
}

int run_hooks(const CliEnvironment& env, const ExecutionContext& ctx) {
    std::string installer = config_string(env.config, "doctor.hook_installer", "");
    if (installer.empty()) {
        print_error(ctx, "No hook installer configured (doctor.hook_installer)");
        return 1;
    }

    auto activate = Prompter(ctx).confirm("Activate pre-commit hooks? (Recommended)", true);
    if (!activate) return 1;
    if (!*activate) {
        ctx.out() << "Skipped. You can activate later with: " << installer << std::endl;
        return 0;
    }

    if (ctx.dry_run()) {
        print_dry_run(ctx, "run: " + installer);
        return 0;
    }

    auto installed = install_git_hooks(env.project_root, installer);
    if (!installed.ok) {
        print_error(ctx, "Failed to activate hooks: " + installed.error);
        return 1;
    }

    print_success(ctx, "Pre-commit hooks activated.");
    return 0;
}

int run_env(const CliEnvironment& env, const ExecutionContext& ctx) {
    fs::path example_path = fs::path(env.project_root) / ".env.example";
    fs::path env_path = fs::path(env.project_root) / ".env";

    auto example_content = read_file(example_path.string());
    auto example = example_content ? parse_dotenv(*example_content) : std::vector<DotenvEntry>{};
    if (example.empty()) {
        print_error(ctx, "No .env.example found in " + env.project_root);
        return 1;
    }

    std::map<std::string, std::string> existing;
    if (auto content = read_file(env_path.string())) {
        for (auto& entry : parse_dotenv(*content)) {
            existing[entry.key] = entry.value;
        }
    }

    Prompter prompter(ctx);
    std::map<std::string, std::string> values;
    int kept = 0;

    for (const auto& entry : example) {
        auto current = existing.find(entry.key);
        bool has_real = current != existing.end() && is_real_env_value(current->second, entry.value);

        std::string question = entry.key;
        if (has_real) {
            question += " (currently " + mask_value(current->second) + ", Enter keeps it)";
        } else if (!entry.value.empty()) {
            question += " (example: " + entry.value + ")";
        }

        auto answer = prompter.ask_secret(question);
        if (!answer) return 1;

        if (answer->empty()) {
            ++kept;
            continue;
        }
        values[entry.key] = *answer;
    }

    if (ctx.dry_run()) {
        print_dry_run(ctx, "write " + std::to_string(values.size()) + " key(s) to " + env_path.string());
        return 0;
    }

    auto write = atomic_write_file(env_path.string(), render_env_file(example, existing, values), 0600);
    if (!write.ok) {
        print_error(ctx, write.error);
        return 1;
    }

    print_success(ctx, std::to_string(values.size()) + " key(s) configured, " +
                           std::to_string(kept) + " key(s) unchanged.");
    return 0;
}

using StepFn = int (*)(const CliEnvironment&, const ExecutionContext&);

struct Step {
    const char* label;
    const char* token;
    const char* help;
    StepFn fn;
};

const std::vector<Step>& steps() {
    static const std::vector<Step> all = {
        {"Branding", "branding", "Pick emoji and colour scheme for the CLI", run_branding},
        {"CLI Name", "cli-name", "Choose the command name of the CLI", run_cli_name},
        {"Environment Variables", "env", "Fill .env from .env.example", run_env},
        {"Pre-commit Hooks", "hooks", "Install the configured git hooks", run_hooks},
    };
    return all;
}

class StepAction : public Action {
public:
    StepAction(const CliEnvironment& env, const Step& step) : env_(env), step_(step) {}

    std::string summary() const override { return step_.help; }
    void configure(CLI::App&) override {}

    int run(const ExecutionContext& ctx) override { return step_.fn(env_, ctx); }

private:
    const CliEnvironment& env_;
    const Step& step_;
};

// Bare `onboard`: every step in sequence, each confirmed or skipped
class OnboardAll : public Action {
public:
    explicit OnboardAll(const CliEnvironment& env) : env_(env) {}

    std::string summary() const override { return "Run the full onboarding flow"; }
    void configure(CLI::App&) override {}

    int run(const ExecutionContext& ctx) override {
        Prompter prompter(ctx);
        const auto& all = steps();

        ctx.out() << "Welcome to " << display_name(env_.config) << " onboarding" << std::endl;
        ctx.out() << "This wizard will guide you through:" << std::endl;
        for (size_t i = 0; i < all.size(); ++i) {
            ctx.out() << "  " << (i + 1) << ". " << all[i].label << " - " << all[i].help << std::endl;
        }

        std::vector<std::string> completed;
        std::vector<std::string> skipped;

        for (size_t i = 0; i < all.size(); ++i) {
            const auto& step = all[i];
            ctx.out() << "\n--- Step " << (i + 1) << "/" << all.size() << ": " << step.label
                      << " ---" << std::endl;

            auto answer = prompter.choose("Run this step?", {"Yes", "Skip"});
            if (!answer) {
                ctx.err() << "Aborted." << std::endl;
                return 1;
            }
            if (*answer == 1) {
                skipped.push_back(step.label);
                ctx.out() << "- " << step.label << " skipped" << std::endl;
                continue;
            }

            if (step.fn(env_, ctx) == 0) {
                completed.push_back(step.label);
                continue;
            }

            ctx.err() << step.label << " failed." << std::endl;
            auto cont = prompter.confirm("Continue with remaining steps?", true);
            if (!cont || !*cont) {
                ctx.err() << "Aborted." << std::endl;
                return 1;
            }
            skipped.push_back(std::string(step.label) + " (failed)");
        }

        ctx.out() << "\nOnboarding Summary" << std::endl;
        for (const auto& name : completed) ctx.out() << "  [done] " << name << std::endl;
        for (const auto& name : skipped) ctx.out() << "  [skip] " << name << std::endl;
        ctx.out() << "\nSuggested next commands:" << std::endl;
        ctx.out() << "  " << config_string(env_.config, "cli.name", kDefaultCliName) << " doctor" << std::endl;
        return 0;
    }

private:
    const CliEnvironment& env_;
};

} // anonymous namespace

void register_onboard_command(CommandTree& tree, const CliEnvironment& env) {
    auto group = std::make_unique<CommandGroup>("Interactive project setup");
    for (const auto& step : steps()) {
        group->add_action(step.token, std::make_unique<StepAction>(env, step));
    }
    group->set_default_action(std::make_unique<OnboardAll>(env));
    tree.register_group("onboard", std::move(group));
}

} // namespace clikit::cli::commands
