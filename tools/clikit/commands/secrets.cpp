/**
 * clikit CLI - secrets command
 *
 * Store, inspect and move secrets between .env files and the secret store.
 */

#include "../common.hpp"

#include <clikit/output.hpp>
#include <clikit/prompt.hpp>

namespace clikit::cli::commands {

namespace {

// Base for secrets actions: resolves the backend at run time
class SecretsAction : public Action {
public:
    explicit SecretsAction(const CliEnvironment& env) : env_(env) {}

protected:
    bool backend_ready(const ExecutionContext& ctx) const {
        if (!env_.secrets) {
            print_error(ctx, "no secret backend available");
            return false;
        }
        return true;
    }

    SecretStore store() const { return SecretStore(*env_.secrets); }

    const CliEnvironment& env_;
};

class SecretsSet : public SecretsAction {
public:
    using SecretsAction::SecretsAction;

    std::string summary() const override { return "Store a secret"; }

    void configure(CLI::App& cmd) override {
        cmd.add_option("key", key_, "Secret key name")->required();
        cmd.add_option("value", value_, "Secret value (prompts when omitted)");
    }

    int run(const ExecutionContext& ctx) override {
        if (!backend_ready(ctx)) return 1;

        std::string value = value_;
        if (value.empty()) {
            auto answer = Prompter(ctx).ask_secret("Enter value for " + key_);
            if (!answer) {
                print_error(ctx, "no value given for " + key_);
                return 1;
            }
            value = *answer;
        }

        if (ctx.dry_run()) {
            print_dry_run(ctx, "store " + key_);
            return 0;
        }

        auto stored = store().set(key_, value);
        if (!stored.ok) {
            print_error(ctx, stored.error);
            return 1;
        }
        print_success(ctx, "Stored " + key_);
        return 0;
    }

private:
    std::string key_;
    std::string value_;
};

class SecretsGet : public SecretsAction {
public:
    using SecretsAction::SecretsAction;

    std::string summary() const override { return "Retrieve a secret (masked unless --reveal)"; }

    void configure(CLI::App& cmd) override {
        cmd.add_option("key", key_, "Secret key name")->required();
        cmd.add_flag("-r,--reveal", reveal_, "Show the full secret value");
    }

    int run(const ExecutionContext& ctx) override {
        if (!backend_ready(ctx)) return 1;

        auto value = store().get(key_);
        if (!value) {
            ctx.err() << "Not found: " << key_ << std::endl;
            return 1;
        }
        ctx.out() << key_ << "=" << (reveal_ ? *value : mask_value(*value)) << std::endl;
        return 0;
    }

private:
    std::string key_;
    bool reveal_ = false;
};

class SecretsDelete : public SecretsAction {
public:
    using SecretsAction::SecretsAction;

    std::string summary() const override { return "Remove a secret"; }

    void configure(CLI::App& cmd) override {
        cmd.add_option("key", key_, "Secret key name to delete")->required();
    }

    int run(const ExecutionContext& ctx) override {
        if (!backend_ready(ctx)) return 1;

        if (ctx.dry_run()) {
            print_dry_run(ctx, "delete " + key_);
            return 0;
        }

        auto removed = store().remove(key_);
        if (!removed.ok) {
            ctx.err() << removed.error << std::endl;
            return 1;
        }
        print_success(ctx, "Deleted " + key_);
        return 0;
    }

private:
    std::string key_;
};

class SecretsList : public SecretsAction {
public:
    using SecretsAction::SecretsAction;

    std::string summary() const override { return "List stored secret names (never values)"; }
    void configure(CLI::App&) override {}

    int run(const ExecutionContext& ctx) override {
        if (!backend_ready(ctx)) return 1;

        auto secrets = store();
        auto keys = secrets.tracked_keys();
        if (keys.empty()) {
            if (!ctx.is_quiet()) ctx.out() << "No secrets stored." << std::endl;
            return 0;
        }

        nlohmann::json rows = nlohmann::json::array();
        for (const auto& key : keys) {
            auto value = secrets.get(key);
            nlohmann::json row;
            row["Key"] = key;
            row["Status"] = (value && !value->empty()) ? "set" : "empty";
            rows.push_back(row);
        }
        render(rows, "Secrets", ctx);
        return 0;
    }
};

class SecretsImport : public SecretsAction {
public:
    using SecretsAction::SecretsAction;

    std::string summary() const override { return "Import secrets from a .env file"; }

    void configure(CLI::App& cmd) override {
        cmd.add_option("-f,--file", file_, "Path to the .env file to import")->capture_default_str();
        cmd.add_flag("-i,--interactive", interactive_, "Confirm each key before importing");
    }

    int run(const ExecutionContext& ctx) override {
        if (!backend_ready(ctx)) return 1;

        auto content = read_file(file_);
        auto entries = content ? parse_dotenv(*content) : std::vector<DotenvEntry>{};
        if (entries.empty()) {
            print_warning(ctx, "No values found in " + file_);
            return 0;
        }

        auto secrets = store();
        Prompter prompter(ctx);
        int imported = 0;
        int skipped = 0;

        for (const auto& entry : entries) {
            if (is_placeholder_value(entry.value)) {
                ++skipped;
                continue;
            }

            if (interactive_) {
                auto confirm = prompter.confirm("Import " + entry.key + "?", false);
                if (!confirm || !*confirm) {
                    ++skipped;
                    continue;
                }
            }

            if (ctx.dry_run()) {
                print_dry_run(ctx, "import " + entry.key);
                ++imported;
                continue;
            }

            auto stored = secrets.set(entry.key, entry.value);
            if (!stored.ok) {
                print_error(ctx, entry.key + ": " + stored.error);
                return 1;
            }
            ++imported;
        }

        print_success(ctx, "Imported " + std::to_string(imported) + " secret(s), skipped " +
                               std::to_string(skipped));
        return 0;
    }

private:
    std::string file_ = ".env";
    bool interactive_ = false;
};

class SecretsExport : public SecretsAction {
public:
    using SecretsAction::SecretsAction;

    std::string summary() const override { return "Export secrets in .env format"; }

    void configure(CLI::App& cmd) override {
        cmd.add_flag("-r,--reveal", reveal_, "Show full secret values");
    }

    int run(const ExecutionContext& ctx) override {
        if (!backend_ready(ctx)) return 1;

        auto secrets = store();
        auto keys = secrets.tracked_keys();
        if (keys.empty()) {
            if (!ctx.is_quiet()) ctx.err() << "No secrets to export." << std::endl;
            return 0;
        }

        for (const auto& key : keys) {
            auto value = secrets.get(key);
            if (!value) continue;
            ctx.out() << format_dotenv_line(key, reveal_ ? *value : mask_value(*value)) << std::endl;
        }
        return 0;
    }

private:
    bool reveal_ = false;
};

} // anonymous namespace

void register_secrets_command(CommandTree& tree, const CliEnvironment& env) {
    auto group = std::make_unique<CommandGroup>("Manage secrets");
    group->add_action("set", std::make_unique<SecretsSet>(env));
    group->add_action("get", std::make_unique<SecretsGet>(env));
    group->add_action("delete", std::make_unique<SecretsDelete>(env));
    group->add_action("list", std::make_unique<SecretsList>(env));
    group->add_action("import", std::make_unique<SecretsImport>(env));
    group->add_action("export", std::make_unique<SecretsExport>(env));
    tree.register_group("secrets", std::move(group));
}

} // namespace clikit::cli::commands
