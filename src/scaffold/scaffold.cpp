#include "clikit/scaffold.hpp"
#include "clikit/discovery.hpp"
#include "clikit/platform.hpp"

#include <cctype>
#include <filesystem>
#include <map>

namespace clikit {

const std::string& command_template() {
    static const std::string tpl = R"TPL(#include <clikit/command_unit.hpp>

#include <string>

namespace {

class ${class_name} : public clikit::Action {
public:
    std::string summary() const override { return "${description}"; }

    void configure(CLI::App& cmd) override {
        cmd.add_option("name", name_, "Name to use")->default_val("World");
    }

    int run(const clikit::ExecutionContext& ctx) override {
        if (ctx.dry_run()) {
            ctx.out() << "[DRY RUN] Would run ${command_name} for " << name_ << "\n";
            return 0;
        }
        ctx.out() << "${command_name}: " << name_ << "\n";
        return 0;
    }

private:
    std::string name_;
};

} // namespace

CLIKIT_COMMAND_MAIN(${class_name})
)TPL";
    return tpl;
}

namespace {

std::string class_name_for(const std::string& identifier) {
    std::string name;
    bool upper = true;
    for (char c : identifier) {
        if (c == '_') {
            upper = true;
            continue;
        }
        name += upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
        upper = false;
    }
    return name + "Command";
}

// C++ string literal contents
std::string escape_literal(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (c == '"' || c == '\\') out += '\\';
        if (c == '\n') {
            out += "\\n";
            continue;
        }
        out += c;
    }
    return out;
}

std::string substitute(const std::string& text, const std::map<std::string, std::string>& values) {
    std::string out;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = text.find("${", pos);
        if (start == std::string::npos) {
            out += text.substr(pos);
            break;
        }
        size_t end = text.find('}', start);
        if (end == std::string::npos) {
            out += text.substr(pos);
            break;
        }
        out += text.substr(pos, start - pos);
        std::string name = text.substr(start + 2, end - start - 2);
        auto it = values.find(name);
        out += (it != values.end()) ? it->second : text.substr(start, end - start + 1);
        pos = end + 1;
    }
    return out;
}

} // namespace

std::string render_command_template(const std::string& identifier, const std::string& description) {
    return substitute(command_template(), {
        {"description", escape_literal(description)},
        {"command_name", derive_command_token(identifier)},
        {"identifier", identifier},
        {"class_name", class_name_for(identifier)},
    });
}

ScaffoldResult scaffold_command(const std::string& source_dir, const std::string& identifier,
                                const std::string& description, bool dry_run) {
    ScaffoldResult result;

    if (!is_valid_identifier(identifier)) {
        result.error = "Invalid name: '" + identifier + "'. Use snake_case (e.g. my_command).";
        return result;
    }

    result.path = (std::filesystem::path(source_dir) / (identifier + ".cpp")).string();
    result.command_token = derive_command_token(identifier);

    if (path_exists(result.path)) {
        result.error = "File already exists: " + result.path;
        return result;
    }

    if (dry_run) {
        result.ok = true;
        return result;
    }

    auto write = atomic_write_file(result.path, render_command_template(identifier, description));
    if (!write.ok) {
        result.error = write.error;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace clikit
