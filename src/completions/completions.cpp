#include "clikit/completions.hpp"
#include "clikit/platform.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace clikit {

namespace fs = std::filesystem;

std::optional<Shell> parse_shell(const std::string& name) {
    if (name == "bash") return Shell::Bash;
    if (name == "zsh") return Shell::Zsh;
    if (name == "fish") return Shell::Fish;
    return std::nullopt;
}

const char* shell_to_string(Shell shell) {
    switch (shell) {
        case Shell::Bash: return "bash";
        case Shell::Zsh: return "zsh";
        case Shell::Fish: return "fish";
    }
    return "bash";
}

namespace {

constexpr const char* kGlobalFlags =
    "--verbose -v --quiet -q --debug --format -f --dry-run --version -V --help -h";

struct CompletionLevel {
    std::string path;                                        // "" for the root, "config", "a b"
    std::string last_token;                                  // final token of path
    std::vector<std::pair<std::string, std::string>> entries;   // token, help
};

void collect_levels(const CommandGroup& group, const std::string& path,
                    const std::string& last_token, std::vector<CompletionLevel>& levels) {
    CompletionLevel level;
    level.path = path;
    level.last_token = last_token;
    for (const auto& [token, node] : group.nodes()) {
        level.entries.emplace_back(token, node.help);
    }
    levels.push_back(level);

    for (const auto& [token, node] : group.nodes()) {
        if (node.kind == UnitKind::ActionGroup && node.group) {
            collect_levels(*node.group, path.empty() ? token : path + " " + token, token, levels);
        }
    }
}

std::string word_list(const CompletionLevel& level) {
    std::string words;
    for (const auto& entry : level.entries) {
        if (!words.empty()) words += " ";
        words += entry.first;
    }
    if (level.path.empty()) {
        words += words.empty() ? kGlobalFlags : std::string(" ") + kGlobalFlags;
    }
    return words;
}

std::string function_name(const std::string& program) {
    std::string name = "_" + program;
    for (char& c : name) {
        if (c == '-' || c == '.') c = '_';
    }
    return name;
}

std::string fish_escape(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

std::string bash_script(const std::string& program, const std::vector<CompletionLevel>& levels) {
    std::string fn = function_name(program) + "_completions";
    std::ostringstream s;
    s << "# bash completion for " << program << "\n";
    s << fn << "() {\n";
    s << "    local cur=\"${COMP_WORDS[COMP_CWORD]}\"\n";
    s << "    local cmd=\"\"\n";
    s << "    local i\n";
    s << "    for ((i = 1; i < COMP_CWORD; i++)); do\n";
    s << "        case \"${COMP_WORDS[i]}\" in\n";
    s << "            -*) ;;\n";
    s << "            *) cmd=\"${cmd:+$cmd }${COMP_WORDS[i]}\" ;;\n";
    s << "        esac\n";
    s << "    done\n";
    s << "    local words=\"\"\n";
    s << "    case \"$cmd\" in\n";
    for (const auto& level : levels) {
        s << "        \"" << level.path << "\") words=\"" << word_list(level) << "\" ;;\n";
    }
    s << "    esac\n";
    s << "    COMPREPLY=($(compgen -W \"$words\" -- \"$cur\"))\n";
    s << "}\n";
    s << "complete -F " << fn << " " << program << "\n";
    return s.str();
}

std::string zsh_script(const std::string& program, const std::vector<CompletionLevel>& levels) {
    std::string fn = function_name(program);
    std::ostringstream s;
    s << "#compdef " << program << "\n";
    s << fn << "() {\n";
    s << "    local -a candidates\n";
    s << "    local cmd=\"${(j: :)${(@)words[2,CURRENT-1]:#-*}}\"\n";
    s << "    case \"$cmd\" in\n";
    for (const auto& level : levels) {
        s << "        \"" << level.path << "\") candidates=(" << word_list(level) << ") ;;\n";
    }
    s << "    esac\n";
    s << "    compadd -- $candidates\n";
    s << "}\n";
    s << "compdef " << fn << " " << program << "\n";
    return s.str();
}

std::string fish_script(const std::string& program, const std::vector<CompletionLevel>& levels) {
    std::ostringstream s;
    s << "# fish completion for " << program << "\n";
    s << "complete -c " << program << " -f\n";
    for (const char* flag : {"verbose", "quiet", "debug", "dry-run", "version"}) {
        s << "complete -c " << program << " -n '__fish_use_subcommand' -l " << flag << "\n";
    }
    s << "complete -c " << program << " -n '__fish_use_subcommand' -s f -l format -xa 'table json plain'\n";

    for (const auto& level : levels) {
        std::string condition = level.path.empty()
            ? "__fish_use_subcommand"
            : "__fish_seen_subcommand_from " + level.last_token;
        for (const auto& [token, help] : level.entries) {
            s << "complete -c " << program << " -n '" << condition << "' -a '" << token << "'";
            if (!help.empty()) s << " -d '" << fish_escape(help) << "'";
            s << "\n";
        }
    }
    return s.str();
}

} // namespace

std::string completion_script(Shell shell, const std::string& program, const CommandGroup& root) {
    std::vector<CompletionLevel> levels;
    collect_levels(root, "", "", levels);

    switch (shell) {
        case Shell::Bash: return bash_script(program, levels);
        case Shell::Zsh: return zsh_script(program, levels);
        case Shell::Fish: return fish_script(program, levels);
    }
    return "";
}

std::string completion_snippet(Shell shell, const std::string& program) {
    switch (shell) {
        case Shell::Bash:
        case Shell::Zsh:
            return "source <(" + program + " completions show " + shell_to_string(shell) + ")";
        case Shell::Fish:
            return program + " completions show fish | source";
    }
    return "";
}

std::string completion_rc_file(Shell shell, const std::string& home_dir) {
    fs::path home(home_dir);
    switch (shell) {
        case Shell::Bash: return (home / ".bashrc").string();
        case Shell::Zsh: return (home / ".zshrc").string();
        case Shell::Fish: return (home / ".config" / "fish" / "config.fish").string();
    }
    return "";
}

CompletionInstallResult install_completions(Shell shell, const std::string& program,
                                            const std::string& home_dir, bool dry_run) {
    CompletionInstallResult result;
    if (home_dir.empty()) {
        result.error = "cannot determine home directory";
        return result;
    }

    result.rc_file = completion_rc_file(shell, home_dir);
    std::string snippet = completion_snippet(shell, program);

    if (auto existing = read_file(result.rc_file)) {
        if (existing->find(snippet) != std::string::npos) {
            result.already_installed = true;
            result.ok = true;
            return result;
        }
    }

    if (dry_run) {
        result.ok = true;
        return result;
    }

    std::error_code ec;
    fs::create_directories(fs::path(result.rc_file).parent_path(), ec);

    std::ofstream rc(result.rc_file, std::ios::app);
    if (!rc) {
        result.error = "failed to open " + result.rc_file;
        return result;
    }
    rc << "\n# " << program << " completions\n" << snippet << "\n";
    if (!rc) {
        result.error = "failed to write " + result.rc_file;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace clikit
