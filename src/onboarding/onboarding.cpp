#include "clikit/onboarding.hpp"

#include <set>

namespace clikit {

const std::vector<ColorPalette>& color_palettes() {
    static const std::vector<ColorPalette> palettes = {
        {"Ocean", "bright_cyan", "blue", "Cool blues and teals"},
        {"Forest", "bright_green", "green", "Natural greens"},
        {"Sunset", "yellow", "bright_red", "Warm and fiery"},
        {"Aurora", "bright_magenta", "bright_cyan", "Vibrant purples and teals"},
        {"Rose", "bright_red", "magenta", "Warm pinks and reds"},
        {"Gold", "bright_yellow", "yellow", "Rich golden tones"},
        {"Slate", "bright_white", "cyan", "Clean whites with cyan"},
        {"Midnight", "bright_blue", "blue", "Deep ocean blues"},
    };
    return palettes;
}

const std::vector<std::string>& preset_emojis() {
    static const std::vector<std::string> emojis = {
        "\U0001F680", "\u26A1", "\U0001F525", "\U0001F6E0", "\U0001F3AF", "\u2728",
        "\U0001F31F", "\U0001F48E", "\U0001F98A", "\U0001F409", "\U0001F30A", "\U0001F33F",
        "\U0001F52E", "\U0001F9EA", "\U0001F3A8", "\U0001F916",
    };
    return emojis;
}

ConfigWriteResult save_branding(const ConfigPaths& paths, const std::string& emoji,
                                const std::string& primary_color,
                                const std::string& secondary_color, bool dry_run) {
    const std::pair<const char*, const std::string*> fields[] = {
        {"cli.emoji", &emoji},
        {"cli.primary_color", &primary_color},
        {"cli.secondary_color", &secondary_color},
    };

    ConfigWriteResult last;
    for (const auto& [key, value] : fields) {
        last = set_override_value(paths, key, *value, dry_run);
        if (!last.ok) return last;
    }
    return last;
}

std::string validate_cli_name(const std::string& name) {
    if (name.empty()) return "CLI name cannot be empty.";

    const char* rule =
        "Must be lowercase with optional hyphens (e.g. my-tool). No spaces or underscores.";
    if (name.front() < 'a' || name.front() > 'z') return rule;

    char previous = '\0';
    for (char c : name) {
        bool word_char = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
        if (c == '-') {
            if (previous == '-') return rule;
        } else if (!word_char) {
            return rule;
        }
        previous = c;
    }
    if (previous == '-') return rule;
    return "";
}

ConfigWriteResult save_cli_name(const ConfigPaths& paths, const std::string& name, bool dry_run) {
    return set_override_value(paths, "cli.name", name, dry_run);
}

bool is_real_env_value(const std::string& value, const std::string& example_value) {
    return !value.empty() && value != example_value;
}

std::string render_env_file(const std::vector<DotenvEntry>& example,
                            const std::map<std::string, std::string>& existing,
                            const std::map<std::string, std::string>& values) {
    std::string out;
    std::set<std::string> written;

    for (const auto& entry : example) {
        if (!written.insert(entry.key).second) continue;

        std::string value = entry.value;
        if (auto it = values.find(entry.key); it != values.end()) {
            value = it->second;
        } else if (auto ex = existing.find(entry.key); ex != existing.end()) {
            value = ex->second;
        }
        out += format_dotenv_line(entry.key, value) + "\n";
    }

    for (const auto& [key, value] : existing) {
        if (written.count(key)) continue;
        out += format_dotenv_line(key, value) + "\n";
    }

    return out;
}

} // namespace clikit
