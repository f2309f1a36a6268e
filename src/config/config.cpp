#include "clikit/config.hpp"
#include "clikit/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <sstream>

namespace clikit {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> split_key(const std::string& dotted_key) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream ss(dotted_key);
    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }
    return parts;
}

// Objects merge key by key; any other value (null included) replaces
void merge_objects(nlohmann::json& target, const nlohmann::json& layer) {
    for (auto it = layer.begin(); it != layer.end(); ++it) {
        auto& slot = target[it.key()];
        if (it.value().is_object() && slot.is_object()) {
            merge_objects(slot, it.value());
        } else {
            slot = it.value();
        }
    }
}

// Parse one config layer; a missing file is not an error
bool merge_layer(const std::string& path, nlohmann::json& config,
                 std::vector<std::string>& sources, std::string& error) {
    auto content = read_file(path);
    if (!content) return true;

    try {
        auto layer = nlohmann::json::parse(*content);
        if (!layer.is_object()) {
            error = path + ": JSON must be an object";
            return false;
        }
        merge_objects(config, layer);
        sources.push_back(path);
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        error = path + ": " + e.what();
        return false;
    }
}

} // namespace

ConfigPaths default_config_paths(const std::string& project_root) {
    namespace fs = std::filesystem;
    ConfigPaths paths;
    paths.base_file = (fs::path(project_root) / "global_config.json").string();
    paths.override_file = (fs::path(project_root) / ".global_config.json").string();
    return paths;
}

nlohmann::json builtin_config_defaults() {
    return nlohmann::json{
        {"cli", {
            {"name", "clikit"},
            {"emoji", ""},
            {"primary_color", "cyan"},
            {"secondary_color", "blue"},
        }},
        {"commands", {
            {"path", ""},
            {"source_dir", "extensions"},
        }},
        {"update", {
            {"url", "https://api.github.com/repos/clikit/clikit/releases/latest"},
            {"command", ""},
            {"timeout_seconds", 5},
        }},
        {"secrets", {
            {"backend", "keyring"},
        }},
        {"doctor", {
            {"hook_markers", nlohmann::json::array({"pre-commit", "prek"})},
            {"hook_installer", "pre-commit install"},
        }},
    };
}

ConfigLoadResult load_config(const ConfigPaths& paths) {
    ConfigLoadResult result;
    result.config = builtin_config_defaults();

    if (!merge_layer(paths.base_file, result.config, result.sources, result.error)) {
        return result;
    }
    if (!merge_layer(paths.override_file, result.config, result.sources, result.error)) {
        return result;
    }

    result.ok = true;
    return result;
}

std::optional<nlohmann::json> lookup_key(const nlohmann::json& config, const std::string& dotted_key) {
    const nlohmann::json* current = &config;
    for (const auto& part : split_key(dotted_key)) {
        if (!current->is_object() || !current->contains(part)) {
            return std::nullopt;
        }
        current = &(*current)[part];
    }
    return *current;
}

std::string config_string(const nlohmann::json& config, const std::string& dotted_key,
                          const std::string& fallback) {
    auto value = lookup_key(config, dotted_key);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return fallback;
}

nlohmann::json coerce_value(const std::string& raw) {
    std::string lower = to_lower(raw);
    if (lower == "true" || lower == "yes") return true;
    if (lower == "false" || lower == "no") return false;
    if (lower == "null") return nullptr;

    if (!raw.empty()) {
        // Integer: the whole string must be consumed
        try {
            size_t consumed = 0;
            long long as_int = std::stoll(raw, &consumed);
            if (consumed == raw.size()) return as_int;
        } catch (const std::exception&) {
            // not an integer
        }
        try {
            size_t consumed = 0;
            double as_double = std::stod(raw, &consumed);
            if (consumed == raw.size() && std::isfinite(as_double)) return as_double;
        } catch (const std::exception&) {
            // not a float
        }
    }

    return raw;
}

ConfigWriteResult set_override(const ConfigPaths& paths, const std::string& dotted_key,
                               const std::string& raw_value, bool dry_run) {
    return set_override_value(paths, dotted_key, coerce_value(raw_value), dry_run);
}

ConfigWriteResult set_override_value(const ConfigPaths& paths, const std::string& dotted_key,
                                     const nlohmann::json& value, bool dry_run) {
    ConfigWriteResult result;
    result.value = value;

    auto parts = split_key(dotted_key);
    if (parts.empty() || std::any_of(parts.begin(), parts.end(),
                                     [](const std::string& p) { return p.empty(); })) {
        result.error = "invalid key: " + dotted_key;
        return result;
    }

    nlohmann::json existing = nlohmann::json::object();
    if (auto content = read_file(paths.override_file)) {
        try {
            existing = nlohmann::json::parse(*content);
        } catch (const nlohmann::json::parse_error& e) {
            result.error = paths.override_file + ": " + e.what();
            return result;
        }
        if (!existing.is_object()) {
            existing = nlohmann::json::object();
        }
    }

    nlohmann::json* current = &existing;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        auto& child = (*current)[parts[i]];
        if (!child.is_object()) {
            child = nlohmann::json::object();
        }
        current = &child;
    }
    (*current)[parts.back()] = value;

    if (dry_run) {
        result.ok = true;
        return result;
    }

    auto write = atomic_write_file(paths.override_file, existing.dump(2) + "\n");
    if (!write.ok) {
        result.error = write.error;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace clikit
