#pragma once

/**
 * @file config.hpp
 * @brief Layered project configuration
 *
 * Layers, later ones winning. Objects merge key by key; any other value,
 * null included, replaces what the earlier layers set:
 *   1. built-in defaults
 *   2. <project>/global_config.json
 *   3. <project>/.global_config.json   (local overrides, written by `config set`)
 */

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace clikit {

struct ConfigPaths {
    std::string base_file;
    std::string override_file;
};

ConfigPaths default_config_paths(const std::string& project_root);

/// Defaults every layer is merged onto
nlohmann::json builtin_config_defaults();

struct ConfigLoadResult {
    bool ok = false;
    std::string error;
    nlohmann::json config;
    std::vector<std::string> sources;   // files that contributed, in merge order
};

ConfigLoadResult load_config(const ConfigPaths& paths);

/// Resolve "a.b.c"; nullopt when any segment is missing
std::optional<nlohmann::json> lookup_key(const nlohmann::json& config, const std::string& dotted_key);

/// String value at a dotted key, or the fallback when absent or not a string
std::string config_string(const nlohmann::json& config, const std::string& dotted_key,
                          const std::string& fallback = "");

/// Coerce a CLI value: true/yes, false/no, null, integers, floats, else string
nlohmann::json coerce_value(const std::string& raw);

struct ConfigWriteResult {
    bool ok = false;
    std::string error;
    nlohmann::json value;   // the coerced value that was (or would be) written
};

/**
 * @brief Set a dotted key in the override file, creating nested objects.
 *
 * Non-object intermediate values are replaced by objects. With dry_run the
 * file is left untouched.
 */
ConfigWriteResult set_override(const ConfigPaths& paths, const std::string& dotted_key,
                               const std::string& raw_value, bool dry_run = false);

/// Same, with an already-typed value
ConfigWriteResult set_override_value(const ConfigPaths& paths, const std::string& dotted_key,
                                     const nlohmann::json& value, bool dry_run = false);

} // namespace clikit
