#pragma once

#include "clikit/config.hpp"
#include "clikit/secrets.hpp"

#include <map>
#include <string>
#include <vector>

namespace clikit {

// ============================================================================
// Branding
// ============================================================================

struct ColorPalette {
    std::string name;
    std::string primary;
    std::string secondary;
    std::string description;
};

const std::vector<ColorPalette>& color_palettes();
const std::vector<std::string>& preset_emojis();

/// Persist cli.emoji, cli.primary_color and cli.secondary_color overrides
ConfigWriteResult save_branding(const ConfigPaths& paths, const std::string& emoji,
                                const std::string& primary_color,
                                const std::string& secondary_color, bool dry_run);

// ============================================================================
// CLI Name
// ============================================================================

/// Name the CLI carries until a project renames it
constexpr const char* kDefaultCliName = "clikit";

/**
 * @brief Check a command name: lowercase words of [a-z0-9] joined by single
 * hyphens, starting with a letter (e.g. my-tool).
 * @return Empty when valid, otherwise the message to show
 */
std::string validate_cli_name(const std::string& name);

/// Persist the cli.name override
ConfigWriteResult save_cli_name(const ConfigPaths& paths, const std::string& name, bool dry_run);

// ============================================================================
// Environment File
// ============================================================================

/**
 * @brief Render a .env from the example's key order.
 *
 * For each example key: the new value when one was given, else the existing
 * value, else the example's value. Keys only present in `existing` are kept
 * at the end.
 */
std::string render_env_file(const std::vector<DotenvEntry>& example,
                            const std::map<std::string, std::string>& existing,
                            const std::map<std::string, std::string>& values);

/// An existing value is "real" when it is non-empty and differs from the example
bool is_real_env_value(const std::string& value, const std::string& example_value);

} // namespace clikit
