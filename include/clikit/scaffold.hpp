#pragma once

#include <string>

namespace clikit {

// ============================================================================
// Command Scaffolding
// ============================================================================

/// Source template for a new single-action extension module
const std::string& command_template();

/**
 * @brief Render the template.
 *
 * Placeholders: ${description}, ${command_name} (hyphenated token) and
 * ${identifier} (the module name). Unknown placeholders are left as-is.
 */
std::string render_command_template(const std::string& identifier, const std::string& description);

struct ScaffoldResult {
    bool ok = false;
    std::string error;
    std::string path;            // file written (or that would be written)
    std::string command_token;   // how to invoke it after rebuilding
};

/**
 * @brief Write <source_dir>/<identifier>.cpp from the template.
 *
 * Fails when the identifier is not [a-z][a-z0-9_]* or the file exists.
 */
ScaffoldResult scaffold_command(const std::string& source_dir, const std::string& identifier,
                                const std::string& description, bool dry_run);

} // namespace clikit
