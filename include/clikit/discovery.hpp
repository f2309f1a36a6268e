#pragma once

/**
 * @file discovery.hpp
 * @brief Startup scan of the commands directory for extension modules
 *
 * Every shared module in the commands directory is a candidate command unit.
 * Candidates are loaded, classified by the entry point they export, and
 * registered into the command tree under their hyphenated token:
 *
 *   admin_tools.so  exports clikit_command_app   -> group  "admin-tools"
 *   greet.so        exports clikit_command_main  -> action "greet"
 *   _helpers.so                                  -> never enumerated
 *
 * A module that loads but exports neither entry point is skipped with a
 * warning. A module that fails to load is fatal: ModuleLoadError propagates
 * out of discover_commands().
 */

#include "clikit/command_tree.hpp"
#include "clikit/command_unit.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace clikit {

// ============================================================================
// Naming
// ============================================================================

/// Identifiers starting with '_' are private modules, never commands
bool is_private_identifier(const std::string& identifier);

/// True for identifiers matching [a-z][a-z0-9_]*
bool is_valid_identifier(const std::string& identifier);

/// Public invocation token: every '_' replaced by '-'
std::string derive_command_token(const std::string& identifier);

// ============================================================================
// Module Loading
// ============================================================================

/// Platform suffix of loadable modules (".so", ".dylib" or ".dll")
const char* module_suffix();

/// Raised when a candidate module cannot be loaded at all
class ModuleLoadError : public std::runtime_error {
public:
    ModuleLoadError(const std::string& path, const std::string& reason)
        : std::runtime_error("failed to load command module " + path + ": " + reason),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief RAII owner of a dynamically loaded module
 *
 * The module stays mapped until the handle is destroyed; every unit created
 * from the module must be destroyed first.
 */
class ModuleHandle {
public:
    ModuleHandle(std::string identifier, std::string path, void* native);
    ~ModuleHandle();

    ModuleHandle(const ModuleHandle&) = delete;
    ModuleHandle& operator=(const ModuleHandle&) = delete;

    const std::string& identifier() const { return identifier_; }
    const std::string& path() const { return path_; }

    /// Resolve an exported symbol; nullptr when absent
    void* symbol(const char* name) const;

private:
    std::string identifier_;
    std::string path_;
    void* native_;
};

struct ModuleCandidate {
    std::string identifier;   // file stem, e.g. "admin_tools"
    std::string path;
};

/**
 * @brief List loadable modules in a directory, sorted by identifier.
 *
 * Private ('_'-prefixed) identifiers are excluded. A missing directory
 * yields an empty list.
 */
std::vector<ModuleCandidate> enumerate_modules(const std::string& directory);

/// Load a module; throws ModuleLoadError on failure
std::shared_ptr<ModuleHandle> load_module(const ModuleCandidate& candidate);

/// Classify by exported entry point; the group shape takes precedence
UnitKind classify_module(const ModuleHandle& module);

// ============================================================================
// Discovery
// ============================================================================

struct DiscoveryReport {
    bool skipped_scan = false;               // discovery already ran on this tree
    std::vector<std::string> registered;     // tokens registered
    std::vector<std::string> invalid;        // identifiers with neither entry point
    std::vector<std::string> rejected;       // identifiers with an invalid name
};

/**
 * @brief Scan `directory` and register every valid unit into `tree`.
 *
 * Runs once per tree: later calls return a report with skipped_scan set and
 * leave the tree untouched.
 *
 * @throws ModuleLoadError when a candidate module fails to load
 */
DiscoveryReport discover_commands(CommandTree& tree, const std::string& directory);

} // namespace clikit
