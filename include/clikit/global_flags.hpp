#pragma once

#include "clikit/execution_context.hpp"

#include <CLI/CLI.hpp>

#include <string>
#include <vector>

namespace clikit {

// ============================================================================
// Global Options
// ============================================================================

/**
 * Flags accepted before the command token. Parsed once per process.
 */
struct GlobalOptions {
    bool verbose = false;           // -v, --verbose
    bool quiet = false;             // -q, --quiet
    bool debug = false;             // --debug
    bool dry_run = false;           // --dry-run
    bool version = false;           // -V, --version
    std::string format = "table";   // -f, --format
};

/// Declare the global flags on an app, bound to opts
void add_global_flags(CLI::App& app, GlobalOptions& opts);

struct GlobalParseResult {
    bool ok = false;
    std::string error;
    GlobalOptions options;
    std::vector<std::string> remaining;   // command token and everything after it
};

/**
 * @brief Consume the global flags that precede the first command token.
 *
 * Parsing stops at the first positional argument; it and all later
 * arguments are returned untouched in `remaining`, as are unknown options
 * such as --help.
 */
GlobalParseResult parse_global_flags(const std::vector<std::string>& args);

/// Build the execution context for the parsed flags (process streams)
ExecutionContext make_execution_context(const GlobalOptions& opts);

} // namespace clikit
