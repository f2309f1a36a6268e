#pragma once

/**
 * @file execution_context.hpp
 * @brief Process-wide execution state handed to every command unit
 *
 * The context is built once from the global flags, before any command unit
 * runs, and is passed by const reference through the dispatcher into each
 * unit. Units never mutate it.
 *
 * @example
 * ```cpp
 * int run(const clikit::ExecutionContext& ctx) override {
 *     if (ctx.dry_run()) {
 *         ctx.out() << "[DRY RUN] Would delete " << path_ << "\n";
 *         return 0;
 *     }
 *     ...
 * }
 * ```
 */

#include <iostream>
#include <optional>
#include <string>

namespace clikit {

// ============================================================================
// Verbosity / Output Format
// ============================================================================

enum class Verbosity {
    Normal,
    Verbose,
    Quiet,
    Debug
};

enum class OutputFormat {
    Table,
    Json,
    Plain
};

inline const char* verbosity_to_string(Verbosity v) {
    switch (v) {
        case Verbosity::Normal: return "normal";
        case Verbosity::Verbose: return "verbose";
        case Verbosity::Quiet: return "quiet";
        case Verbosity::Debug: return "debug";
    }
    return "normal";
}

inline const char* output_format_to_string(OutputFormat f) {
    switch (f) {
        case OutputFormat::Table: return "table";
        case OutputFormat::Json: return "json";
        case OutputFormat::Plain: return "plain";
    }
    return "table";
}

inline std::optional<OutputFormat> parse_output_format(const std::string& s) {
    if (s == "table") return OutputFormat::Table;
    if (s == "json") return OutputFormat::Json;
    if (s == "plain") return OutputFormat::Plain;
    return std::nullopt;
}

/// Resolve the verbosity flags by precedence: debug > quiet > verbose > normal
inline Verbosity resolve_verbosity(bool verbose, bool quiet, bool debug) {
    if (debug) return Verbosity::Debug;
    if (quiet) return Verbosity::Quiet;
    if (verbose) return Verbosity::Verbose;
    return Verbosity::Normal;
}

// ============================================================================
// Execution Context
// ============================================================================

/**
 * @brief Read-only state shared by all command units of one invocation
 *
 * Streams default to the process streams. Tests substitute string streams
 * to capture what a unit prints.
 */
class ExecutionContext {
public:
    ExecutionContext() = default;

    ExecutionContext(Verbosity verbosity, OutputFormat format, bool dry_run)
        : verbosity_(verbosity), format_(format), dry_run_(dry_run) {}

    Verbosity verbosity() const { return verbosity_; }
    OutputFormat format() const { return format_; }

    /// Debug implies verbose for read purposes
    bool is_verbose() const {
        return verbosity_ == Verbosity::Verbose || verbosity_ == Verbosity::Debug;
    }
    bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
    bool is_debug() const { return verbosity_ == Verbosity::Debug; }
    bool dry_run() const { return dry_run_; }

    /// True when prompts may be shown (input attached to a terminal)
    bool interactive() const { return interactive_; }

    std::ostream& out() const { return *out_; }
    std::ostream& err() const { return *err_; }
    std::istream& in() const { return *in_; }

    ExecutionContext& with_streams(std::ostream& out, std::ostream& err, std::istream& in) {
        out_ = &out;
        err_ = &err;
        in_ = &in;
        return *this;
    }

    ExecutionContext& with_interactive(bool interactive) {
        interactive_ = interactive;
        return *this;
    }

private:
    Verbosity verbosity_ = Verbosity::Normal;
    OutputFormat format_ = OutputFormat::Table;
    bool dry_run_ = false;
    bool interactive_ = false;
    std::ostream* out_ = &std::cout;
    std::ostream* err_ = &std::cerr;
    std::istream* in_ = &std::cin;
};

} // namespace clikit
