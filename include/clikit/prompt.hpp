#pragma once

#include "clikit/execution_context.hpp"

#include <optional>
#include <string>
#include <vector>

namespace clikit {

// ============================================================================
// Interactive Prompts
// ============================================================================

/**
 * @brief Line-oriented prompts read from the context's input stream.
 *
 * Questions, menus and re-ask messages go to the error stream so stdout
 * carries only command output.
 *
 * Every prompt returns nullopt when input ends, which callers treat as an
 * abort.
 */
class Prompter {
public:
    explicit Prompter(const ExecutionContext& ctx) : ctx_(ctx) {}

    /// Free text; an empty answer yields `default_value`
    std::optional<std::string> ask(const std::string& question,
                                   const std::string& default_value = "") const;

    /// Free text with terminal echo disabled when reading a real terminal
    std::optional<std::string> ask_secret(const std::string& question) const;

    /// Numbered menu; returns the chosen index (an empty answer picks default_index)
    std::optional<size_t> choose(const std::string& question,
                                 const std::vector<std::string>& options,
                                 size_t default_index = 0) const;

    /// y/n question
    std::optional<bool> confirm(const std::string& question, bool default_value) const;

private:
    std::optional<std::string> read_line() const;

    const ExecutionContext& ctx_;
};

} // namespace clikit
