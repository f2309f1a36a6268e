#pragma once

#include "clikit/execution_context.hpp"

#include <spdlog/sinks/sink.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace clikit {

/// spdlog level for a verbosity: quiet->err, normal->warn, verbose->info, debug->debug
spdlog::level::level_enum log_level_for(Verbosity verbosity);

/**
 * @brief Install the default logger on the diagnostic stream (stderr).
 *
 * Command output goes to the execution context's output stream; log lines
 * never do.
 */
void configure_logging(Verbosity verbosity);

/// Same as configure_logging() but writing to a caller-provided sink
void configure_logging(Verbosity verbosity, std::shared_ptr<spdlog::sinks::sink> sink);

} // namespace clikit
