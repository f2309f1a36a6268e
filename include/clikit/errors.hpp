#pragma once

#include "clikit/execution_context.hpp"

#include <exception>
#include <string>
#include <typeinfo>

namespace clikit {

// ============================================================================
// Top-level Error Rendering
// ============================================================================

/// Demangled type name of the dynamic exception type
std::string exception_type_name(const std::exception& e);

/**
 * @brief Describe an exception for the user.
 *
 * Short form: "<Type>: <message>" with namespaces stripped.
 * Full form: qualified type, message and every nested exception
 * (std::throw_with_nested) on its own "caused by" line.
 */
std::string describe_exception(const std::exception& e, bool full);

/**
 * @brief Print an uncaught exception to the context's error stream.
 *
 * Debug mode prints the full description; otherwise a one-line summary and
 * a hint to re-run with --debug.
 * @return exit status to use (1)
 */
int report_uncaught(const std::exception& e, const ExecutionContext& ctx);

/// SIGINT prints "Interrupted." instead of a diagnostic and exits with 130
void install_interrupt_handler();

} // namespace clikit
