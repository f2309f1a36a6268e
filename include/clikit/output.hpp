#pragma once

#include "clikit/execution_context.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace clikit {

/**
 * @brief Render data to the context's output stream in its output format.
 *
 * - json:  pretty-printed JSON
 * - plain: optional title line, then "key: value" lines; arrays of objects
 *          are separated by "---"
 * - table: Key/Value table for objects, one column per key for arrays of
 *          objects, plain for anything else
 */
void render(const nlohmann::json& data, const std::string& title, const ExecutionContext& ctx);

/// Scalar values without JSON quoting ("abc" -> abc, null -> "")
std::string display_value(const nlohmann::json& value);

} // namespace clikit
