#pragma once

/**
 * @file semver.hpp
 * @brief Semantic Versioning 2.0.0 support for release checks
 *
 * @example
 * ```cpp
 * auto current = clikit::parse_version(CLIKIT_VERSION);
 * auto latest = clikit::parse_version("v1.4.0");   // leading 'v' accepted
 *
 * if (current && latest && *latest > *current) {
 *     // newer release available
 * }
 * ```
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>

namespace clikit {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/**
 * @brief Parse a SemVer 2.0.0 version string
 * @param str Version string; surrounding whitespace and one leading 'v' or 'V'
 *            are ignored (release tags are commonly "v1.2.3")
 * @return Parsed version or nullopt on failure
 */
std::optional<Version> parse_version(const std::string& str);

} // namespace clikit
