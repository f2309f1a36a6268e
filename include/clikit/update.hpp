#pragma once

#include <optional>
#include <string>

namespace clikit {

// ============================================================================
// Release Checks
// ============================================================================

enum class UpdateStatus {
    UpToDate,
    Available,
    CheckFailed
};

struct UpdateCheck {
    UpdateStatus status = UpdateStatus::CheckFailed;
    std::string current;
    std::string latest;
    std::string error;
};

/**
 * @brief Latest version named by a release document.
 *
 * Accepts a GitHub-style release (`tag_name`, optional leading `v`) or a
 * package index document (`info.version`).
 */
std::optional<std::string> extract_latest_version(const std::string& release_json);

/// Compare `current` with the release document body
UpdateCheck evaluate_release(const std::string& current, const std::string& release_json);

/// Fetch `url` and evaluate it; network and parse failures yield CheckFailed
UpdateCheck check_for_update(const std::string& current, const std::string& url,
                             long timeout_seconds);

} // namespace clikit
