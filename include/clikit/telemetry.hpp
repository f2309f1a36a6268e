#pragma once

/**
 * @file telemetry.hpp
 * @brief Anonymous local usage telemetry (opt-out)
 *
 * Events are only ever written to a local JSON file in the state directory.
 * Nothing is sent anywhere.
 */

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>

namespace clikit {

/// Environment variable that disables telemetry when set to 1, true or yes
constexpr const char* kTelemetryDisabledEnv = "CLIKIT_TELEMETRY_DISABLED";

/// Newest events kept in telemetry.json
constexpr size_t kMaxTelemetryEvents = 1000;

struct TelemetryResult {
    bool ok = false;
    std::string error;
};

struct TelemetryEvent {
    std::string command;
    double duration_seconds = 0.0;
    bool success = false;
};

/**
 * @brief Telemetry bound to one state directory.
 *
 * Files: <state dir>/state.json (telemetry_enabled, telemetry_notice_shown)
 * and <state dir>/telemetry.json (array of events).
 */
class Telemetry {
public:
    Telemetry(std::string state_dir, std::string cli_version);

    const std::string& state_file() const { return state_file_; }
    const std::string& events_file() const { return events_file_; }

    /// False when disabled by the environment or by state.json
    bool enabled() const;

    TelemetryResult set_enabled(bool enabled);

    /**
     * @brief Print the one-time notice to `out` and remember it was shown.
     * @return true when the notice was printed by this call
     */
    bool show_first_run_notice(std::ostream& out, const std::string& cli_name);

    /// Append an event (no-op when disabled)
    TelemetryResult record(const TelemetryEvent& event);

    /// Number of events in telemetry.json, 0 when absent or unreadable
    size_t event_count() const;

private:
    nlohmann::json load_state() const;
    TelemetryResult save_state(const nlohmann::json& state) const;

    std::string state_file_;
    std::string events_file_;
    std::string cli_version_;
};

/// First 16 hex chars of the SHA-256 of the host name
std::string machine_id();

/// Lowercase hex SHA-256 of `data`; empty when the digest cannot be computed
std::string sha256_hex(const std::string& data);

} // namespace clikit
