#include "clikit/telemetry.hpp"
#include "clikit/platform.hpp"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace clikit {

// ============================================================================
// SHA-256 (OpenSSL EVP)
// ============================================================================

namespace {

class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

} // namespace

std::string sha256_hex(const std::string& data) {
    EvpMdCtx ctx;
    if (!ctx) return "";

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return "";
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) return "";

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string machine_id() {
    return sha256_hex(get_hostname()).substr(0, 16);
}

// ============================================================================
// Telemetry
// ============================================================================

Telemetry::Telemetry(std::string state_dir, std::string cli_version)
    : cli_version_(std::move(cli_version)) {
    namespace fs = std::filesystem;
    state_file_ = (fs::path(state_dir) / "state.json").string();
    events_file_ = (fs::path(state_dir) / "telemetry.json").string();
}

nlohmann::json Telemetry::load_state() const {
    auto content = read_file(state_file_);
    if (!content) return nlohmann::json::object();
    try {
        auto state = nlohmann::json::parse(*content);
        if (state.is_object()) return state;
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::debug("ignoring unreadable state file {}: {}", state_file_, e.what());
    }
    return nlohmann::json::object();
}

TelemetryResult Telemetry::save_state(const nlohmann::json& state) const {
    TelemetryResult result;
    auto write = atomic_write_file(state_file_, state.dump(2) + "\n");
    if (!write.ok) {
        result.error = write.error;
        return result;
    }
    result.ok = true;
    return result;
}

bool Telemetry::enabled() const {
    if (env_flag_enabled(kTelemetryDisabledEnv)) return false;
    auto state = load_state();
    auto it = state.find("telemetry_enabled");
    if (it != state.end() && it->is_boolean()) return it->get<bool>();
    return true;
}

TelemetryResult Telemetry::set_enabled(bool enabled) {
    auto state = load_state();
    state["telemetry_enabled"] = enabled;
    return save_state(state);
}

bool Telemetry::show_first_run_notice(std::ostream& out, const std::string& cli_name) {
    auto state = load_state();
    if (state.value("telemetry_notice_shown", false)) return false;

    out << "Anonymous usage telemetry is enabled. Run '" << cli_name
        << " telemetry disable' or set " << kTelemetryDisabledEnv << "=1 to opt out.\n";

    state["telemetry_notice_shown"] = true;
    auto saved = save_state(state);
    if (!saved.ok) {
        spdlog::debug("could not persist telemetry notice: {}", saved.error);
    }
    return true;
}

TelemetryResult Telemetry::record(const TelemetryEvent& event) {
    if (!enabled()) return {true, ""};

    nlohmann::json events = nlohmann::json::array();
    if (auto content = read_file(events_file_)) {
        try {
            auto parsed = nlohmann::json::parse(*content);
            if (parsed.is_array()) events = std::move(parsed);
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::debug("discarding unreadable telemetry log {}: {}", events_file_, e.what());
        }
    }

    nlohmann::json entry = {
        {"command", event.command},
        {"duration_s", std::round(event.duration_seconds * 1000.0) / 1000.0},
        {"success", event.success},
        {"cli_version", cli_version_},
        {"os", platform_to_string(get_current_platform())},
        {"machine_id", machine_id()},
        {"timestamp", get_current_timestamp()},
    };
    events.push_back(std::move(entry));

    if (events.size() > kMaxTelemetryEvents) {
        auto excess = static_cast<std::ptrdiff_t>(events.size() - kMaxTelemetryEvents);
        events.erase(events.begin(), events.begin() + excess);
    }

    TelemetryResult result;
    auto write = atomic_write_file(events_file_, events.dump(2) + "\n");
    if (!write.ok) {
        result.error = write.error;
        return result;
    }
    result.ok = true;
    return result;
}

size_t Telemetry::event_count() const {
    auto content = read_file(events_file_);
    if (!content) return 0;
    try {
        auto events = nlohmann::json::parse(*content);
        return events.is_array() ? events.size() : 0;
    } catch (const nlohmann::json::parse_error&) {
        return 0;
    }
}

} // namespace clikit
