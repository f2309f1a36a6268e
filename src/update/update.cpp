#include "clikit/update.hpp"
#include "clikit/http.hpp"
#include "clikit/semver.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace clikit {

std::optional<std::string> extract_latest_version(const std::string& release_json) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(release_json);
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
    if (!doc.is_object()) return std::nullopt;

    if (doc.contains("tag_name") && doc["tag_name"].is_string()) {
        std::string tag = doc["tag_name"].get<std::string>();
        if (!tag.empty() && (tag[0] == 'v' || tag[0] == 'V')) tag = tag.substr(1);
        if (!tag.empty()) return tag;
    }

    if (doc.contains("info") && doc["info"].is_object()) {
        const auto& info = doc["info"];
        if (info.contains("version") && info["version"].is_string()) {
            return info["version"].get<std::string>();
        }
    }

    return std::nullopt;
}

UpdateCheck evaluate_release(const std::string& current, const std::string& release_json) {
    UpdateCheck check;
    check.current = current;

    auto latest_str = extract_latest_version(release_json);
    if (!latest_str) {
        check.error = "release document names no version";
        return check;
    }
    check.latest = *latest_str;

    auto current_version = parse_version(current);
    auto latest_version = parse_version(*latest_str);
    if (!current_version) {
        check.error = "invalid current version: " + current;
        return check;
    }
    if (!latest_version) {
        check.error = "invalid release version: " + *latest_str;
        return check;
    }

    check.status = (*latest_version > *current_version) ? UpdateStatus::Available
                                                        : UpdateStatus::UpToDate;
    return check;
}

UpdateCheck check_for_update(const std::string& current, const std::string& url,
                             long timeout_seconds) {
    spdlog::debug("checking {} for releases", url);

    auto fetched = fetch_url(url, timeout_seconds);
    if (!fetched.ok) {
        UpdateCheck check;
        check.current = current;
        check.error = fetched.error;
        return check;
    }

    return evaluate_release(current, fetched.body);
}

} // namespace clikit
