#pragma once

#include <string>

namespace clikit {

// ============================================================================
// HTTP Fetching
// ============================================================================

struct FetchResult {
    bool ok = false;
    std::string error;
    long http_status = 0;
    std::string content_type;
    std::string body;
};

/**
 * @brief GET a URL with libcurl.
 *
 * Redirects are followed and TLS peers are verified. Non-2xx statuses are
 * failures ("HTTP <status>").
 */
FetchResult fetch_url(const std::string& url, long timeout_seconds,
                      const std::string& accept = "application/json");

} // namespace clikit
