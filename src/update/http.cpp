#include "clikit/http.hpp"

#include <curl/curl.h>

namespace clikit {

namespace {

// Callback for libcurl to write received data
size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    buffer->append(ptr, total);
    return total;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// RAII wrapper for a request header list
class CurlHeaders {
public:
    CurlHeaders() = default;
    ~CurlHeaders() { if (list_) curl_slist_free_all(list_); }

    CurlHeaders(const CurlHeaders&) = delete;
    CurlHeaders& operator=(const CurlHeaders&) = delete;

    void append(const std::string& header) { list_ = curl_slist_append(list_, header.c_str()); }
    curl_slist* get() { return list_; }

private:
    curl_slist* list_ = nullptr;
};

class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

} // namespace

FetchResult fetch_url(const std::string& url, long timeout_seconds, const std::string& accept) {
    FetchResult result;

    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        result.error = "failed to initialize CURL";
        return result;
    }

    std::string buffer;
    char error_buffer[CURL_ERROR_SIZE] = {0};
    CurlHeaders headers;
    if (!accept.empty()) {
        headers.append("Accept: " + accept);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);

    // Release APIs (GitHub) reject requests without a user agent
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "clikit-update/1.0");

    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        result.error = std::string("HTTP request failed: ") +
                      (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return result;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);

    char* content_type = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);
    if (content_type) {
        result.content_type = content_type;
    }

    if (result.http_status < 200 || result.http_status >= 300) {
        result.error = "HTTP " + std::to_string(result.http_status);
        return result;
    }

    result.body = std::move(buffer);
    result.ok = true;
    return result;
}

} // namespace clikit
