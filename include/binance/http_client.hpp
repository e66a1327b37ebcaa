#pragma once

#include <curl/curl.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace binance {

struct RequestTimings {
    double name_lookup_ms = 0.0;
    double connect_ms = 0.0;
    double app_connect_ms = 0.0;
    double start_transfer_ms = 0.0;
    double total_ms = 0.0;
};

struct HttpResponse {
    long status_code;
    std::string body;
    RequestTimings timings;
    std::optional<int> used_weight;   // X-MBX-USED-WEIGHT-1M when present
};

class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message, long status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    [[nodiscard]] long status_code() const noexcept { return status_code_; }

    // 429 is a request-weight breach, 418 an IP ban after repeated breaches.
    [[nodiscard]] bool is_rate_limited() const noexcept {
        return status_code_ == 429 || status_code_ == 418;
    }

private:
    long status_code_;
};

struct HttpClientOptions {
    long timeout_ms = 5000;
    long connect_timeout_ms = 3000;
};

class HttpClient {
public:
    explicit HttpClient(HttpClientOptions options = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept = delete;
    HttpClient& operator=(HttpClient&&) noexcept = delete;

    HttpResponse request(
        const std::string& method,
        const std::string& url,
        const std::vector<std::pair<std::string, std::string>>& headers = {},
        const std::string& body = ""
    ) const;

private:
    RequestTimings collect_timings(CURL* handle) const;

    HttpClientOptions options_;
    bool global_initialized_;
};

} // namespace binance
