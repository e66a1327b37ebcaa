#pragma once

#include "binance/http_client.hpp"
#include "binance/util.hpp"

#include <openssl/hmac.h>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace binance {

struct Credentials {
    std::string api_key;
    std::string api_secret;
};

class ClientBase {
public:
    explicit ClientBase(Credentials credentials,
                        std::string base_url = "https://fapi.binance.com",
                        long recv_window_ms = 5000);

    [[nodiscard]] RequestTimings last_request_timings() const;
    [[nodiscard]] std::optional<int> last_used_weight() const;
    [[nodiscard]] bool has_credentials() const noexcept;

protected:
    HttpResponse public_request(
        const std::string& method,
        const std::string& path,
        const QueryParams& params = {}) const;

    // USER_STREAM endpoints: API key header, no signature.
    HttpResponse keyed_request(
        const std::string& method,
        const std::string& path,
        const QueryParams& params = {}) const;

    HttpResponse signed_request(
        const std::string& method,
        const std::string& path,
        QueryParams params = {}) const;

private:
    std::string build_signed_query(QueryParams params) const;
    HttpResponse execute(const std::string& method, const std::string& url, bool with_key) const;

    Credentials credentials_;
    std::string base_url_;
    long recv_window_ms_;
    HttpClient http_client_;
    mutable RequestTimings last_timings_;
    mutable std::optional<int> last_used_weight_;
    mutable std::mutex request_mutex_;
};

std::string hmac_sha256_hex(const std::string& key, const std::string& message);

} // namespace binance
