#include "binance/client_base.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace binance {
namespace {

long long current_timestamp_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

constexpr int kUsedWeightWarning = 1800;   // of the 2400 per-minute allowance

} // namespace

std::string hmac_sha256_hex(const std::string& key, const std::string& message) {
    unsigned int len = 0;
    unsigned char buffer[EVP_MAX_MD_SIZE];

    const unsigned char* digest = HMAC(
        EVP_sha256(),
        key.data(), static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        buffer,
        &len);

    if (digest == nullptr) {
        throw std::runtime_error("Failed to create HMAC signature");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(buffer[i]);
    }

    return oss.str();
}

ClientBase::ClientBase(Credentials credentials, std::string base_url, long recv_window_ms)
    : credentials_(std::move(credentials)),
      base_url_(std::move(base_url)),
      recv_window_ms_(recv_window_ms),
      http_client_(),
      last_timings_{} {}

RequestTimings ClientBase::last_request_timings() const {
    std::lock_guard<std::mutex> lock(request_mutex_);
    return last_timings_;
}

std::optional<int> ClientBase::last_used_weight() const {
    std::lock_guard<std::mutex> lock(request_mutex_);
    return last_used_weight_;
}

bool ClientBase::has_credentials() const noexcept {
    return !credentials_.api_key.empty() && !credentials_.api_secret.empty();
}

HttpResponse ClientBase::public_request(
    const std::string& method,
    const std::string& path,
    const QueryParams& params) const {

    std::string url = base_url_ + path;
    const auto query = build_query_string(params);
    if (!query.empty()) {
        url += '?' + query;
    }
    return execute(method, url, false);
}

HttpResponse ClientBase::keyed_request(
    const std::string& method,
    const std::string& path,
    const QueryParams& params) const {

    if (credentials_.api_key.empty()) {
        throw std::invalid_argument("API key is required for user stream requests");
    }

    std::string url = base_url_ + path;
    const auto query = build_query_string(params);
    if (!query.empty()) {
        url += '?' + query;
    }
    return execute(method, url, true);
}

HttpResponse ClientBase::signed_request(
    const std::string& method,
    const std::string& path,
    QueryParams params) const {

    if (!has_credentials()) {
        throw std::invalid_argument("API key and secret are required for signed requests");
    }

    const auto signed_query = build_signed_query(std::move(params));
    return execute(method, base_url_ + path + '?' + signed_query, true);
}

HttpResponse ClientBase::execute(const std::string& method, const std::string& url, bool with_key) const {
    std::vector<std::pair<std::string, std::string>> headers = {
        {"Content-Type", "application/x-www-form-urlencoded"}
    };
    if (with_key) {
        headers.emplace_back("X-MBX-APIKEY", credentials_.api_key);
    }

    auto response = http_client_.request(method, url, headers);
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        last_timings_ = response.timings;
        if (response.used_weight) {
            last_used_weight_ = response.used_weight;
        }
    }
    if (response.used_weight && *response.used_weight >= kUsedWeightWarning) {
        std::cerr << "[RateLimit] Request weight at " << *response.used_weight << " for the current minute" << std::endl;
    }
    return response;
}

std::string ClientBase::build_signed_query(QueryParams params) const {
    params.emplace_back("recvWindow", std::to_string(recv_window_ms_));
    params.emplace_back("timestamp", std::to_string(current_timestamp_ms()));
    const auto filtered = filter_empty(params);
    const auto query = build_query_string(filtered);
    const auto signature = hmac_sha256_hex(credentials_.api_secret, query);
    return query + "&signature=" + signature;
}

} // namespace binance
