#include "binance/http_client.hpp"

#include <cctype>
#include <memory>
#include <utility>

namespace binance {
namespace {

struct EasyHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t header_callback(char* data, size_t size, size_t nitems, void* userp) {
    const size_t total = size * nitems;
    auto* used_weight = static_cast<std::optional<int>*>(userp);

    std::string line(data, total);
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        return total;
    }

    std::string name = line.substr(0, colon);
    for (auto& ch : name) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    if (name == "x-mbx-used-weight-1m") {
        try {
            *used_weight = std::stoi(line.substr(colon + 1));
        } catch (...) {
            *used_weight = std::nullopt;
        }
    }
    return total;
}

} // namespace

HttpClient::HttpClient(HttpClientOptions options)
    : options_(options),
      global_initialized_(false) {
    const auto code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
        throw HttpError("Failed to initialize libcurl: " + std::string(curl_easy_strerror(code)));
    }
    global_initialized_ = true;
}

HttpClient::~HttpClient() {
    if (global_initialized_) {
        curl_global_cleanup();
    }
}

RequestTimings HttpClient::collect_timings(CURL* handle) const {
    RequestTimings timings;
    double value = 0.0;

    if (curl_easy_getinfo(handle, CURLINFO_NAMELOOKUP_TIME, &value) == CURLE_OK) {
        timings.name_lookup_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_CONNECT_TIME, &value) == CURLE_OK) {
        timings.connect_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_APPCONNECT_TIME, &value) == CURLE_OK) {
        timings.app_connect_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_STARTTRANSFER_TIME, &value) == CURLE_OK) {
        timings.start_transfer_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_TOTAL_TIME, &value) == CURLE_OK) {
        timings.total_ms = value * 1000.0;
    }

    return timings;
}

HttpResponse HttpClient::request(
    const std::string& method,
    const std::string& url,
    const std::vector<std::pair<std::string, std::string>>& headers,
    const std::string& body) const {
    EasyHandle handle{curl_easy_init()};
    if (!handle) {
        throw HttpError("Failed to create CURL easy handle");
    }

    std::string response_body;
    std::optional<int> used_weight;
    CURL* raw = handle.get();
    curl_easy_setopt(raw, CURLOPT_URL, url.c_str());
    curl_easy_setopt(raw, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(raw, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(raw, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(raw, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(raw, CURLOPT_HEADERDATA, &used_weight);
    curl_easy_setopt(raw, CURLOPT_TIMEOUT_MS, options_.timeout_ms);
    curl_easy_setopt(raw, CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
    curl_easy_setopt(raw, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(raw, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(raw, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(raw, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(raw, CURLOPT_NOSIGNAL, 1L);

    HeaderList header_list;
    for (const auto& header : headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), (header.first + ": " + header.second).c_str());
        if (!appended) {
            throw HttpError("Failed to build request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }

    if (header_list) {
        curl_easy_setopt(raw, CURLOPT_HTTPHEADER, header_list.get());
    }

    if (!body.empty()) {
        curl_easy_setopt(raw, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(raw, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    const auto perform_code = curl_easy_perform(raw);

    long status_code = 0;
    curl_easy_getinfo(raw, CURLINFO_RESPONSE_CODE, &status_code);

    if (perform_code != CURLE_OK) {
        throw HttpError("libcurl request failed: " + std::string(curl_easy_strerror(perform_code)));
    }

    if (status_code >= 400) {
        throw HttpError("HTTP error: " + response_body, status_code);
    }

    return HttpResponse{status_code, std::move(response_body), collect_timings(raw), used_weight};
}

} // namespace binance
