#include "binance/market_stream.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <utility>

namespace binance {
namespace {

constexpr auto kConnectTimeout = std::chrono::seconds(10);

} // namespace

std::string build_subscribe_message(const std::vector<std::string>& streams, int id) {
    nlohmann::json msg;
    msg["method"] = "SUBSCRIBE";
    msg["params"] = streams;
    msg["id"] = id;
    return msg.dump();
}

MarketStream::MarketStream(std::string url, std::chrono::milliseconds reconnect_delay)
    : client_(std::move(url)),
      reconnect_delay_(reconnect_delay) {
    client_.set_state_callback([this](WsConnectionState state) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            connected_ = (state == WsConnectionState::Connected);
        }
        state_cv_.notify_all();
    });
    client_.set_error_callback([](const std::string& error) {
        std::cerr << "[WS] " << error << std::endl;
    });
}

MarketStream::~MarketStream() {
    stop();
}

void MarketStream::set_streams(std::vector<std::string> streams) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    streams_ = std::move(streams);
}

void MarketStream::replace_stream(const std::string& previous, const std::string& next) {
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        auto it = std::find(streams_.begin(), streams_.end(), previous);
        if (it != streams_.end()) {
            *it = next;
        } else {
            streams_.push_back(next);
        }
    }
    if (connected_) {
        subscribe();
    }
}

void MarketStream::set_message_callback(WsMessageCallback callback) {
    client_.set_message_callback(std::move(callback));
}

void MarketStream::start() {
    if (running_.exchange(true)) {
        return;
    }
    supervisor_ = std::thread([this]() { supervise(); });
}

void MarketStream::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    state_cv_.notify_all();
    if (supervisor_.joinable()) {
        supervisor_.join();
    }
    client_.disconnect();
}

bool MarketStream::is_connected() const noexcept {
    return connected_;
}

bool MarketStream::subscribe() {
    std::vector<std::string> streams;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams = streams_;
    }
    if (streams.empty()) {
        return true;
    }
    const auto message = build_subscribe_message(streams, next_request_id_.fetch_add(1));
    if (!client_.send(message)) {
        std::cerr << "[WS] Failed to queue subscription request" << std::endl;
        return false;
    }
    std::cout << "[WS] Subscribed to " << streams.size() << " stream(s)" << std::endl;
    return true;
}

void MarketStream::wait_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, duration, [this]() { return !running_; });
}

void MarketStream::supervise() {
    while (running_) {
        if (!client_.connect()) {
            std::cerr << "[WS] Connect failed; retrying in " << reconnect_delay_.count() << " ms" << std::endl;
            wait_for(reconnect_delay_);
            continue;
        }

        {
            std::unique_lock<std::mutex> lock(state_mutex_);
            state_cv_.wait_for(lock, kConnectTimeout, [this]() { return connected_ || !running_; });
        }

        if (connected_) {
            std::cout << "[WS] Connected" << std::endl;
            subscribe();
            std::unique_lock<std::mutex> lock(state_mutex_);
            state_cv_.wait(lock, [this]() { return !connected_ || !running_; });
        }

        if (!running_) {
            break;
        }

        client_.disconnect();
        ++reconnect_count_;
        std::cerr << "[WS] Connection lost; reconnecting in " << reconnect_delay_.count() << " ms" << std::endl;
        wait_for(reconnect_delay_);
    }
}

} // namespace binance
