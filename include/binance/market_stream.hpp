#pragma once

#include "binance/ws_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace binance {

std::string build_subscribe_message(const std::vector<std::string>& streams, int id);

// Keeps one combined-stream connection alive: connects, subscribes to the
// configured stream names, and after any transport failure waits a fixed
// delay before reconnecting, indefinitely, until stop() is called.
class MarketStream {
public:
    explicit MarketStream(std::string url,
                          std::chrono::milliseconds reconnect_delay = std::chrono::seconds(5));
    ~MarketStream();

    MarketStream(const MarketStream&) = delete;
    MarketStream& operator=(const MarketStream&) = delete;

    void set_streams(std::vector<std::string> streams);
    // Swaps one subscription (e.g. a renewed listen key) and resubscribes if connected.
    void replace_stream(const std::string& previous, const std::string& next);
    void set_message_callback(WsMessageCallback callback);

    void start();
    void stop();

    bool is_connected() const noexcept;
    int reconnect_count() const noexcept { return reconnect_count_.load(); }

private:
    void supervise();
    bool subscribe();
    void wait_for(std::chrono::milliseconds duration);

    WsClient client_;
    std::chrono::milliseconds reconnect_delay_;
    std::vector<std::string> streams_;
    mutable std::mutex streams_mutex_;

    std::thread supervisor_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<int> reconnect_count_{0};
    std::atomic<int> next_request_id_{1};
    std::mutex state_mutex_;
    std::condition_variable state_cv_;
};

} // namespace binance
