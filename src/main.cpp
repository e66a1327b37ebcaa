#include "binance/futures_client.hpp"
#include "binance/market_stream.hpp"
#include "binance/util.hpp"
#include "grid/binance_gateway.hpp"
#include "grid/config.hpp"
#include "grid/event_queue.hpp"
#include "grid/grid_strategy.hpp"
#include "grid/scheduler.hpp"
#include "grid/stream_events.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int) {
    g_stop_requested = 1;
}

// Owns the user-data listen key: creation, periodic renewal and replacement
// after expiry. Without a key the bot keeps trading on periodic order sync.
class ListenKeySession {
public:
    ListenKeySession(grid::BinanceGateway& gateway, binance::MarketStream& stream, std::chrono::seconds renew_after)
        : gateway_(gateway), stream_(stream), renew_after_(renew_after) {}

    std::optional<std::string> open() {
        std::lock_guard<std::mutex> lock(mutex_);
        return create_locked();
    }

    // Runs on every scheduler check; renews once the renewal period elapsed
    // or the previous attempt failed.
    void check(std::chrono::steady_clock::time_point now) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (key_.empty()) {
            if (const auto created = create_locked()) {
                stream_.replace_stream({}, *created);
                std::cout << "[Gateway] User data stream available; leaving polling mode" << std::endl;
            }
            return;
        }
        if (!renewal_failed_ && now - last_renewal_ < renew_after_) {
            return;
        }
        try {
            gateway_.keepalive_listen_key();
            last_renewal_ = now;
            renewal_failed_ = false;
            std::cout << "[Gateway] Listen key renewed" << std::endl;
        } catch (const grid::GatewayError& ex) {
            renewal_failed_ = true;
            std::cerr << "[Gateway] Listen key renewal failed, retrying on next check: " << ex.what() << std::endl;
        }
    }

    void on_expired() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "[Gateway] Listen key expired; creating a new one" << std::endl;
        const auto previous = key_;
        key_.clear();
        if (const auto created = create_locked()) {
            stream_.replace_stream(previous, *created);
        }
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (key_.empty()) {
            return;
        }
        try {
            gateway_.close_listen_key();
            std::cout << "[Gateway] Listen key closed" << std::endl;
        } catch (const grid::GatewayError& ex) {
            std::cerr << "[Gateway] Failed to close listen key: " << ex.what() << std::endl;
        }
        key_.clear();
    }

private:
    std::optional<std::string> create_locked() {
        try {
            key_ = gateway_.create_listen_key();
            last_renewal_ = std::chrono::steady_clock::now();
            renewal_failed_ = false;
            return key_;
        } catch (const grid::GatewayError& ex) {
            std::cerr << "[Gateway] Listen key unavailable, order updates come from polling only: "
                      << ex.what() << std::endl;
            return std::nullopt;
        }
    }

    grid::BinanceGateway& gateway_;
    binance::MarketStream& stream_;
    std::chrono::seconds renew_after_;
    std::mutex mutex_;
    std::string key_;
    std::chrono::steady_clock::time_point last_renewal_{};
    bool renewal_failed_ = false;
};

} // namespace

int main() {
    grid::load_env_file(".env");

    grid::BotConfig config;
    try {
        config = grid::load_config_from_env();
    } catch (const std::invalid_argument& ex) {
        std::cerr << "[Config] " << ex.what() << std::endl;
        return 1;
    }
    if (config.api_key.empty() || config.api_secret.empty()) {
        std::cerr << "[Config] BINANCE_API_KEY and BINANCE_API_SECRET are required" << std::endl;
        return 1;
    }

    const auto symbol = config.grid.symbol();
    binance::FuturesClient client{binance::Credentials{config.api_key, config.api_secret}, config.stream.rest_url};
    grid::BinanceGateway gateway{client, symbol, config.grid.leverage};

    try {
        gateway.initialize();
    } catch (const grid::GatewayError& ex) {
        std::cerr << "[Gateway] Initialization failed: " << ex.what() << std::endl;
        return 1;
    }

    grid::GridStrategy strategy{gateway, config};
    strategy.startup(grid::Clock::now());

    grid::EventQueue queue;
    grid::Scheduler scheduler;
    binance::MarketStream stream{config.stream.ws_url,
                                 std::chrono::milliseconds(config.stream.reconnect_delay_ms)};
    ListenKeySession listen_key{gateway, stream, std::chrono::seconds(config.stream.listen_key_renew_s)};

    const auto symbol_lower = binance::to_lower_copy(symbol);
    std::vector<std::string> streams = {
        symbol_lower + "@bookTicker",
        symbol_lower + "@kline_" + config.signal.timeframe,
    };
    if (const auto key = listen_key.open()) {
        streams.push_back(*key);
    }
    stream.set_streams(std::move(streams));

    stream.set_message_callback([&queue, &strategy, &listen_key, symbol](const std::string& message) {
        auto event = grid::decode_stream_message(message, symbol);
        if (std::holds_alternative<std::monostate>(event)) {
            return;
        }
        queue.post([&strategy, &listen_key, event = std::move(event)]() {
            const auto now = grid::Clock::now();
            if (const auto* book = std::get_if<grid::BookTickerEvent>(&event)) {
                strategy.on_book_ticker(*book, now);
            } else if (const auto* kline = std::get_if<grid::KlineEvent>(&event)) {
                strategy.on_kline(*kline, now);
            } else if (const auto* update = std::get_if<grid::OrderUpdate>(&event)) {
                strategy.on_order_update(*update);
            } else if (std::holds_alternative<grid::ListenKeyExpiredEvent>(event)) {
                listen_key.on_expired();
            }
        });
    });

    scheduler.add_task("listen-key-keepalive",
                       std::chrono::seconds(config.stream.listen_key_check_s),
                       [&listen_key]() { listen_key.check(std::chrono::steady_clock::now()); });
    scheduler.add_task("hibernation-watchdog",
                       std::chrono::seconds(config.protection.watchdog_interval_s),
                       [&queue, &strategy]() {
                           queue.post([&strategy]() { strategy.evaluate_hibernation(grid::Clock::now()); });
                       });

    strategy.add_shutdown_hook([&stream]() { stream.stop(); });
    strategy.add_shutdown_hook([&scheduler]() { scheduler.stop(); });
    strategy.add_shutdown_hook([&listen_key]() { listen_key.close(); });
    strategy.add_shutdown_hook([&queue]() { queue.stop(); });

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::thread consumer([&queue]() { queue.run(); });
    scheduler.start();
    stream.start();
    std::cout << "[Strategy] Grid running on " << symbol << std::endl;

    while (!g_stop_requested && !strategy.stopped()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    strategy.stop();
    if (consumer.joinable()) {
        consumer.join();
    }
    std::cout << "[WS] Stream reconnected " << stream.reconnect_count() << " time(s) this session" << std::endl;
    return 0;
}
