#include "grid/extreme_protection.hpp"

#include <chrono>
#include <cmath>
#include <future>
#include <iostream>
#include <thread>
#include <utility>
#include <vector>

namespace grid {
namespace {

constexpr double kEpsilon = 1e-9;
constexpr double kQuantityEpsilon = 1e-12;
constexpr auto kRecoveryLogInterval = std::chrono::minutes(10);

double hours_between(TimePoint from, TimePoint to) {
    return std::chrono::duration<double, std::ratio<3600>>(to - from).count();
}

} // namespace

KlineBar make_kline_bar(double open, double high, double low, double close, double volume,
                        TimePoint timestamp, double noise_threshold_pct) {
    KlineBar bar;
    bar.open = open;
    bar.high = high;
    bar.low = low;
    bar.close = close;
    bar.volume = volume;
    bar.timestamp = timestamp;
    bar.change_pct = open > 0.0 ? (close - open) / open * 100.0 : 0.0;
    if (bar.change_pct > noise_threshold_pct) {
        bar.direction = TrendDirection::Up;
    } else if (bar.change_pct < -noise_threshold_pct) {
        bar.direction = TrendDirection::Down;
    }
    return bar;
}

ExtremeProtection::ExtremeProtection(MarketGateway& gateway, ProtectionConfig config, ProtectionStateStore store)
    : gateway_(gateway),
      config_(std::move(config)),
      store_(std::move(store)),
      volatility_(config_.volatility_period,
                  static_cast<std::size_t>(config_.price_buffer_size),
                  static_cast<std::size_t>(config_.volatility_history_size),
                  static_cast<std::size_t>(config_.baseline_samples)) {}

void ExtremeProtection::restore(TimePoint now) {
    auto loaded = store_.load();
    if (!loaded) {
        std::cout << "[Protection] No persisted state at " << store_.path() << "; starting fresh" << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = *loaded;
    if (state_.baseline_volatility) {
        volatility_.restore_baseline(*state_.baseline_volatility);
    }

    if (state_.protection_active && !state_.hibernation_start) {
        std::cerr << "[Protection] Persisted state active without a hibernation start; restarting the clock" << std::endl;
        state_.hibernation_start = now;
        persist_locked(now);
    }

    std::cout << "[Protection] Restored state: direction=" << to_string(state_.direction)
              << " bars=" << state_.consecutive_bars
              << " cumulative=" << state_.cumulative_change_pct << "%"
              << " active=" << (state_.protection_active ? "yes" : "no") << std::endl;
}

void ExtremeProtection::on_bar(const KlineBar& bar, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (bar.direction == TrendDirection::Neutral) {
        if (state_.direction != TrendDirection::Neutral) {
            std::cout << "[Protection] Neutral bar ends " << to_string(state_.direction) << " run after "
                      << state_.consecutive_bars << " bars (" << state_.cumulative_change_pct << "%)" << std::endl;
        }
        reset_run_locked();
    } else if (bar.direction == state_.direction) {
        ++state_.consecutive_bars;
        if (state_.run_start_price > 0.0) {
            const double change = (bar.close - state_.run_start_price) / state_.run_start_price * 100.0;
            state_.cumulative_change_pct = bar.direction == TrendDirection::Down ? std::fabs(change) : change;
        }
    } else {
        state_.direction = bar.direction;
        state_.consecutive_bars = 1;
        state_.run_start_price = bar.open;
        state_.run_start_time = bar.timestamp;
        state_.cumulative_change_pct = std::fabs(bar.change_pct);
    }

    persist_locked(now);
}

void ExtremeProtection::on_price(double price, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (volatility_.add_price(price)) {
        state_.baseline_volatility = volatility_.baseline();
        std::cout << "[Protection] Baseline volatility captured: " << *state_.baseline_volatility << std::endl;
        persist_locked(now);
    }
}

bool ExtremeProtection::is_extreme() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::fabs(state_.cumulative_change_pct) + kEpsilon >= config_.extreme_threshold_pct;
}

bool ExtremeProtection::hibernating() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.protection_active;
}

ProtectionMode ExtremeProtection::mode() const {
    return hibernating() ? ProtectionMode::Hibernating : ProtectionMode::Normal;
}

bool ExtremeProtection::volatility_recovered(double current, double baseline, double multiplier) {
    if (current <= 0.0 || baseline <= 0.0) {
        return false;
    }
    return current <= baseline * multiplier + kEpsilon * baseline;
}

bool ExtremeProtection::evaluate_hibernation_end(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.protection_active) {
        return false;
    }
    if (!state_.hibernation_start) {
        state_.hibernation_start = now;
        persist_locked(now);
        return false;
    }

    const double elapsed = hours_between(*state_.hibernation_start, now);
    if (elapsed < config_.hibernation_hours) {
        return false;
    }

    const double current = volatility_.current();
    const auto baseline = volatility_.baseline();
    if (!baseline || !volatility_recovered(current, *baseline, config_.recovery_multiplier)) {
        if (!last_recovery_log_ || now - *last_recovery_log_ >= kRecoveryLogInterval) {
            std::cout << "[Protection] Hibernation window elapsed (" << elapsed << "h) but volatility "
                      << current << " has not recovered to "
                      << (baseline ? *baseline * config_.recovery_multiplier : 0.0) << std::endl;
            last_recovery_log_ = now;
        }
        return false;
    }

    state_.protection_active = false;
    state_.hibernation_start.reset();
    last_recovery_log_.reset();
    // The run that caused the hibernation must not re-trigger on the first tick.
    reset_run_locked();
    persist_locked(now);
    std::cout << "[Protection] Hibernation ended after " << elapsed << "h; volatility " << current
              << " within " << config_.recovery_multiplier << "x baseline " << *baseline << std::endl;
    return true;
}

EmergencyOutcome ExtremeProtection::trigger_emergency(double reference_price, TimePoint now, const BookTop& book) {
    EmergencyOutcome outcome;
    const bool ran = emergency_flight_.try_run([&]() {
        outcome.started = true;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_.protection_active) {
                outcome.activated = true;
                return;
            }
            std::cerr << "[Protection] EXTREME move: " << to_string(state_.direction) << " "
                      << state_.cumulative_change_pct << "% over " << state_.consecutive_bars
                      << " bars; starting emergency sequence" << std::endl;
        }

        outcome.cancelled = cancel_all_orders();
        outcome.flattened = flatten_positions(reference_price, book);

        if (!outcome.cancelled || !outcome.flattened) {
            std::cerr << "[Protection] CRITICAL emergency sequence incomplete (cancel="
                      << (outcome.cancelled ? "ok" : "failed") << ", flatten="
                      << (outcome.flattened ? "ok" : "failed")
                      << "); protection left inactive" << std::endl;
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        state_.protection_active = true;
        state_.hibernation_start = now;
        persist_locked(now);
        outcome.activated = true;
        std::cout << "[Protection] Positions flattened; hibernating for at least "
                  << config_.hibernation_hours << "h" << std::endl;
    });

    if (!ran) {
        std::cout << "[Protection] Emergency sequence already in progress" << std::endl;
    }
    return outcome;
}

ProtectionState ExtremeProtection::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

double ExtremeProtection::current_volatility() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return volatility_.current();
}

void ExtremeProtection::force_reset(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.protection_active = false;
    state_.hibernation_start.reset();
    reset_run_locked();
    persist_locked(now);
    std::cout << "[Protection] Protection state force-reset" << std::endl;
}

void ExtremeProtection::reset_run_locked() {
    state_.direction = TrendDirection::Neutral;
    state_.consecutive_bars = 0;
    state_.cumulative_change_pct = 0.0;
    state_.run_start_price = 0.0;
    state_.run_start_time.reset();
}

bool ExtremeProtection::cancel_all_orders() {
    std::vector<OpenOrder> orders;
    try {
        orders = gateway_.fetch_open_orders();
    } catch (const GatewayError& ex) {
        std::cerr << "[Protection] Failed to list open orders: " << ex.what() << std::endl;
        return false;
    }

    std::vector<std::future<bool>> tasks;
    tasks.reserve(orders.size());
    for (const auto& order : orders) {
        tasks.push_back(std::async(std::launch::async, [this, id = order.order_id]() {
            try {
                gateway_.cancel_order(id);
                return true;
            } catch (const GatewayError& ex) {
                std::cerr << "[Protection] Failed to cancel order " << id << ": " << ex.what() << std::endl;
                return false;
            }
        }));
    }

    bool all_ok = true;
    for (auto& task : tasks) {
        all_ok = task.get() && all_ok;
    }
    std::cout << "[Protection] Cancelled " << orders.size() << " open order(s)"
              << (all_ok ? "" : " with failures") << std::endl;
    return all_ok;
}

bool ExtremeProtection::flatten_positions(double reference_price, const BookTop& book) {
    PositionSnapshot snapshot;
    try {
        snapshot = gateway_.fetch_position();
    } catch (const GatewayError& ex) {
        std::cerr << "[Protection] Failed to fetch positions: " << ex.what() << std::endl;
        return false;
    }

    // Longs are sold through the bid, shorts bought through the ask.
    const double bid = book.best_bid > 0.0 ? book.best_bid : reference_price;
    const double ask = book.best_ask > 0.0 ? book.best_ask : reference_price;

    std::vector<std::future<bool>> tasks;
    if (snapshot.long_qty > kQuantityEpsilon) {
        tasks.push_back(std::async(std::launch::async, [this, qty = snapshot.long_qty, bid]() {
            return close_side(PositionSide::Long, qty, bid * (1.0 - config_.close_offset));
        }));
    }
    if (snapshot.short_qty > kQuantityEpsilon) {
        tasks.push_back(std::async(std::launch::async, [this, qty = snapshot.short_qty, ask]() {
            return close_side(PositionSide::Short, qty, ask * (1.0 + config_.close_offset));
        }));
    }

    bool all_ok = true;
    for (auto& task : tasks) {
        all_ok = task.get() && all_ok;
    }
    return all_ok;
}

bool ExtremeProtection::close_side(PositionSide side, double quantity, double price) {
    OrderRequest request;
    request.side = exit_side(side);
    request.price = price;
    request.quantity = quantity;
    request.reduce_only = true;
    request.position_side = side;
    request.type = OrderType::Limit;

    try {
        const auto placed = gateway_.place_order(request);
        std::cout << "[Protection] Closing " << to_string(side) << " " << quantity << " at " << price
                  << " id=" << placed.order_id << std::endl;
        if (placed.status == OrderStatus::Filled) {
            return true;
        }
        return wait_for_fill(placed.order_id);
    } catch (const GatewayError& ex) {
        std::cerr << "[Protection] Failed to close " << to_string(side) << " position: " << ex.what() << std::endl;
        return false;
    }
}

bool ExtremeProtection::wait_for_fill(const std::string& order_id) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.close_timeout_s);
    while (std::chrono::steady_clock::now() < deadline) {
        try {
            const auto status = gateway_.fetch_order_status(order_id);
            if (status == OrderStatus::Filled) {
                return true;
            }
            if (is_terminal(status)) {
                std::cerr << "[Protection] Close order " << order_id << " ended " << to_string(status) << std::endl;
                return false;
            }
        } catch (const GatewayError& ex) {
            std::cerr << "[Protection] Failed to query close order " << order_id << ": " << ex.what() << std::endl;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.fill_poll_interval_ms));
    }

    std::cerr << "[Protection] Timed out waiting for close order " << order_id << " to fill" << std::endl;
    return false;
}

void ExtremeProtection::persist_locked(TimePoint now) {
    state_.last_update = now;
    if (!store_.save(state_)) {
        std::cerr << "[Protection] CRITICAL failed to persist protection state to " << store_.path() << std::endl;
    }
}

} // namespace grid
