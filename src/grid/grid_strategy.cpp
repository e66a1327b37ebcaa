#include "grid/grid_strategy.hpp"

#include <chrono>
#include <cmath>
#include <iostream>

namespace grid {
namespace {

constexpr auto kPriceConfirmInterval = std::chrono::seconds(5);

} // namespace

GridStrategy::GridStrategy(MarketGateway& gateway, const BotConfig& config)
    : gateway_(gateway),
      grid_config_(config.grid),
      bar_noise_threshold_pct_(config.protection.bar_noise_threshold_pct),
      max_price_jump_(config.stream.max_price_jump),
      engine_(gateway, config.grid),
      protection_(gateway, config.protection, ProtectionStateStore(config.protection.state_path)),
      signal_(gateway, config.signal),
      ledger_(TradeLedgerConfig{config.grid.ledger_path}),
      price_guard_(config.stream.max_price_jump) {}

void GridStrategy::startup(TimePoint now) {
    try {
        const auto totals = ledger_.load();
        std::cout << "[Ledger] Loaded " << totals.fill_count << " fill(s), notional="
                  << totals.traded_notional << " realizedPnl=" << totals.realized_pnl
                  << " commission=" << totals.commission << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "[Ledger] Failed to load trade ledger: " << ex.what() << std::endl;
    }

    protection_.restore(now);
    signal_.initialize(now);

    try {
        engine_.sync_positions();
        last_position_sync_ = now;
        engine_.sync_pending_orders();
        last_order_sync_ = now;
    } catch (const GatewayError& ex) {
        std::cerr << "[Strategy] Initial snapshot failed, relying on periodic sync: " << ex.what() << std::endl;
    }

    try {
        const auto decision = price_guard_.offer(gateway_.fetch_ticker());
        if (!decision.accepted()) {
            std::cerr << "[Strategy] Seed price rejected: " << decision.reason << std::endl;
        }
    } catch (const GatewayError& ex) {
        std::cerr << "[Strategy] Failed to seed price: " << ex.what() << std::endl;
    }

    log_status();
}

void GridStrategy::on_book_ticker(const BookTickerEvent& event, TimePoint now) {
    if (stopped_) {
        return;
    }
    if (event.best_bid <= 0.0 || event.best_ask <= 0.0) {
        std::cerr << "[Strategy] Ignoring book ticker with bid=" << event.best_bid
                  << " ask=" << event.best_ask << std::endl;
        return;
    }

    const double mid = (event.best_bid + event.best_ask) / 2.0;
    const auto decision = price_guard_.offer(mid);
    if (!decision.accepted()) {
        std::cerr << "[Strategy] Price " << mid << " rejected: " << decision.reason << std::endl;
        confirm_price_level(mid, now);
        return;
    }
    engine_.set_book_top(event.best_bid, event.best_ask);

    if (last_tick_ && now - *last_tick_ < std::chrono::milliseconds(grid_config_.tick_interval_ms)) {
        return;
    }
    last_tick_ = now;

    on_price(mid, now);
}

// A genuine gap would otherwise be rejected forever; the REST ticker decides
// whether the stream or the stored reference is stale.
void GridStrategy::confirm_price_level(double rejected, TimePoint now) {
    if (last_price_confirm_ && now - *last_price_confirm_ < kPriceConfirmInterval) {
        return;
    }
    last_price_confirm_ = now;

    try {
        const double rest_price = gateway_.fetch_ticker();
        if (rest_price > 0.0 && std::fabs(rest_price - rejected) / rest_price <= max_price_jump_) {
            std::cout << "[Strategy] Ticker " << rest_price << " confirms new level; re-anchoring at "
                      << rejected << std::endl;
            price_guard_.reanchor(rejected);
        }
    } catch (const GatewayError& ex) {
        std::cerr << "[Strategy] Price confirmation failed: " << ex.what() << std::endl;
    }
}

void GridStrategy::on_price(double price, TimePoint now) {
    protection_.on_price(price, now);

    if (protection_.hibernating()) {
        if (!protection_.evaluate_hibernation_end(now)) {
            return;
        }
        resync_after_hibernation(now);
    }

    if (protection_.is_extreme()) {
        const auto outcome = protection_.trigger_emergency(price, now, engine_.book_top());
        if (outcome.activated) {
            engine_.reset_exposure();
        }
        return;
    }

    run_periodic_sync(now);

    if (const auto adjustment = signal_.refresh(now)) {
        engine_.apply_spacing_adjustment(*adjustment);
    }

    engine_.adjust(price, now);
}

void GridStrategy::run_periodic_sync(TimePoint now) {
    if (!last_position_sync_ ||
        now - *last_position_sync_ > std::chrono::seconds(grid_config_.position_sync_interval_s)) {
        try {
            engine_.sync_positions();
            const auto positions = engine_.positions();
            std::cout << "[Strategy] Position sync: long=" << positions.long_qty
                      << " short=" << positions.short_qty << std::endl;
        } catch (const GatewayError& ex) {
            std::cerr << "[Strategy] Position sync failed: " << ex.what() << std::endl;
        }
        last_position_sync_ = now;
    }

    if (!last_order_sync_ ||
        now - *last_order_sync_ > std::chrono::seconds(grid_config_.order_sync_interval_s)) {
        try {
            engine_.sync_pending_orders();
        } catch (const GatewayError& ex) {
            std::cerr << "[Strategy] Order sync failed: " << ex.what() << std::endl;
        }
        last_order_sync_ = now;
    }
}

void GridStrategy::resync_after_hibernation(TimePoint now) {
    std::cout << "[Strategy] Resuming grid after hibernation" << std::endl;
    try {
        engine_.sync_positions();
        engine_.sync_pending_orders();
        last_position_sync_ = now;
        last_order_sync_ = now;
    } catch (const GatewayError& ex) {
        std::cerr << "[Strategy] Resync after hibernation failed: " << ex.what() << std::endl;
    }
}

void GridStrategy::on_kline(const KlineEvent& event, TimePoint now) {
    if (stopped_ || !event.closed) {
        return;
    }
    const auto bar = make_kline_bar(event.candle.open, event.candle.high, event.candle.low,
                                    event.candle.close, event.candle.volume,
                                    TimePoint{std::chrono::milliseconds(event.candle.open_time_ms)},
                                    bar_noise_threshold_pct_);
    protection_.on_bar(bar, now);
}

void GridStrategy::on_order_update(const OrderUpdate& update) {
    std::lock_guard<std::mutex> lock(order_mutex_);

    if (update.execution_type == "TRADE" && update.last_filled_qty > 0.0) {
        record_fill(update);
    }

    const auto effect = engine_.apply_order_update(update);
    std::cout << "[Strategy] Order " << update.order_id << " " << to_string(update.side) << " "
              << to_string(update.position_side) << " -> " << to_string(update.status)
              << " filled=" << update.cum_filled_qty << "/" << update.orig_qty << std::endl;

    if (!effect.terminal && !effect.needs_position_sync) {
        return;
    }

    try {
        if (effect.terminal) {
            engine_.sync_pending_orders();
        }
        if (effect.needs_position_sync) {
            engine_.sync_positions();
        }
    } catch (const GatewayError& ex) {
        std::cerr << "[Strategy] Resync after order update failed: " << ex.what() << std::endl;
    }
}

void GridStrategy::record_fill(const OrderUpdate& update) {
    try {
        ledger_.append(fill_from_update(update));
    } catch (const std::exception& ex) {
        std::cerr << "[Ledger] Failed to record fill for order " << update.order_id << ": " << ex.what() << std::endl;
    }
}

void GridStrategy::evaluate_hibernation(TimePoint now) {
    if (stopped_ || !protection_.hibernating()) {
        return;
    }
    if (protection_.evaluate_hibernation_end(now)) {
        resync_after_hibernation(now);
    }
}

void GridStrategy::add_shutdown_hook(std::function<void()> hook) {
    shutdown_hooks_.push_back(std::move(hook));
}

void GridStrategy::stop() {
    shutdown_flight_.try_run([this]() {
        if (stopped_.exchange(true)) {
            return;
        }
        std::cout << "[Strategy] Shutting down; resting orders and positions are left in place" << std::endl;
        log_status();
        for (auto& hook : shutdown_hooks_) {
            try {
                hook();
            } catch (const std::exception& ex) {
                std::cerr << "[Strategy] Shutdown step failed: " << ex.what() << std::endl;
            }
        }
    });
}

void GridStrategy::log_status() const {
    const auto positions = engine_.positions();
    const auto counters = engine_.counters();
    const auto state = protection_.status();
    std::cout << "[Strategy] Status: long=" << positions.long_qty << " short=" << positions.short_qty
              << " pending(buyLong=" << counters.buy_long << ", sellLong=" << counters.sell_long
              << ", sellShort=" << counters.sell_short << ", buyShort=" << counters.buy_short << ")"
              << " protection=" << (state.protection_active ? "hibernating" : "normal")
              << " run=" << to_string(state.direction) << "/" << state.consecutive_bars
              << " " << state.cumulative_change_pct << "%" << std::endl;
}

} // namespace grid
