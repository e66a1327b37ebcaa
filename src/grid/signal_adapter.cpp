#include "grid/signal_adapter.hpp"

#include "grid/indicators.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace grid {
namespace {

double finite_or_zero(double value) {
    return std::isfinite(value) ? value : 0.0;
}

} // namespace

const char* to_string(TrendSignal signal) noexcept {
    switch (signal) {
        case TrendSignal::StrongUp: return "strong uptrend";
        case TrendSignal::StrongDown: return "strong downtrend";
        case TrendSignal::Ranging: break;
    }
    return "ranging";
}

SignalSnapshot classify_trend(const std::vector<Candle>& candles, const SignalConfig& config) {
    SignalSnapshot snapshot;
    if (candles.size() < static_cast<std::size_t>(config.min_bars()) || candles.size() < 2) {
        return snapshot;
    }
    snapshot.sufficient_data = true;

    std::vector<double> highs;
    std::vector<double> lows;
    std::vector<double> closes;
    highs.reserve(candles.size());
    lows.reserve(candles.size());
    closes.reserve(candles.size());
    for (const auto& candle : candles) {
        highs.push_back(candle.high);
        lows.push_back(candle.low);
        closes.push_back(candle.close);
    }

    const auto ema_short = ema_series(closes, config.ema_short);
    const auto ema_medium = ema_series(closes, config.ema_medium);
    const auto ema_long = ema_series(closes, config.ema_long);
    const auto adx = adx_series(highs, lows, closes, config.adx_period);

    const std::size_t last = closes.size() - 1;
    const double close = closes[last];
    const double fast = ema_short[last];
    const double medium = ema_medium[last];
    const double slow = ema_long[last];
    const double fast_slope = ema_short[last] - ema_short[last - 1];
    const double strength = adx.adx[last];

    snapshot.ema_short = fast;
    snapshot.ema_medium = medium;
    snapshot.ema_long = slow;
    snapshot.adx = finite_or_zero(strength);
    snapshot.plus_di = finite_or_zero(adx.plus_di[last]);
    snapshot.minus_di = finite_or_zero(adx.minus_di[last]);

    // NaN strength compares false, so a series without ADX never trends.
    const bool strong = strength > config.adx_threshold;
    const bool strong_up = close > slow && fast > medium && medium > slow && strong && !(fast_slope < 0.0);
    const bool strong_down = close < slow && fast < medium && medium < slow && strong && !(fast_slope > 0.0);

    if (strong_up) {
        snapshot.signal = TrendSignal::StrongUp;
    } else if (strong_down) {
        snapshot.signal = TrendSignal::StrongDown;
    }

    if (snapshot.signal != TrendSignal::Ranging) {
        snapshot.confidence = std::clamp((snapshot.adx - config.adx_threshold) / config.adx_threshold * 100.0,
                                         0.0, 100.0);
    }
    return snapshot;
}

SpacingAdjustment multipliers_for(TrendSignal signal, double counter_trend_multiplier) {
    SpacingAdjustment adjustment;
    if (signal == TrendSignal::StrongUp) {
        adjustment.short_replenish = counter_trend_multiplier;
        adjustment.short_take_profit = counter_trend_multiplier;
    } else if (signal == TrendSignal::StrongDown) {
        adjustment.long_replenish = counter_trend_multiplier;
        adjustment.long_take_profit = counter_trend_multiplier;
    }
    return adjustment;
}

SignalAdapter::SignalAdapter(MarketGateway& gateway, SignalConfig config)
    : gateway_(gateway),
      config_(std::move(config)) {}

void SignalAdapter::initialize(TimePoint now) {
    last_refresh_ = now;
    const auto snapshot = compute();
    if (!snapshot) {
        return;
    }
    current_ = snapshot->signal;
    std::cout << "[Signal] Initial classification: " << to_string(current_)
              << " (ADX " << snapshot->adx << ")" << std::endl;
}

bool SignalAdapter::due(TimePoint now) const {
    return !last_refresh_ || now - *last_refresh_ >= std::chrono::seconds(config_.refresh_interval_s);
}

std::optional<SpacingAdjustment> SignalAdapter::refresh(TimePoint now) {
    if (!due(now)) {
        return std::nullopt;
    }
    last_refresh_ = now;

    const auto snapshot = compute();
    if (!snapshot || snapshot->signal == current_) {
        return std::nullopt;
    }

    std::cout << "[Signal] Classification changed: " << to_string(current_) << " -> "
              << to_string(snapshot->signal) << " (confidence " << snapshot->confidence
              << "%, ADX " << snapshot->adx << ")" << std::endl;
    current_ = snapshot->signal;
    return multipliers_for(current_, config_.counter_trend_multiplier);
}

std::optional<SignalSnapshot> SignalAdapter::compute() {
    try {
        const auto candles = gateway_.fetch_klines(config_.timeframe, config_.kline_limit);
        auto snapshot = classify_trend(candles, config_);
        if (!snapshot.sufficient_data) {
            std::cerr << "[Signal] Only " << candles.size() << " bars available; need "
                      << config_.min_bars() << std::endl;
            return std::nullopt;
        }
        last_snapshot_ = snapshot;
        return snapshot;
    } catch (const GatewayError& ex) {
        std::cerr << "[Signal] Failed to fetch klines: " << ex.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace grid
