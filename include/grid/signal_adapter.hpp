#pragma once

#include "grid/config.hpp"
#include "grid/grid_engine.hpp"
#include "grid/market_gateway.hpp"
#include "grid/types.hpp"

#include <optional>
#include <vector>

namespace grid {

enum class TrendSignal { Ranging, StrongUp, StrongDown };

const char* to_string(TrendSignal signal) noexcept;

struct SignalSnapshot {
    TrendSignal signal = TrendSignal::Ranging;
    bool sufficient_data = false;
    double confidence = 0.0;     // 0..100, zero when ranging
    double adx = 0.0;
    double plus_di = 0.0;
    double minus_di = 0.0;
    double ema_short = 0.0;
    double ema_medium = 0.0;
    double ema_long = 0.0;
};

// Classifies the last bar of the series. Fewer than config.min_bars() candles
// yields Ranging with sufficient_data = false.
SignalSnapshot classify_trend(const std::vector<Candle>& candles, const SignalConfig& config);

// Trend-favoured side keeps its spacing; the counter-trend side is widened.
SpacingAdjustment multipliers_for(TrendSignal signal, double counter_trend_multiplier);

class SignalAdapter {
public:
    SignalAdapter(MarketGateway& gateway, SignalConfig config);

    // Seeds the current classification without emitting an adjustment.
    void initialize(TimePoint now);

    bool due(TimePoint now) const;

    // Recomputes when due; returns multipliers only when the classification changed.
    std::optional<SpacingAdjustment> refresh(TimePoint now);

    TrendSignal current() const noexcept { return current_; }
    const std::optional<SignalSnapshot>& last_snapshot() const noexcept { return last_snapshot_; }

private:
    std::optional<SignalSnapshot> compute();

    MarketGateway& gateway_;
    SignalConfig config_;
    TrendSignal current_ = TrendSignal::Ranging;
    std::optional<SignalSnapshot> last_snapshot_;
    std::optional<TimePoint> last_refresh_;
};

} // namespace grid
