#pragma once

#include "grid/config.hpp"
#include "grid/market_gateway.hpp"
#include "grid/protection_state_store.hpp"
#include "grid/single_flight.hpp"
#include "grid/types.hpp"
#include "grid/volatility_tracker.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace grid {

struct KlineBar {
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    TimePoint timestamp{};
    TrendDirection direction = TrendDirection::Neutral;
    double change_pct = 0.0;
};

// Direction is up/down only when |change| exceeds noise_threshold_pct.
KlineBar make_kline_bar(double open, double high, double low, double close, double volume,
                        TimePoint timestamp, double noise_threshold_pct = 0.1);

enum class ProtectionMode { Normal, Hibernating };

struct EmergencyOutcome {
    bool started = false;      // false when another emergency was already running
    bool cancelled = false;
    bool flattened = false;
    bool activated = false;
};

class ExtremeProtection {
public:
    ExtremeProtection(MarketGateway& gateway, ProtectionConfig config, ProtectionStateStore store);

    // Resumes persisted run/hibernation state, if any.
    void restore(TimePoint now);

    void on_bar(const KlineBar& bar, TimePoint now);
    void on_price(double price, TimePoint now);

    bool is_extreme() const;
    bool hibernating() const;
    ProtectionMode mode() const;

    // Returns true when this call ended hibernation.
    bool evaluate_hibernation_end(TimePoint now);

    // Cancel everything, flatten both sides, then hibernate. Protection only
    // becomes active when both steps fully succeed. Close orders are priced
    // through the touch; reference_price stands in for an unknown side.
    EmergencyOutcome trigger_emergency(double reference_price, TimePoint now, const BookTop& book = {});

    ProtectionState status() const;
    double current_volatility() const;
    void force_reset(TimePoint now);

    static bool volatility_recovered(double current, double baseline, double multiplier);

private:
    bool cancel_all_orders();
    bool flatten_positions(double reference_price, const BookTop& book);
    bool close_side(PositionSide side, double quantity, double price);
    bool wait_for_fill(const std::string& order_id);
    void reset_run_locked();
    void persist_locked(TimePoint now);

    MarketGateway& gateway_;
    ProtectionConfig config_;
    ProtectionStateStore store_;
    VolatilityTracker volatility_;
    SingleFlight emergency_flight_;

    mutable std::mutex mutex_;
    ProtectionState state_;
    std::optional<TimePoint> last_recovery_log_;
};

} // namespace grid
