#pragma once

#include "grid/config.hpp"
#include "grid/market_gateway.hpp"
#include "grid/types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace grid {

struct PendingOrderCounters {
    double buy_long = 0.0;     // long entry
    double sell_long = 0.0;    // long take-profit
    double sell_short = 0.0;   // short entry
    double buy_short = 0.0;    // short take-profit
};

struct Positions {
    double long_qty = 0.0;
    double short_qty = 0.0;
};

struct GridBounds {
    double mid = 0.0;
    double lower = 0.0;
    double upper = 0.0;
};

struct SideSpacing {
    double replenish = 0.0;
    double take_profit = 0.0;
};

// Multipliers applied on top of the current spacings.
struct SpacingAdjustment {
    double long_replenish = 1.0;
    double long_take_profit = 1.0;
    double short_replenish = 1.0;
    double short_take_profit = 1.0;
};

enum class OrderRole { Entry, TakeProfit };

std::optional<std::pair<PositionSide, OrderRole>> classify_order(OrderSide side,
                                                                PositionSide position_side,
                                                                bool reduce_only);

// Counters rebuilt from scratch out of an open-order list.
PendingOrderCounters derive_counters(const std::vector<OpenOrder>& orders);

struct OrderUpdateEffect {
    bool terminal = false;
    bool needs_position_sync = false;
};

class GridEngine {
public:
    GridEngine(MarketGateway& gateway, GridConfig config);

    // One full adjustment cycle: exposure valve, then long, then short.
    // Gateway failures are logged and abandon the cycle; returns false then.
    bool adjust(double latest_price, TimePoint now);

    // Both replace local state with the gateway snapshot. Orders counted at
    // placement are forgotten by the order resync; the exposure valve re-arms
    // on the position resync.
    void sync_pending_orders();
    void sync_positions();
    void cancel_side(PositionSide side);
    double take_profit_quantity(double position, PositionSide side) const;
    void adjust_side(PositionSide side, double latest_price, TimePoint now);
    void reduce_opposite_exposure(double latest_price);

    OrderUpdateEffect apply_order_update(const OrderUpdate& update);

    void set_book_top(double best_bid, double best_ask);
    BookTop book_top() const;
    void apply_spacing_adjustment(const SpacingAdjustment& adjustment);
    void reset_spacings();
    // Forget local exposure after the account was flattened externally.
    void reset_exposure();

    Positions positions() const;
    PendingOrderCounters counters() const;
    SideSpacing spacing(PositionSide side) const;
    std::optional<GridBounds> last_bounds(PositionSide side) const;

private:
    GridBounds compute_bounds(PositionSide side, double latest_price);
    bool counters_consistent(PositionSide side, double quantity) const;
    void place_entry_order(PositionSide side, double latest_price, TimePoint now);
    void place_side_orders(PositionSide side, double latest_price, double position, double quantity);
    void place_conservative_take_profit(PositionSide side, double latest_price, double position, double quantity);
    void place_order(OrderSide side, double price, double quantity, bool reduce_only,
                     PositionSide position_side, const char* label);

    double position_of(PositionSide side) const;
    double entry_counter(PositionSide side) const;
    double take_profit_counter(PositionSide side) const;

    MarketGateway& gateway_;
    GridConfig config_;
    SideSpacing long_spacing_;
    SideSpacing short_spacing_;
    std::optional<GridBounds> long_bounds_;
    std::optional<GridBounds> short_bounds_;
    double best_bid_ = 0.0;
    double best_ask_ = 0.0;
    std::optional<TimePoint> last_long_entry_;
    std::optional<TimePoint> last_short_entry_;

    mutable std::mutex state_mutex_;
    Positions positions_;
    PendingOrderCounters counters_;
    // Placed orders already in counters_, so their NEW event is not added twice.
    std::unordered_set<std::string> counted_at_placement_;
    bool reduction_in_flight_ = false;
};

} // namespace grid
