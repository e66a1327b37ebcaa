#include "grid/grid_engine.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace grid {
namespace {

constexpr double kEpsilon = 1e-9;

void add_to(double& counter, double quantity) {
    counter = std::max(0.0, counter + quantity);
}

double& counter_for(PendingOrderCounters& counters, PositionSide side, OrderRole role) {
    if (side == PositionSide::Long) {
        return role == OrderRole::Entry ? counters.buy_long : counters.sell_long;
    }
    return role == OrderRole::Entry ? counters.sell_short : counters.buy_short;
}

} // namespace

std::optional<std::pair<PositionSide, OrderRole>> classify_order(OrderSide side,
                                                                PositionSide position_side,
                                                                bool reduce_only) {
    if (side == entry_side(position_side) && !reduce_only) {
        return std::make_pair(position_side, OrderRole::Entry);
    }
    if (side == exit_side(position_side) && reduce_only) {
        return std::make_pair(position_side, OrderRole::TakeProfit);
    }
    return std::nullopt;
}

PendingOrderCounters derive_counters(const std::vector<OpenOrder>& orders) {
    PendingOrderCounters counters;
    for (const auto& order : orders) {
        const auto role = classify_order(order.side, order.position_side, order.reduce_only);
        if (!role) {
            continue;
        }
        add_to(counter_for(counters, role->first, role->second), order.orig_qty);
    }
    return counters;
}

GridEngine::GridEngine(MarketGateway& gateway, GridConfig config)
    : gateway_(gateway),
      config_(std::move(config)),
      long_spacing_{config_.grid_spacing, config_.grid_spacing},
      short_spacing_{config_.grid_spacing, config_.grid_spacing} {}

bool GridEngine::adjust(double latest_price, TimePoint now) {
    if (latest_price <= 0.0) {
        return false;
    }
    try {
        reduce_opposite_exposure(latest_price);
        adjust_side(PositionSide::Long, latest_price, now);
        adjust_side(PositionSide::Short, latest_price, now);
        return true;
    } catch (const GatewayError& ex) {
        std::cerr << "[Grid] Gateway error, cycle abandoned: " << ex.what() << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "[Grid] Unexpected error, cycle abandoned: " << ex.what() << std::endl;
    }
    return false;
}

void GridEngine::sync_pending_orders() {
    const auto orders = gateway_.fetch_open_orders();
    const auto fresh = derive_counters(orders);
    std::lock_guard<std::mutex> lock(state_mutex_);
    counters_ = fresh;
    counted_at_placement_.clear();
}

void GridEngine::sync_positions() {
    const auto snapshot = gateway_.fetch_position();
    std::lock_guard<std::mutex> lock(state_mutex_);
    positions_.long_qty = std::max(0.0, snapshot.long_qty);
    positions_.short_qty = std::max(0.0, snapshot.short_qty);
    reduction_in_flight_ = false;
}

void GridEngine::cancel_side(PositionSide side) {
    const auto orders = gateway_.fetch_open_orders();
    bool failed = false;
    for (const auto& order : orders) {
        const auto role = classify_order(order.side, order.position_side, order.reduce_only);
        if (!role || role->first != side) {
            continue;
        }
        try {
            gateway_.cancel_order(order.order_id);
        } catch (const GatewayError& ex) {
            std::cerr << "[Grid] Failed to cancel " << to_string(side) << " order "
                      << order.order_id << ": " << ex.what() << std::endl;
            failed = true;
        }
    }

    if (failed) {
        std::cerr << "[Grid] Cancellation incomplete; resyncing open orders" << std::endl;
        sync_pending_orders();
    }
}

double GridEngine::take_profit_quantity(double position, PositionSide /*side*/) const {
    const double cap = position > config_.position_limit
                       ? config_.base_quantity * 2.0
                       : config_.base_quantity;
    return std::min(position, cap);
}

void GridEngine::adjust_side(PositionSide side, double latest_price, TimePoint now) {
    const double position = position_of(side);
    if (position <= kEpsilon) {
        place_entry_order(side, latest_price, now);
        return;
    }

    const double quantity = take_profit_quantity(position, side);
    if (counters_consistent(side, quantity)) {
        return;
    }

    if (position < config_.position_threshold) {
        sync_pending_orders();
        if (counters_consistent(side, quantity)) {
            return;
        }
    }

    place_side_orders(side, latest_price, position, quantity);
}

void GridEngine::reduce_opposite_exposure(double latest_price) {
    Positions current;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (reduction_in_flight_) {
            return;
        }
        current = positions_;
    }
    if (current.long_qty <= config_.position_threshold || current.short_qty <= config_.position_threshold) {
        return;
    }

    const double quantity = std::min(current.long_qty, current.short_qty) * config_.reduce_fraction;
    std::cout << "[Grid] Both sides above threshold (long=" << current.long_qty
              << ", short=" << current.short_qty << "); reducing " << quantity << " on each side" << std::endl;

    {
        // Positions stay stale until the next resync; hold the valve until then.
        std::lock_guard<std::mutex> lock(state_mutex_);
        reduction_in_flight_ = true;
    }
    place_order(OrderSide::Sell, latest_price * (1.0 - config_.reduce_offset), quantity, true,
                PositionSide::Long, "exposure reduction");
    place_order(OrderSide::Buy, latest_price * (1.0 + config_.reduce_offset), quantity, true,
                PositionSide::Short, "exposure reduction");
}

OrderUpdateEffect GridEngine::apply_order_update(const OrderUpdate& update) {
    OrderUpdateEffect effect;
    const auto role = classify_order(update.side, update.position_side, update.reduce_only);

    std::lock_guard<std::mutex> lock(state_mutex_);
    const bool counted_at_placement = counted_at_placement_.erase(update.order_id) > 0;
    switch (update.status) {
        case OrderStatus::New:
            if (role && !counted_at_placement) {
                add_to(counter_for(counters_, role->first, role->second), update.remaining_qty());
            }
            break;

        case OrderStatus::Filled: {
            const double filled = update.cum_filled_qty;
            if (update.position_side == PositionSide::Long) {
                add_to(positions_.long_qty, update.side == OrderSide::Buy ? filled : -filled);
            } else {
                add_to(positions_.short_qty, update.side == OrderSide::Sell ? filled : -filled);
            }
            if (role) {
                add_to(counter_for(counters_, role->first, role->second), -filled);
            }
            effect.needs_position_sync = true;
            break;
        }

        case OrderStatus::Canceled:
        case OrderStatus::Expired:
        case OrderStatus::Rejected:
            if (role && (update.status != OrderStatus::Rejected || counted_at_placement)) {
                add_to(counter_for(counters_, role->first, role->second), -update.remaining_qty());
            }
            // Partial fills before cancellation only reach the position through a resync.
            effect.needs_position_sync = update.cum_filled_qty > kEpsilon;
            break;

        case OrderStatus::PartiallyFilled:
        case OrderStatus::Unknown:
            break;
    }

    effect.terminal = is_terminal(update.status);
    return effect;
}

void GridEngine::set_book_top(double best_bid, double best_ask) {
    best_bid_ = best_bid;
    best_ask_ = best_ask;
}

BookTop GridEngine::book_top() const {
    return BookTop{best_bid_, best_ask_};
}

void GridEngine::apply_spacing_adjustment(const SpacingAdjustment& adjustment) {
    long_spacing_.replenish *= adjustment.long_replenish;
    long_spacing_.take_profit *= adjustment.long_take_profit;
    short_spacing_.replenish *= adjustment.short_replenish;
    short_spacing_.take_profit *= adjustment.short_take_profit;
    std::cout << "[Grid] Spacing now long(" << long_spacing_.replenish << ", " << long_spacing_.take_profit
              << ") short(" << short_spacing_.replenish << ", " << short_spacing_.take_profit << ")" << std::endl;
}

void GridEngine::reset_spacings() {
    long_spacing_ = {config_.grid_spacing, config_.grid_spacing};
    short_spacing_ = {config_.grid_spacing, config_.grid_spacing};
}

void GridEngine::reset_exposure() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    positions_ = {};
    counters_ = {};
    counted_at_placement_.clear();
    reduction_in_flight_ = false;
}

Positions GridEngine::positions() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return positions_;
}

PendingOrderCounters GridEngine::counters() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return counters_;
}

SideSpacing GridEngine::spacing(PositionSide side) const {
    return side == PositionSide::Long ? long_spacing_ : short_spacing_;
}

std::optional<GridBounds> GridEngine::last_bounds(PositionSide side) const {
    return side == PositionSide::Long ? long_bounds_ : short_bounds_;
}

GridBounds GridEngine::compute_bounds(PositionSide side, double latest_price) {
    GridBounds bounds;
    bounds.mid = latest_price;
    if (side == PositionSide::Long) {
        bounds.lower = latest_price * (1.0 - long_spacing_.replenish);
        bounds.upper = latest_price * (1.0 + long_spacing_.take_profit);
        long_bounds_ = bounds;
    } else {
        bounds.lower = latest_price * (1.0 - short_spacing_.take_profit);
        bounds.upper = latest_price * (1.0 + short_spacing_.replenish);
        short_bounds_ = bounds;
    }
    return bounds;
}

bool GridEngine::counters_consistent(PositionSide side, double quantity) const {
    const double entry = entry_counter(side);
    const double take_profit = take_profit_counter(side);
    const auto within = [quantity](double value) {
        return value > kEpsilon && value <= quantity + kEpsilon;
    };
    return within(entry) && within(take_profit);
}

void GridEngine::place_entry_order(PositionSide side, double latest_price, TimePoint now) {
    auto& last_entry = side == PositionSide::Long ? last_long_entry_ : last_short_entry_;
    if (last_entry && now - *last_entry < std::chrono::seconds(config_.order_first_time_s)) {
        return;
    }
    last_entry = now;

    cancel_side(side);

    double price = side == PositionSide::Long ? best_bid_ : best_ask_;
    if (price <= 0.0) {
        price = latest_price;
    }
    place_order(entry_side(side), price, config_.base_quantity, false, side, "entry");
}

void GridEngine::place_side_orders(PositionSide side, double latest_price, double position, double quantity) {
    if (position > config_.position_threshold) {
        place_conservative_take_profit(side, latest_price, position, quantity);
        return;
    }

    const auto bounds = compute_bounds(side, latest_price);
    cancel_side(side);

    if (side == PositionSide::Long) {
        place_order(OrderSide::Sell, bounds.upper, quantity, true, side, "take-profit");
        place_order(OrderSide::Buy, bounds.lower, quantity, false, side, "replenish");
    } else {
        place_order(OrderSide::Buy, bounds.lower, quantity, true, side, "take-profit");
        place_order(OrderSide::Sell, bounds.upper, quantity, false, side, "replenish");
    }
}

void GridEngine::place_conservative_take_profit(PositionSide side, double latest_price,
                                                double position, double quantity) {
    if (take_profit_counter(side) > kEpsilon) {
        return;
    }

    const double opposing = position_of(opposite(side));
    const double ratio = position / std::max(opposing, 1.0) / 100.0 + 1.0;
    const double price = side == PositionSide::Long ? latest_price * ratio : latest_price / ratio;

    std::cout << "[Grid] " << to_string(side) << " position " << position
              << " above threshold; skewed take-profit ratio " << ratio << std::endl;
    place_order(exit_side(side), price, quantity, true, side, "conservative take-profit");
}

void GridEngine::place_order(OrderSide side, double price, double quantity, bool reduce_only,
                             PositionSide position_side, const char* label) {
    if (price <= 0.0 || quantity <= 0.0) {
        return;
    }

    OrderRequest request;
    request.side = side;
    request.price = price;
    request.quantity = quantity;
    request.reduce_only = reduce_only;
    request.position_side = position_side;
    request.type = OrderType::Limit;

    const auto placed = gateway_.place_order(request);
    const auto role = classify_order(side, position_side, reduce_only);
    if (role && !is_terminal(placed.status)) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        add_to(counter_for(counters_, role->first, role->second), gateway_.round_quantity(quantity));
        counted_at_placement_.insert(placed.order_id);
    }
    std::cout << "[Grid] Placed " << label << " " << to_string(side) << " " << to_string(position_side)
              << " id=" << placed.order_id << " price=" << gateway_.round_price(price)
              << " qty=" << gateway_.round_quantity(quantity) << std::endl;
}

double GridEngine::position_of(PositionSide side) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return side == PositionSide::Long ? positions_.long_qty : positions_.short_qty;
}

double GridEngine::entry_counter(PositionSide side) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return side == PositionSide::Long ? counters_.buy_long : counters_.sell_short;
}

double GridEngine::take_profit_counter(PositionSide side) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return side == PositionSide::Long ? counters_.sell_long : counters_.buy_short;
}

} // namespace grid
