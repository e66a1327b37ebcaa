#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace grid {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class OrderSide { Buy, Sell };
enum class PositionSide { Long, Short };
enum class OrderType { Limit, Market };

enum class OrderStatus {
    New,
    PartiallyFilled,
    Filled,
    Canceled,
    Expired,
    Rejected,
    Unknown
};

enum class TrendDirection { Neutral, Up, Down };

const char* to_string(OrderSide side) noexcept;
const char* to_string(PositionSide side) noexcept;
const char* to_string(OrderType type) noexcept;
const char* to_string(OrderStatus status) noexcept;
const char* to_string(TrendDirection direction) noexcept;

std::optional<OrderSide> parse_order_side(const std::string& text);
std::optional<PositionSide> parse_position_side(const std::string& text);
OrderStatus parse_order_status(const std::string& text);
TrendDirection parse_trend_direction(const std::string& text);

bool is_terminal(OrderStatus status) noexcept;

// Direction of an order that opens (adds to) the given position side.
constexpr OrderSide entry_side(PositionSide side) noexcept {
    return side == PositionSide::Long ? OrderSide::Buy : OrderSide::Sell;
}

// Direction of an order that closes (reduces) the given position side.
constexpr OrderSide exit_side(PositionSide side) noexcept {
    return side == PositionSide::Long ? OrderSide::Sell : OrderSide::Buy;
}

constexpr PositionSide opposite(PositionSide side) noexcept {
    return side == PositionSide::Long ? PositionSide::Short : PositionSide::Long;
}

struct OrderRequest {
    OrderSide side = OrderSide::Buy;
    std::optional<double> price;   // empty for market orders
    double quantity = 0.0;
    bool reduce_only = false;
    PositionSide position_side = PositionSide::Long;
    OrderType type = OrderType::Limit;
};

struct PlacedOrder {
    std::string order_id;
    std::string client_order_id;
    OrderStatus status = OrderStatus::New;
};

struct OpenOrder {
    std::string order_id;
    OrderSide side = OrderSide::Buy;
    PositionSide position_side = PositionSide::Long;
    bool reduce_only = false;
    double price = 0.0;
    double orig_qty = 0.0;
};

struct PositionSnapshot {
    double long_qty = 0.0;
    double short_qty = 0.0;
};

// Zero means the side of the book is unknown.
struct BookTop {
    double best_bid = 0.0;
    double best_ask = 0.0;
};

struct Candle {
    int64_t open_time_ms = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

// Hedge-mode orders that close their position side are reduce-only by nature,
// whatever flag the exchange echoes back.
constexpr bool closes_position(OrderSide side, PositionSide position_side) noexcept {
    return side == exit_side(position_side);
}

// Decoded ORDER_TRADE_UPDATE payload.
struct OrderUpdate {
    std::string symbol;
    std::string order_id;
    std::string client_order_id;
    OrderSide side = OrderSide::Buy;
    PositionSide position_side = PositionSide::Long;
    OrderStatus status = OrderStatus::Unknown;
    std::string execution_type;          // NEW, TRADE, CANCELED, EXPIRED, ...
    bool reduce_only = false;
    double price = 0.0;
    double orig_qty = 0.0;
    double cum_filled_qty = 0.0;
    double last_filled_qty = 0.0;
    double last_filled_price = 0.0;
    double realized_pnl = 0.0;
    double commission = 0.0;
    std::string commission_asset;
    bool is_maker = false;
    long long trade_id = 0;
    int64_t event_time_ms = 0;

    double remaining_qty() const { return orig_qty > cum_filled_qty ? orig_qty - cum_filled_qty : 0.0; }
};

} // namespace grid
