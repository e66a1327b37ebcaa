#include "grid/types.hpp"

namespace grid {

const char* to_string(OrderSide side) noexcept {
    return side == OrderSide::Buy ? "BUY" : "SELL";
}

const char* to_string(PositionSide side) noexcept {
    return side == PositionSide::Long ? "LONG" : "SHORT";
}

const char* to_string(OrderType type) noexcept {
    return type == OrderType::Limit ? "LIMIT" : "MARKET";
}

const char* to_string(OrderStatus status) noexcept {
    switch (status) {
        case OrderStatus::New: return "NEW";
        case OrderStatus::PartiallyFilled: return "PARTIALLY_FILLED";
        case OrderStatus::Filled: return "FILLED";
        case OrderStatus::Canceled: return "CANCELED";
        case OrderStatus::Expired: return "EXPIRED";
        case OrderStatus::Rejected: return "REJECTED";
        case OrderStatus::Unknown: break;
    }
    return "UNKNOWN";
}

const char* to_string(TrendDirection direction) noexcept {
    switch (direction) {
        case TrendDirection::Up: return "up";
        case TrendDirection::Down: return "down";
        case TrendDirection::Neutral: break;
    }
    return "neutral";
}

std::optional<OrderSide> parse_order_side(const std::string& text) {
    if (text == "BUY") {
        return OrderSide::Buy;
    }
    if (text == "SELL") {
        return OrderSide::Sell;
    }
    return std::nullopt;
}

std::optional<PositionSide> parse_position_side(const std::string& text) {
    if (text == "LONG") {
        return PositionSide::Long;
    }
    if (text == "SHORT") {
        return PositionSide::Short;
    }
    return std::nullopt;
}

OrderStatus parse_order_status(const std::string& text) {
    if (text == "NEW") return OrderStatus::New;
    if (text == "PARTIALLY_FILLED") return OrderStatus::PartiallyFilled;
    if (text == "FILLED") return OrderStatus::Filled;
    if (text == "CANCELED") return OrderStatus::Canceled;
    if (text == "EXPIRED" || text == "EXPIRED_IN_MATCH") return OrderStatus::Expired;
    if (text == "REJECTED") return OrderStatus::Rejected;
    return OrderStatus::Unknown;
}

TrendDirection parse_trend_direction(const std::string& text) {
    if (text == "up") {
        return TrendDirection::Up;
    }
    if (text == "down") {
        return TrendDirection::Down;
    }
    return TrendDirection::Neutral;
}

bool is_terminal(OrderStatus status) noexcept {
    return status == OrderStatus::Filled || status == OrderStatus::Canceled ||
           status == OrderStatus::Expired || status == OrderStatus::Rejected;
}

} // namespace grid
