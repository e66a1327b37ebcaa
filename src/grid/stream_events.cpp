#include "grid/stream_events.hpp"

#include "grid/json_fields.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace grid {

namespace {

StreamEvent decode_book_ticker(const nlohmann::json& json) {
    BookTickerEvent event;
    event.symbol = get_string_optional(json, "s");
    event.best_bid = get_double_optional(json, "b");
    event.best_ask = get_double_optional(json, "a");
    event.event_time_ms = get_id_optional(json, "E");
    return event;
}

StreamEvent decode_kline(const nlohmann::json& json) {
    if (!json.contains("k") || !json["k"].is_object()) {
        return std::monostate{};
    }
    const auto& k = json["k"];
    KlineEvent event;
    event.symbol = get_string_optional(json, "s");
    if (event.symbol.empty()) {
        event.symbol = get_string_optional(k, "s");
    }
    event.interval = get_string_optional(k, "i");
    event.candle.open_time_ms = get_id_optional(k, "t");
    event.candle.open = get_double_optional(k, "o");
    event.candle.high = get_double_optional(k, "h");
    event.candle.low = get_double_optional(k, "l");
    event.candle.close = get_double_optional(k, "c");
    event.candle.volume = get_double_optional(k, "v");
    event.closed = get_bool_optional(k, "x");
    return event;
}

StreamEvent decode_order_update(const nlohmann::json& json) {
    if (!json.contains("o") || !json["o"].is_object()) {
        return std::monostate{};
    }
    const auto& o = json["o"];

    const auto side = parse_order_side(get_string_optional(o, "S"));
    const auto position_side = parse_position_side(get_string_optional(o, "ps"));
    if (!side) {
        std::cerr << "[WS] Order update without a usable side: " << o.dump() << std::endl;
        return std::monostate{};
    }
    if (!position_side) {
        // BOTH means one-way mode, which the grid never trades in.
        std::cerr << "[WS] Ignoring order update with positionSide="
                  << get_string_optional(o, "ps") << std::endl;
        return std::monostate{};
    }

    OrderUpdate update;
    update.symbol = get_string_optional(o, "s");
    update.order_id = get_string_optional(o, "i");
    update.client_order_id = get_string_optional(o, "c");
    update.side = *side;
    update.position_side = *position_side;
    update.status = parse_order_status(get_string_optional(o, "X"));
    update.execution_type = get_string_optional(o, "x");
    update.reduce_only = get_bool_optional(o, "R") || closes_position(*side, *position_side);
    update.price = get_double_optional(o, "p");
    update.orig_qty = get_double_optional(o, "q");
    update.cum_filled_qty = get_double_optional(o, "z");
    update.last_filled_qty = get_double_optional(o, "l");
    update.last_filled_price = get_double_optional(o, "L");
    if (update.price <= 0.0) {
        update.price = get_double_optional(o, "ap");
    }
    update.realized_pnl = get_double_optional(o, "rp");
    update.commission = get_double_optional(o, "n");
    update.commission_asset = get_string_optional(o, "N");
    update.is_maker = get_bool_optional(o, "m");
    update.trade_id = get_id_optional(o, "t");
    update.event_time_ms = get_id_optional(o, "T");
    if (update.event_time_ms == 0) {
        update.event_time_ms = get_id_optional(json, "E");
    }
    return update;
}

const std::string& event_symbol(const StreamEvent& event) {
    static const std::string empty;
    if (const auto* book = std::get_if<BookTickerEvent>(&event)) {
        return book->symbol;
    }
    if (const auto* kline = std::get_if<KlineEvent>(&event)) {
        return kline->symbol;
    }
    if (const auto* update = std::get_if<OrderUpdate>(&event)) {
        return update->symbol;
    }
    return empty;
}

} // namespace

StreamEvent decode_stream_message(const std::string& message, const std::string& symbol) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(message);
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[WS] Failed to parse frame: " << ex.what() << std::endl;
        return std::monostate{};
    }

    if (json.is_object() && json.contains("stream") && json.contains("data")) {
        json = json["data"];
    }
    if (!json.is_object()) {
        return std::monostate{};
    }

    const auto type = get_string_optional(json, "e");
    StreamEvent event;
    if (type == "bookTicker") {
        event = decode_book_ticker(json);
    } else if (type == "kline") {
        event = decode_kline(json);
    } else if (type == "ORDER_TRADE_UPDATE") {
        event = decode_order_update(json);
    } else if (type == "listenKeyExpired") {
        return ListenKeyExpiredEvent{get_id_optional(json, "E")};
    } else if (type.empty() && json.contains("b") && json.contains("a") && json.contains("s")) {
        event = decode_book_ticker(json);
    } else {
        return std::monostate{};
    }

    const auto& event_sym = event_symbol(event);
    if (!event_sym.empty() && event_sym != symbol) {
        return std::monostate{};
    }
    return event;
}

} // namespace grid
