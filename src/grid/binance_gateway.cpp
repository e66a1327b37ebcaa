#include "grid/binance_gateway.hpp"

#include "binance/util.hpp"
#include "grid/json_fields.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace grid {

namespace {

// -4059: "No need to change position side."
constexpr const char* kNoPositionSideChange = "-4059";

nlohmann::json parse_body(const std::string& body) {
    return nlohmann::json::parse(body);
}

} // namespace

SymbolFilters parse_symbol_filters(const std::string& exchange_info_body, const std::string& symbol) {
    const auto json = parse_body(exchange_info_body);
    if (!json.contains("symbols") || !json["symbols"].is_array()) {
        throw GatewayError("exchangeInfo response has no symbols array");
    }

    for (const auto& entry : json["symbols"]) {
        if (get_string_optional(entry, "symbol") != symbol) {
            continue;
        }

        SymbolFilters filters;
        if (entry.contains("filters") && entry["filters"].is_array()) {
            for (const auto& filter : entry["filters"]) {
                const auto type = get_string_optional(filter, "filterType");
                if (type == "PRICE_FILTER") {
                    filters.tick_size = get_double_optional(filter, "tickSize");
                } else if (type == "LOT_SIZE") {
                    filters.step_size = get_double_optional(filter, "stepSize");
                    filters.min_qty = get_double_optional(filter, "minQty");
                }
            }
        }
        if (filters.tick_size <= 0.0 || filters.step_size <= 0.0) {
            throw GatewayError("Missing PRICE_FILTER or LOT_SIZE for " + symbol);
        }
        filters.price_precision = binance::precision_from_step(filters.tick_size);
        filters.quantity_precision = binance::precision_from_step(filters.step_size);
        return filters;
    }

    throw GatewayError("Symbol " + symbol + " not listed in exchangeInfo");
}

std::vector<OpenOrder> parse_open_orders(const std::string& body) {
    const auto json = parse_body(body);
    if (!json.is_array()) {
        throw GatewayError("openOrders response is not an array");
    }

    std::vector<OpenOrder> orders;
    orders.reserve(json.size());
    for (const auto& entry : json) {
        const auto side = parse_order_side(get_string_optional(entry, "side"));
        const auto position_side = parse_position_side(get_string_optional(entry, "positionSide"));
        if (!side || !position_side) {
            std::cerr << "[Gateway] Skipping open order " << get_string_optional(entry, "orderId")
                      << " with side=" << get_string_optional(entry, "side")
                      << " positionSide=" << get_string_optional(entry, "positionSide") << std::endl;
            continue;
        }

        OpenOrder order;
        order.order_id = get_string_optional(entry, "orderId");
        order.side = *side;
        order.position_side = *position_side;
        order.reduce_only = get_bool_optional(entry, "reduceOnly") || closes_position(*side, *position_side);
        order.price = get_double_optional(entry, "price");
        order.orig_qty = get_double_optional(entry, "origQty");
        orders.push_back(std::move(order));
    }
    return orders;
}

PositionSnapshot parse_position_risk(const std::string& body, const std::string& symbol) {
    const auto json = parse_body(body);
    if (!json.is_array()) {
        throw GatewayError("positionRisk response is not an array");
    }

    PositionSnapshot snapshot;
    for (const auto& entry : json) {
        if (get_string_optional(entry, "symbol") != symbol) {
            continue;
        }
        const double amount = get_double_optional(entry, "positionAmt");
        const auto side = get_string_optional(entry, "positionSide");
        if (side == "LONG") {
            snapshot.long_qty = std::abs(amount);
        } else if (side == "SHORT") {
            snapshot.short_qty = std::abs(amount);
        }
    }
    return snapshot;
}

std::vector<Candle> parse_klines(const std::string& body) {
    const auto json = parse_body(body);
    if (!json.is_array()) {
        throw GatewayError("klines response is not an array");
    }

    std::vector<Candle> candles;
    candles.reserve(json.size());
    for (const auto& row : json) {
        if (!row.is_array() || row.size() < 6) {
            continue;
        }
        Candle candle;
        candle.open_time_ms = parse_id_optional(row[0]);
        candle.open = parse_double_optional(row[1]);
        candle.high = parse_double_optional(row[2]);
        candle.low = parse_double_optional(row[3]);
        candle.close = parse_double_optional(row[4]);
        candle.volume = parse_double_optional(row[5]);
        candles.push_back(candle);
    }
    return candles;
}

PlacedOrder parse_placed_order(const std::string& body) {
    const auto json = parse_body(body);
    PlacedOrder placed;
    placed.order_id = get_string_optional(json, "orderId");
    placed.client_order_id = get_string_optional(json, "clientOrderId");
    placed.status = parse_order_status(get_string_optional(json, "status"));
    if (placed.order_id.empty()) {
        throw GatewayError("Order response carries no orderId: " + body);
    }
    return placed;
}

BinanceGateway::BinanceGateway(binance::FuturesClient& client, std::string symbol, int leverage)
    : client_(client), symbol_(std::move(symbol)), leverage_(leverage) {}

template <typename Fn>
auto BinanceGateway::call(const char* what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const GatewayError&) {
        throw;
    } catch (const binance::HttpError& ex) {
        if (ex.is_rate_limited()) {
            std::cerr << "[RateLimit] " << what << " hit HTTP " << ex.status_code() << std::endl;
        }
        throw GatewayError(std::string(what) + ": " + ex.what(), ex.status_code());
    } catch (const nlohmann::json::exception& ex) {
        throw GatewayError(std::string(what) + ": malformed response: " + ex.what());
    } catch (const std::exception& ex) {
        throw GatewayError(std::string(what) + ": " + ex.what());
    }
}

void BinanceGateway::initialize() {
    filters_ = call("exchangeInfo", [&] {
        return parse_symbol_filters(client_.exchange_info(), symbol_);
    });
    std::cout << "[Gateway] " << symbol_ << " tickSize=" << filters_.tick_size
              << " stepSize=" << filters_.step_size
              << " minQty=" << filters_.min_qty << std::endl;

    call("leverage", [&] {
        client_.change_leverage(symbol_, leverage_);
    });
    std::cout << "[Gateway] Leverage set to " << leverage_ << "x" << std::endl;

    ensure_hedge_mode();
}

void BinanceGateway::ensure_hedge_mode() {
    const bool dual = call("positionSide/dual", [&] {
        const auto json = parse_body(client_.position_side_dual());
        return get_bool_optional(json, "dualSidePosition");
    });
    if (dual) {
        std::cout << "[Gateway] Hedge mode already enabled" << std::endl;
        return;
    }

    try {
        client_.change_position_side_dual(true);
    } catch (const binance::HttpError& ex) {
        if (std::string(ex.what()).find(kNoPositionSideChange) == std::string::npos) {
            throw GatewayError(std::string("Enabling hedge mode failed: ") + ex.what(), ex.status_code());
        }
    }
    std::cout << "[Gateway] Hedge mode enabled" << std::endl;
}

std::string BinanceGateway::make_client_order_id(OrderSide side) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const auto seq = order_counter_.fetch_add(1, std::memory_order_relaxed) % 10000;
    std::ostringstream oss;
    oss << "grid" << (side == OrderSide::Buy ? 'B' : 'S') << ms
        << std::setw(4) << std::setfill('0') << seq;
    std::string id = oss.str();
    if (id.size() > 36) {
        id.resize(36);
    }
    return id;
}

double BinanceGateway::round_price(double price) const {
    return binance::round_to_step(price, filters_.tick_size);
}

double BinanceGateway::round_quantity(double quantity) const {
    const double floored = binance::floor_to_step(quantity, filters_.step_size);
    return std::max(floored, filters_.min_qty);
}

PlacedOrder BinanceGateway::place_order(const OrderRequest& request) {
    const double quantity = round_quantity(request.quantity);
    if (quantity <= 0.0) {
        throw GatewayError("Order quantity rounds to zero");
    }

    // Hedge mode: reduceOnly is implied by positionSide and the exchange
    // rejects it when sent explicitly.
    binance::QueryParams params = {
        {"positionSide", to_string(request.position_side)},
        {"quantity", binance::format_decimal(quantity, filters_.quantity_precision)},
        {"newClientOrderId", make_client_order_id(request.side)},
    };
    if (request.type == OrderType::Limit) {
        if (!request.price || *request.price <= 0.0) {
            throw GatewayError("Limit order without a positive price");
        }
        params.emplace_back("timeInForce", "GTC");
        params.emplace_back("price", binance::format_decimal(round_price(*request.price),
                                                             filters_.price_precision));
    }

    return call("new order", [&] {
        return parse_placed_order(client_.new_order(symbol_, to_string(request.side),
                                                    to_string(request.type), std::move(params)));
    });
}

void BinanceGateway::cancel_order(const std::string& order_id) {
    call("cancel order", [&] {
        client_.cancel_order(symbol_, {{"orderId", order_id}});
    });
}

std::vector<OpenOrder> BinanceGateway::fetch_open_orders() {
    return call("open orders", [&] {
        return parse_open_orders(client_.open_orders(symbol_));
    });
}

PositionSnapshot BinanceGateway::fetch_position() {
    return call("position risk", [&] {
        return parse_position_risk(client_.position_risk(symbol_), symbol_);
    });
}

double BinanceGateway::fetch_ticker() {
    return call("ticker", [&] {
        const auto json = parse_body(client_.ticker_price(symbol_));
        const double price = get_double_optional(json, "price");
        if (price <= 0.0) {
            throw GatewayError("Ticker returned no price");
        }
        return price;
    });
}

std::vector<Candle> BinanceGateway::fetch_klines(const std::string& timeframe, int limit) {
    return call("klines", [&] {
        return parse_klines(client_.klines(symbol_, timeframe, limit));
    });
}

OrderStatus BinanceGateway::fetch_order_status(const std::string& order_id) {
    return call("query order", [&] {
        const auto json = parse_body(client_.query_order(symbol_, {{"orderId", order_id}}));
        return parse_order_status(get_string_optional(json, "status"));
    });
}

std::string BinanceGateway::create_listen_key() {
    return call("listenKey create", [&] {
        const auto json = parse_body(client_.create_listen_key());
        auto key = get_string_optional(json, "listenKey");
        if (key.empty()) {
            throw GatewayError("listenKey response carries no key");
        }
        return key;
    });
}

void BinanceGateway::keepalive_listen_key() {
    call("listenKey keepalive", [&] {
        client_.keepalive_listen_key();
    });
}

void BinanceGateway::close_listen_key() {
    call("listenKey close", [&] {
        client_.close_listen_key();
    });
}

} // namespace grid
