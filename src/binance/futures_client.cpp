#include "binance/futures_client.hpp"

#include <utility>

namespace binance {
namespace {

QueryParams merge_params(QueryParams base, QueryParams extra) {
    base.reserve(base.size() + extra.size());
    for (auto& pair : extra) {
        base.emplace_back(std::move(pair));
    }
    return base;
}

} // namespace

FuturesClient::FuturesClient(Credentials credentials, std::string base_url)
    : ClientBase(std::move(credentials), std::move(base_url)) {}

std::string FuturesClient::ping() const {
    return public_request("GET", "/fapi/v1/ping").body;
}

std::string FuturesClient::server_time() const {
    return public_request("GET", "/fapi/v1/time").body;
}

std::string FuturesClient::exchange_info() const {
    return public_request("GET", "/fapi/v1/exchangeInfo").body;
}

std::string FuturesClient::ticker_price(const std::string& symbol) const {
    QueryParams params = {{"symbol", to_upper_copy(symbol)}};
    return public_request("GET", "/fapi/v1/ticker/price", params).body;
}

std::string FuturesClient::book_ticker(const std::string& symbol) const {
    QueryParams params = {{"symbol", to_upper_copy(symbol)}};
    return public_request("GET", "/fapi/v1/ticker/bookTicker", params).body;
}

std::string FuturesClient::klines(const std::string& symbol,
                                  const std::string& interval,
                                  std::optional<int> limit) const {
    QueryParams params = {
        {"symbol", to_upper_copy(symbol)},
        {"interval", interval}
    };
    if (limit) {
        params.emplace_back("limit", std::to_string(*limit));
    }
    return public_request("GET", "/fapi/v1/klines", params).body;
}

std::string FuturesClient::position_risk(const std::string& symbol) const {
    QueryParams params = {{"symbol", to_upper_copy(symbol)}};
    return signed_request("GET", "/fapi/v2/positionRisk", std::move(params)).body;
}

std::string FuturesClient::change_leverage(const std::string& symbol, int leverage) const {
    QueryParams params = {
        {"symbol", to_upper_copy(symbol)},
        {"leverage", std::to_string(leverage)}
    };
    return signed_request("POST", "/fapi/v1/leverage", std::move(params)).body;
}

std::string FuturesClient::position_side_dual() const {
    return signed_request("GET", "/fapi/v1/positionSide/dual").body;
}

std::string FuturesClient::change_position_side_dual(bool dual_side) const {
    QueryParams params = {{"dualSidePosition", dual_side ? "true" : "false"}};
    return signed_request("POST", "/fapi/v1/positionSide/dual", std::move(params)).body;
}

std::string FuturesClient::new_order(const std::string& symbol,
                                     const std::string& side,
                                     const std::string& type,
                                     QueryParams options) const {
    QueryParams params = {
        {"symbol", to_upper_copy(symbol)},
        {"side", to_upper_copy(side)},
        {"type", to_upper_copy(type)}
    };
    params = merge_params(std::move(params), std::move(options));
    return signed_request("POST", "/fapi/v1/order", std::move(params)).body;
}

std::string FuturesClient::cancel_order(const std::string& symbol, QueryParams options) const {
    QueryParams params = {{"symbol", to_upper_copy(symbol)}};
    params = merge_params(std::move(params), std::move(options));
    return signed_request("DELETE", "/fapi/v1/order", std::move(params)).body;
}

std::string FuturesClient::query_order(const std::string& symbol, QueryParams options) const {
    QueryParams params = {{"symbol", to_upper_copy(symbol)}};
    params = merge_params(std::move(params), std::move(options));
    return signed_request("GET", "/fapi/v1/order", std::move(params)).body;
}

std::string FuturesClient::open_orders(const std::string& symbol) const {
    QueryParams params = {{"symbol", to_upper_copy(symbol)}};
    return signed_request("GET", "/fapi/v1/openOrders", std::move(params)).body;
}

std::string FuturesClient::create_listen_key() const {
    return keyed_request("POST", "/fapi/v1/listenKey").body;
}

std::string FuturesClient::keepalive_listen_key() const {
    return keyed_request("PUT", "/fapi/v1/listenKey").body;
}

std::string FuturesClient::close_listen_key() const {
    return keyed_request("DELETE", "/fapi/v1/listenKey").body;
}

} // namespace binance
