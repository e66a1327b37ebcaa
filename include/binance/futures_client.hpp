#pragma once

#include "binance/client_base.hpp"

#include <optional>

namespace binance {

// USD-M perpetual futures REST surface. Every call returns the raw JSON body.
class FuturesClient : public ClientBase {
public:
    explicit FuturesClient(Credentials credentials,
                           std::string base_url = "https://fapi.binance.com");

    std::string ping() const;
    std::string server_time() const;
    std::string exchange_info() const;

    std::string ticker_price(const std::string& symbol) const;
    std::string book_ticker(const std::string& symbol) const;
    std::string klines(const std::string& symbol,
                       const std::string& interval,
                       std::optional<int> limit = std::nullopt) const;

    std::string position_risk(const std::string& symbol) const;
    std::string change_leverage(const std::string& symbol, int leverage) const;
    std::string position_side_dual() const;
    std::string change_position_side_dual(bool dual_side) const;

    std::string new_order(const std::string& symbol,
                          const std::string& side,
                          const std::string& type,
                          QueryParams options = {}) const;
    std::string cancel_order(const std::string& symbol, QueryParams options) const;
    std::string query_order(const std::string& symbol, QueryParams options) const;
    std::string open_orders(const std::string& symbol) const;

    // User data stream
    std::string create_listen_key() const;
    std::string keepalive_listen_key() const;
    std::string close_listen_key() const;
};

} // namespace binance
