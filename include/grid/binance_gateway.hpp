#pragma once

#include "binance/futures_client.hpp"
#include "grid/market_gateway.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace grid {

struct SymbolFilters {
    double tick_size = 0.0;
    double step_size = 0.0;
    double min_qty = 0.0;
    int price_precision = 8;
    int quantity_precision = 8;
};

// Response decoders, exposed for tests.
SymbolFilters parse_symbol_filters(const std::string& exchange_info_body, const std::string& symbol);
std::vector<OpenOrder> parse_open_orders(const std::string& body);
PositionSnapshot parse_position_risk(const std::string& body, const std::string& symbol);
std::vector<Candle> parse_klines(const std::string& body);
PlacedOrder parse_placed_order(const std::string& body);

// MarketGateway over the USD-M futures REST API, trading one symbol in
// hedge mode. Every transport, HTTP and decoding failure leaves here as
// GatewayError.
class BinanceGateway : public MarketGateway {
public:
    BinanceGateway(binance::FuturesClient& client, std::string symbol, int leverage);

    // Loads price/lot filters, applies leverage and makes sure the account
    // runs in hedge mode. Throws GatewayError when any step fails.
    void initialize();

    PlacedOrder place_order(const OrderRequest& request) override;
    void cancel_order(const std::string& order_id) override;
    std::vector<OpenOrder> fetch_open_orders() override;
    PositionSnapshot fetch_position() override;
    double fetch_ticker() override;
    std::vector<Candle> fetch_klines(const std::string& timeframe, int limit) override;
    OrderStatus fetch_order_status(const std::string& order_id) override;

    double round_price(double price) const override;
    double round_quantity(double quantity) const override;

    std::string create_listen_key();
    void keepalive_listen_key();
    void close_listen_key();

    const SymbolFilters& filters() const noexcept { return filters_; }
    const std::string& symbol() const noexcept { return symbol_; }

private:
    template <typename Fn>
    auto call(const char* what, Fn&& fn) -> decltype(fn());

    void ensure_hedge_mode();
    std::string make_client_order_id(OrderSide side);

    binance::FuturesClient& client_;
    std::string symbol_;
    int leverage_;
    SymbolFilters filters_;
    std::atomic<unsigned> order_counter_{0};
};

} // namespace grid
