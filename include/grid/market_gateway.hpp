#pragma once

#include "grid/types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace grid {

class GatewayError : public std::runtime_error {
public:
    explicit GatewayError(const std::string& message, long status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    [[nodiscard]] long status_code() const noexcept { return status_code_; }

private:
    long status_code_;
};

// Exchange capabilities consumed by the grid core. Implementations must be
// safe to call from several threads at once (emergency fan-out) and report
// every failure as GatewayError.
class MarketGateway {
public:
    virtual ~MarketGateway() = default;

    virtual PlacedOrder place_order(const OrderRequest& request) = 0;
    virtual void cancel_order(const std::string& order_id) = 0;
    virtual std::vector<OpenOrder> fetch_open_orders() = 0;
    virtual PositionSnapshot fetch_position() = 0;
    virtual double fetch_ticker() = 0;
    virtual std::vector<Candle> fetch_klines(const std::string& timeframe, int limit) = 0;
    virtual OrderStatus fetch_order_status(const std::string& order_id) = 0;

    virtual double round_price(double price) const = 0;
    virtual double round_quantity(double quantity) const = 0;
};

} // namespace grid
