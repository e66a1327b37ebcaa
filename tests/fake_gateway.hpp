#pragma once

#include "grid/market_gateway.hpp"

#include <cmath>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace grid::testing {

// In-memory exchange: remembers what was placed and cancelled, and serves
// whatever positions, open orders and klines the test configured.
class FakeGateway : public MarketGateway {
public:
    PlacedOrder place_order(const OrderRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_place) {
            throw GatewayError("place rejected", 400);
        }
        placed.push_back(request);
        PlacedOrder result;
        result.order_id = std::to_string(next_id_++);
        result.client_order_id = "fake" + result.order_id;
        result.status = place_status;
        if (track_open_orders) {
            OpenOrder order;
            order.order_id = result.order_id;
            order.side = request.side;
            order.position_side = request.position_side;
            order.reduce_only = request.reduce_only;
            order.price = request.price.value_or(0.0);
            order.orig_qty = request.quantity;
            open_orders.push_back(order);
        }
        return result;
    }

    void cancel_order(const std::string& order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_cancel) {
            throw GatewayError("cancel rejected", 400);
        }
        cancelled.push_back(order_id);
        for (auto it = open_orders.begin(); it != open_orders.end(); ++it) {
            if (it->order_id == order_id) {
                open_orders.erase(it);
                break;
            }
        }
    }

    std::vector<OpenOrder> fetch_open_orders() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++open_order_fetches;
        if (fail_fetch) {
            throw GatewayError("open orders unavailable", 503);
        }
        return open_orders;
    }

    PositionSnapshot fetch_position() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++position_fetches;
        if (fail_fetch) {
            throw GatewayError("positions unavailable", 503);
        }
        return position;
    }

    double fetch_ticker() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ticker) {
            throw GatewayError("ticker unavailable", 503);
        }
        return *ticker;
    }

    std::vector<Candle> fetch_klines(const std::string& /*timeframe*/, int limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++kline_fetches;
        if (static_cast<int>(klines.size()) <= limit) {
            return klines;
        }
        return std::vector<Candle>(klines.end() - limit, klines.end());
    }

    OrderStatus fetch_order_status(const std::string& order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = statuses.find(order_id);
        return it == statuses.end() ? default_status : it->second;
    }

    double round_price(double price) const override {
        return std::round(price * 10000.0) / 10000.0;
    }

    double round_quantity(double quantity) const override {
        return std::floor(quantity * 10.0 + 1e-9) / 10.0;
    }

    std::vector<OrderRequest> placed_snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return placed;
    }

    void clear_history() {
        std::lock_guard<std::mutex> lock(mutex_);
        placed.clear();
        cancelled.clear();
    }

    PositionSnapshot position;
    std::vector<OpenOrder> open_orders;
    std::vector<Candle> klines;
    std::map<std::string, OrderStatus> statuses;
    std::optional<double> ticker;
    OrderStatus place_status = OrderStatus::New;
    OrderStatus default_status = OrderStatus::Filled;
    bool track_open_orders = false;
    bool fail_place = false;
    bool fail_cancel = false;
    bool fail_fetch = false;

    std::vector<OrderRequest> placed;
    std::vector<std::string> cancelled;
    int open_order_fetches = 0;
    int position_fetches = 0;
    int kline_fetches = 0;

private:
    mutable std::mutex mutex_;
    int next_id_ = 1;
};

inline OpenOrder make_open_order(std::string id, OrderSide side, PositionSide position_side,
                                 bool reduce_only, double quantity, double price = 1.0) {
    OpenOrder order;
    order.order_id = std::move(id);
    order.side = side;
    order.position_side = position_side;
    order.reduce_only = reduce_only;
    order.orig_qty = quantity;
    order.price = price;
    return order;
}

} // namespace grid::testing
