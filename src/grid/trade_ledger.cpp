#include "grid/trade_ledger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace grid {

namespace {

template <typename T>
T json_value_or(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    try {
        return j[key].get<T>();
    } catch (...) {
        return fallback;
    }
}

} // namespace

TradeFill fill_from_update(const OrderUpdate& update) {
    TradeFill fill;
    fill.order_id = update.order_id;
    fill.trade_id = update.trade_id;
    fill.timestamp = TimePoint{std::chrono::milliseconds(update.event_time_ms)};
    fill.side = update.side;
    fill.position_side = update.position_side;
    fill.price = update.last_filled_price;
    fill.quantity = update.last_filled_qty;
    fill.realized_pnl = update.realized_pnl;
    fill.commission = update.commission;
    fill.commission_asset = update.commission_asset;
    fill.is_maker = update.is_maker;
    return fill;
}

TradeLedger::TradeLedger(TradeLedgerConfig config)
    : config_(std::move(config)) {
    if (config_.storage_path.empty()) {
        throw std::invalid_argument("TradeLedger storage path not set");
    }
}

LedgerState TradeLedger::load() {
    state_ = {};

    ensure_directory();
    std::ifstream input(config_.storage_path);
    if (!input.good()) {
        return state_;
    }

    std::string line;
    while (std::getline(input, line)) {
        if (line.empty()) {
            continue;
        }
        try {
            const auto json = nlohmann::json::parse(line);
            TradeFill fill;
            fill.order_id = json_value_or<std::string>(json, "orderId", "");
            fill.trade_id = json_value_or<long long>(json, "tradeId", 0);
            const auto epoch_ms = json_value_or<int64_t>(json, "time", 0);
            fill.timestamp = TimePoint{std::chrono::milliseconds(epoch_ms)};
            fill.side = parse_order_side(json_value_or<std::string>(json, "side", "BUY")).value_or(OrderSide::Buy);
            fill.position_side = parse_position_side(json_value_or<std::string>(json, "positionSide", "LONG"))
                                     .value_or(PositionSide::Long);
            fill.price = json_value_or<double>(json, "price", 0.0);
            fill.quantity = json_value_or<double>(json, "qty", 0.0);
            fill.realized_pnl = json_value_or<double>(json, "realizedPnl", 0.0);
            fill.commission = json_value_or<double>(json, "commission", 0.0);
            fill.commission_asset = json_value_or<std::string>(json, "commissionAsset", "");
            fill.is_maker = json_value_or<bool>(json, "isMaker", false);
            accumulate(fill);
        } catch (const nlohmann::json::exception&) {
            continue;
        }
    }

    return state_;
}

void TradeLedger::append(const TradeFill& fill) {
    persist_fill(fill);
    accumulate(fill);
}

void TradeLedger::ensure_directory() const {
    const auto dir = config_.storage_path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }
}

void TradeLedger::accumulate(const TradeFill& fill) {
    ++state_.fill_count;
    state_.traded_notional += fill.price * fill.quantity;
    state_.realized_pnl += fill.realized_pnl;
    state_.commission += fill.commission;
    state_.last_trade_id = std::max(state_.last_trade_id, fill.trade_id);
}

void TradeLedger::persist_fill(const TradeFill& fill) {
    ensure_directory();

    nlohmann::json json;
    json["orderId"] = fill.order_id;
    json["tradeId"] = fill.trade_id;
    json["time"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        fill.timestamp.time_since_epoch()).count();
    json["side"] = to_string(fill.side);
    json["positionSide"] = to_string(fill.position_side);
    json["price"] = fill.price;
    json["qty"] = fill.quantity;
    json["realizedPnl"] = fill.realized_pnl;
    json["commission"] = fill.commission;
    json["commissionAsset"] = fill.commission_asset;
    json["isMaker"] = fill.is_maker;

    std::ofstream output(config_.storage_path, std::ios::app);
    if (!output.good()) {
        throw std::runtime_error("Failed to append to trade ledger at " + config_.storage_path.string());
    }
    output << json.dump() << '\n';
}

} // namespace grid
