#pragma once

#include "grid/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace grid {

struct TradeLedgerConfig {
    std::filesystem::path storage_path;
};

struct TradeFill {
    std::string order_id;
    long long trade_id = 0;
    TimePoint timestamp{};
    OrderSide side = OrderSide::Buy;
    PositionSide position_side = PositionSide::Long;
    double price = 0.0;
    double quantity = 0.0;
    double realized_pnl = 0.0;
    double commission = 0.0;
    std::string commission_asset;
    bool is_maker = false;
};

struct LedgerState {
    long long fill_count = 0;
    double traded_notional = 0.0;
    double realized_pnl = 0.0;
    double commission = 0.0;
    long long last_trade_id = 0;
};

// Append-only JSONL record of fills.
class TradeLedger {
public:
    explicit TradeLedger(TradeLedgerConfig config);

    LedgerState load();
    void append(const TradeFill& fill);
    const LedgerState& state() const { return state_; }

private:
    void ensure_directory() const;
    void accumulate(const TradeFill& fill);
    void persist_fill(const TradeFill& fill);

    TradeLedgerConfig config_;
    LedgerState state_{};
};

TradeFill fill_from_update(const OrderUpdate& update);

} // namespace grid
