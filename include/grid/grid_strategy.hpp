#pragma once

#include "grid/config.hpp"
#include "grid/extreme_protection.hpp"
#include "grid/grid_engine.hpp"
#include "grid/market_gateway.hpp"
#include "grid/price_guard.hpp"
#include "grid/signal_adapter.hpp"
#include "grid/single_flight.hpp"
#include "grid/stoppable.hpp"
#include "grid/stream_events.hpp"
#include "grid/trade_ledger.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace grid {

// Ties the grid engine, protection and signal adapter to the event stream.
// Handlers are meant to be called from a single consumer thread; the order
// lifecycle handler is additionally serialized by its own mutex.
class GridStrategy : public Stoppable {
public:
    GridStrategy(MarketGateway& gateway, const BotConfig& config);

    // Ledger totals, persisted protection state, initial signal and the
    // first position/order snapshots.
    void startup(TimePoint now);

    void on_book_ticker(const BookTickerEvent& event, TimePoint now);
    void on_kline(const KlineEvent& event, TimePoint now);
    void on_order_update(const OrderUpdate& update);

    // Watchdog entry point; ends hibernation even when the price feed is quiet.
    void evaluate_hibernation(TimePoint now);

    // Hooks run once, in registration order, by stop().
    void add_shutdown_hook(std::function<void()> hook);
    void stop() override;
    bool stopped() const noexcept { return stopped_.load(); }

    void log_status() const;

    const GridEngine& engine() const noexcept { return engine_; }
    const ExtremeProtection& protection() const noexcept { return protection_; }
    std::optional<double> last_price() const noexcept { return price_guard_.last_good(); }

private:
    void on_price(double price, TimePoint now);
    void run_periodic_sync(TimePoint now);
    void resync_after_hibernation(TimePoint now);
    void record_fill(const OrderUpdate& update);
    void confirm_price_level(double rejected, TimePoint now);

    MarketGateway& gateway_;
    GridConfig grid_config_;
    double bar_noise_threshold_pct_;
    double max_price_jump_;
    GridEngine engine_;
    ExtremeProtection protection_;
    SignalAdapter signal_;
    TradeLedger ledger_;
    PriceGuard price_guard_;

    std::mutex order_mutex_;
    std::optional<TimePoint> last_tick_;
    std::optional<TimePoint> last_position_sync_;
    std::optional<TimePoint> last_order_sync_;
    std::optional<TimePoint> last_price_confirm_;

    SingleFlight shutdown_flight_;
    std::atomic<bool> stopped_{false};
    std::vector<std::function<void()>> shutdown_hooks_;
};

} // namespace grid
