#include "fake_gateway.hpp"
#include "temp_dir.hpp"

#include "grid/grid_strategy.hpp"
#include "grid/protection_state_store.hpp"
#include "grid/trade_ledger.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <vector>

using grid::OrderSide;
using grid::OrderStatus;
using grid::PositionSide;
using grid::testing::FakeGateway;
using grid::testing::TempDir;

namespace {

const grid::TimePoint kStart = grid::TimePoint{} + std::chrono::hours(480000);

grid::BotConfig test_config(const TempDir& dir) {
    grid::BotConfig config;
    config.grid.ledger_path = dir.file("ledger.jsonl").string();
    config.protection.state_path = dir.file("protection.json").string();
    config.protection.fill_poll_interval_ms = 1;
    config.protection.close_timeout_s = 1;
    return config;
}

grid::BookTickerEvent touch(double mid, double half_spread = 0.01) {
    grid::BookTickerEvent event;
    event.symbol = "XRPUSDC";
    event.best_bid = mid - half_spread;
    event.best_ask = mid + half_spread;
    return event;
}

grid::KlineEvent closed_bar(double open, double close, grid::TimePoint when) {
    grid::KlineEvent event;
    event.symbol = "XRPUSDC";
    event.interval = "1h";
    event.closed = true;
    event.candle.open_time_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
    event.candle.open = open;
    event.candle.close = close;
    event.candle.high = open > close ? open : close;
    event.candle.low = open > close ? close : open;
    event.candle.volume = 1000.0;
    return event;
}

void save_hibernating(const grid::BotConfig& config, grid::TimePoint started) {
    grid::ProtectionState state;
    state.protection_active = true;
    state.hibernation_start = started;
    state.baseline_volatility = 0.002;
    REQUIRE(grid::ProtectionStateStore(config.protection.state_path).save(state));
}

} // namespace

TEST_CASE("first tick on a flat account opens one entry per side") {
    TempDir dir("grid_strategy");
    FakeGateway gateway;
    gateway.ticker = 1.0;
    grid::GridStrategy strategy{gateway, test_config(dir)};
    strategy.startup(kStart);
    REQUIRE(strategy.last_price());
    CHECK(*strategy.last_price() == Catch::Approx(1.0));

    strategy.on_book_ticker(touch(1.0), kStart);
    auto placed = gateway.placed_snapshot();
    REQUIRE(placed.size() == 2);
    CHECK(placed[0].side == OrderSide::Buy);
    CHECK(placed[0].position_side == PositionSide::Long);
    CHECK(*placed[0].price == Catch::Approx(0.99));
    CHECK(placed[1].side == OrderSide::Sell);
    CHECK(placed[1].position_side == PositionSide::Short);
    CHECK(*placed[1].price == Catch::Approx(1.01));

    SECTION("ticks inside the tick interval are not evaluated") {
        gateway.clear_history();
        strategy.on_book_ticker(touch(1.0), kStart + std::chrono::milliseconds(300));
        CHECK(gateway.placed_snapshot().empty());
    }

    SECTION("entry interval holds back a second entry") {
        gateway.clear_history();
        strategy.on_book_ticker(touch(1.0), kStart + std::chrono::seconds(3));
        CHECK(gateway.placed_snapshot().empty());
    }
}

TEST_CASE("a price jump is held back until the ticker confirms it") {
    TempDir dir("grid_strategy");
    FakeGateway gateway;
    gateway.ticker = 1.0;
    grid::GridStrategy strategy{gateway, test_config(dir)};
    strategy.startup(kStart);

    strategy.on_book_ticker(touch(1.5), kStart);
    CHECK(gateway.placed_snapshot().empty());
    REQUIRE(strategy.last_price());
    CHECK(*strategy.last_price() == Catch::Approx(1.0));

    gateway.ticker = 1.49;
    strategy.on_book_ticker(touch(1.5), kStart + std::chrono::seconds(2));
    CHECK(*strategy.last_price() == Catch::Approx(1.0));

    strategy.on_book_ticker(touch(1.5), kStart + std::chrono::seconds(6));
    CHECK(*strategy.last_price() == Catch::Approx(1.5));

    strategy.on_book_ticker(touch(1.5), kStart + std::chrono::seconds(7));
    CHECK(gateway.placed_snapshot().size() == 2);
}

TEST_CASE("an extreme run flattens the account and suspends the grid") {
    TempDir dir("grid_strategy");
    FakeGateway gateway;
    gateway.ticker = 1.0;
    grid::GridStrategy strategy{gateway, test_config(dir)};
    strategy.startup(kStart);

    // Open bars are ignored.
    auto open_bar = closed_bar(1.0, 1.2, kStart);
    open_bar.closed = false;
    strategy.on_kline(open_bar, kStart);
    CHECK_FALSE(strategy.protection().is_extreme());

    strategy.on_kline(closed_bar(1.0, 1.06, kStart - std::chrono::hours(2)), kStart);
    strategy.on_kline(closed_bar(1.06, 1.12, kStart - std::chrono::hours(1)), kStart);
    REQUIRE(strategy.protection().is_extreme());

    strategy.on_book_ticker(touch(1.0), kStart);
    CHECK(strategy.protection().hibernating());
    CHECK(gateway.placed_snapshot().empty());

    strategy.on_book_ticker(touch(1.0), kStart + std::chrono::seconds(30));
    CHECK(gateway.placed_snapshot().empty());
    CHECK(strategy.engine().positions().long_qty == Catch::Approx(0.0));
}

TEST_CASE("hibernation ends once volatility settles after the window") {
    TempDir dir("grid_strategy");
    FakeGateway gateway;
    gateway.ticker = 1.0;
    const auto config = test_config(dir);

    SECTION("watchdog leaves an early hibernation alone") {
        save_hibernating(config, kStart - std::chrono::hours(23));
        grid::GridStrategy strategy{gateway, config};
        strategy.startup(kStart);
        REQUIRE(strategy.protection().hibernating());

        strategy.evaluate_hibernation(kStart);
        CHECK(strategy.protection().hibernating());
        // Window elapsed, but no volatility reading yet.
        strategy.evaluate_hibernation(kStart + std::chrono::hours(2));
        CHECK(strategy.protection().hibernating());
    }

    SECTION("calm ticks resume trading") {
        save_hibernating(config, kStart - std::chrono::hours(25));
        grid::GridStrategy strategy{gateway, config};
        strategy.startup(kStart);
        REQUIRE(strategy.protection().hibernating());

        auto now = kStart;
        for (int i = 0; i < 14; ++i) {
            strategy.on_book_ticker(touch(i % 2 == 0 ? 1.0 : 1.002), now);
            now += std::chrono::seconds(1);
        }
        CHECK(strategy.protection().hibernating());
        CHECK(gateway.placed_snapshot().empty());

        strategy.on_book_ticker(touch(1.0), now);
        CHECK_FALSE(strategy.protection().hibernating());
        CHECK(gateway.placed_snapshot().size() == 2);
    }
}

TEST_CASE("fills reach the ledger and trigger a resync") {
    TempDir dir("grid_strategy");
    FakeGateway gateway;
    gateway.ticker = 1.0;
    const auto config = test_config(dir);
    grid::GridStrategy strategy{gateway, config};
    strategy.startup(kStart);
    const int order_fetches = gateway.open_order_fetches;
    const int position_fetches = gateway.position_fetches;

    gateway.position = {3.0, 0.0};
    grid::OrderUpdate update;
    update.symbol = "XRPUSDC";
    update.order_id = "7";
    update.side = OrderSide::Buy;
    update.position_side = PositionSide::Long;
    update.status = OrderStatus::Filled;
    update.execution_type = "TRADE";
    update.orig_qty = 3.0;
    update.cum_filled_qty = 3.0;
    update.last_filled_qty = 3.0;
    update.last_filled_price = 0.99;
    update.trade_id = 501;
    update.event_time_ms = 1700000000000;
    strategy.on_order_update(update);

    CHECK(gateway.open_order_fetches == order_fetches + 1);
    CHECK(gateway.position_fetches == position_fetches + 1);
    CHECK(strategy.engine().positions().long_qty == Catch::Approx(3.0));

    grid::TradeLedger reloaded{grid::TradeLedgerConfig{config.grid.ledger_path}};
    const auto totals = reloaded.load();
    CHECK(totals.fill_count == 1);
    CHECK(totals.traded_notional == Catch::Approx(2.97));
    CHECK(totals.last_trade_id == 501);
}

TEST_CASE("stop runs shutdown hooks exactly once") {
    TempDir dir("grid_strategy");
    FakeGateway gateway;
    gateway.ticker = 1.0;
    grid::GridStrategy strategy{gateway, test_config(dir)};
    strategy.startup(kStart);

    std::vector<int> calls;
    strategy.add_shutdown_hook([&calls]() { calls.push_back(1); });
    strategy.add_shutdown_hook([]() { throw std::runtime_error("stream already closed"); });
    strategy.add_shutdown_hook([&calls]() { calls.push_back(3); });

    strategy.stop();
    strategy.stop();
    CHECK(strategy.stopped());
    REQUIRE(calls.size() == 2);
    CHECK(calls[0] == 1);
    CHECK(calls[1] == 3);

    strategy.on_book_ticker(touch(1.0), kStart);
    CHECK(gateway.placed_snapshot().empty());
}
