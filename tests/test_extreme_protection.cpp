#include "fake_gateway.hpp"
#include "temp_dir.hpp"

#include "grid/extreme_protection.hpp"
#include "grid/protection_state_store.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>

using grid::OrderSide;
using grid::OrderStatus;
using grid::PositionSide;
using grid::TrendDirection;
using grid::testing::FakeGateway;
using grid::testing::TempDir;
using grid::testing::make_open_order;

namespace {

const grid::TimePoint kStart = grid::TimePoint{} + std::chrono::hours(480000);

grid::ProtectionConfig test_config(const TempDir& dir) {
    grid::ProtectionConfig config;
    config.state_path = dir.file("protection.json").string();
    config.fill_poll_interval_ms = 1;
    config.close_timeout_s = 1;
    return config;
}

grid::ExtremeProtection make_protection(FakeGateway& gateway, const grid::ProtectionConfig& config) {
    return grid::ExtremeProtection{gateway, config, grid::ProtectionStateStore(config.state_path)};
}

grid::KlineBar bar(double open, double close, grid::TimePoint when = kStart) {
    return grid::make_kline_bar(open, std::max(open, close), std::min(open, close), close, 1000.0, when);
}

} // namespace

TEST_CASE("bar direction ignores moves inside the noise band") {
    CHECK(bar(100.0, 100.05).direction == TrendDirection::Neutral);
    CHECK(bar(100.0, 99.95).direction == TrendDirection::Neutral);
    CHECK(bar(100.0, 100.2).direction == TrendDirection::Up);
    CHECK(bar(100.0, 99.8).direction == TrendDirection::Down);
    CHECK(bar(100.0, 102.0).change_pct == Catch::Approx(2.0));
}

TEST_CASE("a single neutral bar resets the run") {
    TempDir dir("grid_protection");
    FakeGateway gateway;
    auto protection = make_protection(gateway, test_config(dir));

    protection.on_bar(bar(100.0, 103.0), kStart);
    protection.on_bar(bar(103.0, 106.0), kStart);
    REQUIRE(protection.status().consecutive_bars == 2);

    protection.on_bar(bar(106.0, 106.01), kStart);
    const auto state = protection.status();
    CHECK(state.direction == TrendDirection::Neutral);
    CHECK(state.consecutive_bars == 0);
    CHECK(state.cumulative_change_pct == 0.0);
}

TEST_CASE("cumulative move grows monotonically along a run") {
    TempDir dir("grid_protection");
    FakeGateway gateway;
    auto protection = make_protection(gateway, test_config(dir));

    double open = 100.0;
    double previous = 0.0;
    for (int i = 0; i < 8; ++i) {
        const double close = open * 1.01;
        protection.on_bar(bar(open, close), kStart);
        const auto state = protection.status();
        CHECK(state.direction == TrendDirection::Up);
        CHECK(state.consecutive_bars == i + 1);
        CHECK(state.cumulative_change_pct >= previous);
        previous = state.cumulative_change_pct;
        open = close;
    }
    CHECK(previous == Catch::Approx((open - 100.0) / 100.0 * 100.0));
}

TEST_CASE("opposite bar starts a new run at its open") {
    TempDir dir("grid_protection");
    FakeGateway gateway;
    auto protection = make_protection(gateway, test_config(dir));

    protection.on_bar(bar(100.0, 105.0), kStart);
    protection.on_bar(bar(105.0, 100.0), kStart);
    const auto state = protection.status();
    CHECK(state.direction == TrendDirection::Down);
    CHECK(state.consecutive_bars == 1);
    CHECK(state.run_start_price == Catch::Approx(105.0));
    CHECK(state.cumulative_change_pct == Catch::Approx(5.0 / 105.0 * 100.0));
}

TEST_CASE("extreme threshold is inclusive") {
    TempDir dir("grid_protection");
    FakeGateway gateway;

    SECTION("a run reaching exactly 11% is extreme") {
        auto protection = make_protection(gateway, test_config(dir));
        protection.on_bar(bar(100.0, 105.0), kStart);
        CHECK_FALSE(protection.is_extreme());
        protection.on_bar(bar(105.0, 111.0), kStart);
        CHECK(protection.is_extreme());
    }

    SECTION("10.99% is not") {
        auto protection = make_protection(gateway, test_config(dir));
        protection.on_bar(bar(100.0, 105.0), kStart);
        protection.on_bar(bar(105.0, 110.99), kStart);
        CHECK_FALSE(protection.is_extreme());
    }

    SECTION("down runs count by magnitude") {
        auto protection = make_protection(gateway, test_config(dir));
        protection.on_bar(bar(100.0, 95.0), kStart);
        protection.on_bar(bar(95.0, 89.0), kStart);
        CHECK(protection.status().cumulative_change_pct == Catch::Approx(11.0));
        CHECK(protection.is_extreme());
    }
}

TEST_CASE("volatility recovery compares against the scaled baseline") {
    using grid::ExtremeProtection;
    CHECK(ExtremeProtection::volatility_recovered(0.003, 0.002, 1.5));
    CHECK(ExtremeProtection::volatility_recovered(0.001, 0.002, 1.5));
    CHECK_FALSE(ExtremeProtection::volatility_recovered(0.0031, 0.002, 1.5));
    CHECK_FALSE(ExtremeProtection::volatility_recovered(0.001, 0.0, 1.5));
}

TEST_CASE("hibernation ends only after the window and a volatility recovery") {
    TempDir dir("grid_protection");
    FakeGateway gateway;
    const auto config = test_config(dir);

    const auto save_hibernating = [&](grid::TimePoint started) {
        grid::ProtectionState state;
        state.protection_active = true;
        state.hibernation_start = started;
        state.baseline_volatility = 0.002;
        REQUIRE(grid::ProtectionStateStore(config.state_path).save(state));
    };

    const auto feed = [](grid::ExtremeProtection& protection, double delta) {
        double price = 1.0;
        for (int i = 0; i < 15; ++i) {
            protection.on_price(price, kStart);
            price = (i % 2 == 0) ? price + delta : price - delta;
        }
    };

    SECTION("calm market after 25 hours") {
        save_hibernating(kStart - std::chrono::hours(25));
        auto protection = make_protection(gateway, config);
        protection.restore(kStart);
        REQUIRE(protection.hibernating());
        feed(protection, 0.003);
        CHECK(protection.current_volatility() == Catch::Approx(0.003));
        CHECK(protection.evaluate_hibernation_end(kStart));
        CHECK_FALSE(protection.hibernating());
        CHECK(protection.mode() == grid::ProtectionMode::Normal);
    }

    SECTION("calm market but inside the window") {
        save_hibernating(kStart - std::chrono::hours(23));
        auto protection = make_protection(gateway, config);
        protection.restore(kStart);
        feed(protection, 0.003);
        CHECK_FALSE(protection.evaluate_hibernation_end(kStart));
        CHECK(protection.hibernating());
    }

    SECTION("window elapsed but volatility still elevated") {
        save_hibernating(kStart - std::chrono::hours(25));
        auto protection = make_protection(gateway, config);
        protection.restore(kStart);
        feed(protection, 0.0031);
        CHECK_FALSE(protection.evaluate_hibernation_end(kStart));
        CHECK(protection.hibernating());
    }
}

TEST_CASE("emergency sequence cancels, flattens and hibernates") {
    TempDir dir("grid_protection");
    FakeGateway gateway;
    gateway.open_orders = {
        make_open_order("11", OrderSide::Buy, PositionSide::Long, false, 3.0),
        make_open_order("12", OrderSide::Buy, PositionSide::Short, true, 3.0),
    };
    gateway.position = {5.0, 7.0};
    gateway.default_status = OrderStatus::Filled;
    const auto config = test_config(dir);
    auto protection = make_protection(gateway, config);

    const auto outcome = protection.trigger_emergency(1.0, kStart);
    CHECK(outcome.started);
    CHECK(outcome.cancelled);
    CHECK(outcome.flattened);
    CHECK(outcome.activated);
    CHECK(gateway.cancelled.size() == 2);

    const auto placed = gateway.placed_snapshot();
    REQUIRE(placed.size() == 2);
    const auto long_close = std::find_if(placed.begin(), placed.end(), [](const grid::OrderRequest& r) {
        return r.position_side == PositionSide::Long;
    });
    const auto short_close = std::find_if(placed.begin(), placed.end(), [](const grid::OrderRequest& r) {
        return r.position_side == PositionSide::Short;
    });
    REQUIRE(long_close != placed.end());
    REQUIRE(short_close != placed.end());
    CHECK(long_close->side == OrderSide::Sell);
    CHECK(long_close->quantity == Catch::Approx(5.0));
    CHECK(*long_close->price == Catch::Approx(0.995));
    CHECK(short_close->side == OrderSide::Buy);
    CHECK(short_close->quantity == Catch::Approx(7.0));
    CHECK(*short_close->price == Catch::Approx(1.005));

    CHECK(protection.hibernating());
    const auto state = protection.status();
    REQUIRE(state.hibernation_start);
    CHECK(*state.hibernation_start == kStart);

    const auto persisted = grid::ProtectionStateStore(config.state_path).load();
    REQUIRE(persisted);
    CHECK(persisted->protection_active);
    CHECK(persisted->hibernation_start);
}

TEST_CASE("flatten orders are priced through the touch") {
    TempDir dir("grid_protection");
    FakeGateway gateway;
    gateway.position = {5.0, 7.0};
    auto protection = make_protection(gateway, test_config(dir));

    const auto outcome = protection.trigger_emergency(1.0, kStart, grid::BookTop{0.98, 1.02});
    CHECK(outcome.activated);

    const auto placed = gateway.placed_snapshot();
    REQUIRE(placed.size() == 2);
    for (const auto& request : placed) {
        if (request.position_side == PositionSide::Long) {
            CHECK(*request.price == Catch::Approx(0.98 * 0.995));
        } else {
            CHECK(*request.price == Catch::Approx(1.02 * 1.005));
        }
    }
}

TEST_CASE("incomplete emergency sequence leaves protection inactive") {
    TempDir dir("grid_protection");
    FakeGateway gateway;
    gateway.position = {5.0, 0.0};

    SECTION("close order cancelled instead of filled") {
        gateway.default_status = OrderStatus::Canceled;
        auto protection = make_protection(gateway, test_config(dir));
        const auto outcome = protection.trigger_emergency(1.0, kStart);
        CHECK(outcome.cancelled);
        CHECK_FALSE(outcome.flattened);
        CHECK_FALSE(outcome.activated);
        CHECK_FALSE(protection.hibernating());
    }

    SECTION("cancellation failure") {
        gateway.open_orders = {make_open_order("21", OrderSide::Buy, PositionSide::Long, false, 3.0)};
        gateway.fail_cancel = true;
        auto protection = make_protection(gateway, test_config(dir));
        const auto outcome = protection.trigger_emergency(1.0, kStart);
        CHECK_FALSE(outcome.cancelled);
        CHECK_FALSE(outcome.activated);
        CHECK_FALSE(protection.hibernating());
    }

    SECTION("close order never fills before the timeout") {
        gateway.default_status = OrderStatus::New;
        auto protection = make_protection(gateway, test_config(dir));
        const auto outcome = protection.trigger_emergency(1.0, kStart);
        CHECK_FALSE(outcome.flattened);
        CHECK_FALSE(protection.hibernating());
    }
}

TEST_CASE("emergency with nothing to flatten still hibernates") {
    TempDir dir("grid_protection");
    FakeGateway gateway;
    auto protection = make_protection(gateway, test_config(dir));

    const auto outcome = protection.trigger_emergency(1.0, kStart);
    CHECK(outcome.activated);
    CHECK(gateway.placed_snapshot().empty());

    const auto again = protection.trigger_emergency(1.0, kStart + std::chrono::minutes(1));
    CHECK(again.activated);
    CHECK(gateway.placed_snapshot().empty());
}

TEST_CASE("persisted run survives a restart") {
    TempDir dir("grid_protection");
    FakeGateway gateway;
    const auto config = test_config(dir);
    {
        auto protection = make_protection(gateway, config);
        protection.on_bar(bar(100.0, 104.0), kStart);
        protection.on_bar(bar(104.0, 108.0), kStart);
    }

    auto restored = make_protection(gateway, config);
    restored.restore(kStart);
    auto state = restored.status();
    CHECK(state.direction == TrendDirection::Up);
    CHECK(state.consecutive_bars == 2);
    CHECK(state.cumulative_change_pct == Catch::Approx(8.0));

    restored.on_bar(bar(108.0, 111.0), kStart);
    CHECK(restored.is_extreme());
}

TEST_CASE("force_reset clears hibernation and the run") {
    TempDir dir("grid_protection");
    FakeGateway gateway;
    auto protection = make_protection(gateway, test_config(dir));
    protection.on_bar(bar(100.0, 106.0), kStart);
    REQUIRE(protection.trigger_emergency(1.0, kStart).activated);

    protection.force_reset(kStart);
    const auto state = protection.status();
    CHECK_FALSE(state.protection_active);
    CHECK_FALSE(state.hibernation_start);
    CHECK(state.direction == TrendDirection::Neutral);
    CHECK(state.cumulative_change_pct == 0.0);
}
