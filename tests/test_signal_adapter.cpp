#include "fake_gateway.hpp"

#include "grid/indicators.hpp"
#include "grid/signal_adapter.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cmath>
#include <vector>

using grid::TrendSignal;
using grid::testing::FakeGateway;

namespace {

std::vector<grid::Candle> trending(int count, double start, double step) {
    std::vector<grid::Candle> candles;
    double close = start;
    for (int i = 0; i < count; ++i) {
        grid::Candle candle;
        candle.open_time_ms = static_cast<int64_t>(i) * 3600000;
        candle.open = close;
        close += step;
        candle.close = close;
        candle.high = std::max(candle.open, candle.close) + 0.2;
        candle.low = std::min(candle.open, candle.close) - 0.2;
        candle.volume = 1000.0;
        candles.push_back(candle);
    }
    return candles;
}

std::vector<grid::Candle> choppy(int count) {
    std::vector<grid::Candle> candles;
    for (int i = 0; i < count; ++i) {
        grid::Candle candle;
        candle.open_time_ms = static_cast<int64_t>(i) * 3600000;
        candle.close = (i % 2 == 0) ? 100.0 : 101.0;
        candle.open = (i % 2 == 0) ? 101.0 : 100.0;
        candle.high = candle.close + 0.5;
        candle.low = candle.close - 0.5;
        candle.volume = 1000.0;
        candles.push_back(candle);
    }
    return candles;
}

const grid::TimePoint kStart = grid::TimePoint{} + std::chrono::hours(480000);

} // namespace

TEST_CASE("ema_series seeds with the first value") {
    const auto ema = grid::ema_series({10.0, 20.0, 20.0}, 3);
    REQUIRE(ema.size() == 3);
    CHECK(ema[0] == Catch::Approx(10.0));
    CHECK(ema[1] == Catch::Approx(15.0));
    CHECK(ema[2] == Catch::Approx(17.5));

    const auto flat = grid::ema_series(std::vector<double>(50, 3.0), 20);
    CHECK(flat.back() == Catch::Approx(3.0));
    CHECK(grid::ema_series({}, 20).empty());
}

TEST_CASE("adx_series warms up before reporting strength") {
    const auto candles = trending(60, 100.0, 0.5);
    std::vector<double> highs;
    std::vector<double> lows;
    std::vector<double> closes;
    for (const auto& candle : candles) {
        highs.push_back(candle.high);
        lows.push_back(candle.low);
        closes.push_back(candle.close);
    }

    const auto adx = grid::adx_series(highs, lows, closes, 14);
    REQUIRE(adx.adx.size() == 60);
    CHECK(std::isnan(adx.adx[0]));
    CHECK(std::isnan(adx.adx[25]));
    REQUIRE(std::isfinite(adx.adx[26]));
    CHECK(adx.adx.back() == Catch::Approx(100.0));
    CHECK(adx.minus_di.back() == Catch::Approx(0.0));
    CHECK(adx.plus_di.back() > 0.0);
}

TEST_CASE("classify_trend recognises aligned strong trends") {
    const grid::SignalConfig config;

    const auto up = grid::classify_trend(trending(300, 100.0, 0.5), config);
    CHECK(up.sufficient_data);
    CHECK(up.signal == TrendSignal::StrongUp);
    CHECK(up.ema_short > up.ema_medium);
    CHECK(up.ema_medium > up.ema_long);
    CHECK(up.confidence > 0.0);

    const auto down = grid::classify_trend(trending(300, 400.0, -0.5), config);
    CHECK(down.signal == TrendSignal::StrongDown);

    const auto flat = grid::classify_trend(choppy(300), config);
    CHECK(flat.signal == TrendSignal::Ranging);
    CHECK(flat.confidence == 0.0);
}

TEST_CASE("classify_trend needs enough history") {
    const grid::SignalConfig config;
    const auto snapshot = grid::classify_trend(trending(config.min_bars() - 1, 100.0, 0.5), config);
    CHECK_FALSE(snapshot.sufficient_data);
    CHECK(snapshot.signal == TrendSignal::Ranging);
}

TEST_CASE("counter-trend side gets the widened spacing") {
    const auto up = grid::multipliers_for(TrendSignal::StrongUp, 2.0);
    CHECK(up.long_replenish == 1.0);
    CHECK(up.long_take_profit == 1.0);
    CHECK(up.short_replenish == 2.0);
    CHECK(up.short_take_profit == 2.0);

    const auto down = grid::multipliers_for(TrendSignal::StrongDown, 2.0);
    CHECK(down.long_replenish == 2.0);
    CHECK(down.short_replenish == 1.0);

    const auto ranging = grid::multipliers_for(TrendSignal::Ranging, 2.0);
    CHECK(ranging.long_replenish == 1.0);
    CHECK(ranging.short_take_profit == 1.0);
}

TEST_CASE("SignalAdapter emits multipliers only on a classification change") {
    FakeGateway gateway;
    gateway.klines = trending(300, 100.0, 0.5);
    grid::SignalAdapter adapter{gateway, grid::SignalConfig{}};

    adapter.initialize(kStart);
    CHECK(adapter.current() == TrendSignal::StrongUp);
    CHECK_FALSE(adapter.due(kStart + std::chrono::minutes(59)));
    CHECK_FALSE(adapter.refresh(kStart + std::chrono::minutes(59)));
    CHECK(gateway.kline_fetches == 1);

    CHECK_FALSE(adapter.refresh(kStart + std::chrono::hours(1)));
    CHECK(gateway.kline_fetches == 2);

    gateway.klines = trending(300, 400.0, -0.5);
    const auto adjustment = adapter.refresh(kStart + std::chrono::hours(2));
    REQUIRE(adjustment);
    CHECK(adapter.current() == TrendSignal::StrongDown);
    CHECK(adjustment->long_replenish == 2.0);
    CHECK(adjustment->long_take_profit == 2.0);
    CHECK(adjustment->short_replenish == 1.0);
    REQUIRE(adapter.last_snapshot());
    CHECK(adapter.last_snapshot()->signal == TrendSignal::StrongDown);
}

TEST_CASE("SignalAdapter keeps its classification without enough bars") {
    FakeGateway gateway;
    gateway.klines = trending(100, 100.0, 0.5);
    grid::SignalAdapter adapter{gateway, grid::SignalConfig{}};

    adapter.initialize(kStart);
    CHECK(adapter.current() == TrendSignal::Ranging);
    CHECK_FALSE(adapter.refresh(kStart + std::chrono::hours(2)));
    CHECK(adapter.current() == TrendSignal::Ranging);
}
