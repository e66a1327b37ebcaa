#include "grid/price_guard.hpp"
#include "grid/volatility_tracker.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

TEST_CASE("validate_price rejects unusable candidates") {
    CHECK_FALSE(grid::validate_price(0.0, std::nullopt).accepted());
    CHECK_FALSE(grid::validate_price(-1.0, 1.0).accepted());
    CHECK_FALSE(grid::validate_price(std::numeric_limits<double>::quiet_NaN(), 1.0).accepted());
    CHECK_FALSE(grid::validate_price(std::numeric_limits<double>::infinity(), std::nullopt).accepted());
    CHECK(grid::validate_price(0.5, std::nullopt).accepted());
}

TEST_CASE("validate_price bounds the single-tick jump") {
    CHECK(grid::validate_price(1.09, 1.0).accepted());
    CHECK(grid::validate_price(0.95, 1.0).accepted());
    const auto rejected = grid::validate_price(1.11, 1.0);
    CHECK_FALSE(rejected.accepted());
    CHECK_FALSE(rejected.reason.empty());
    CHECK_FALSE(grid::validate_price(0.85, 1.0).accepted());
}

TEST_CASE("PriceGuard keeps the last good price on rejection") {
    grid::PriceGuard guard;
    CHECK_FALSE(guard.last_good());

    REQUIRE(guard.offer(1.0).accepted());
    CHECK(*guard.last_good() == Catch::Approx(1.0));

    CHECK_FALSE(guard.offer(2.0).accepted());
    CHECK(*guard.last_good() == Catch::Approx(1.0));

    REQUIRE(guard.offer(1.05).accepted());
    CHECK(*guard.last_good() == Catch::Approx(1.05));

    guard.reanchor(2.0);
    CHECK(*guard.last_good() == Catch::Approx(2.0));
    guard.reanchor(-1.0);
    CHECK(*guard.last_good() == Catch::Approx(2.0));
}

TEST_CASE("VolatilityTracker averages recent absolute deltas") {
    grid::VolatilityTracker tracker(4, 100, 50, 3);
    for (double price : {1.0, 1.01, 1.0, 1.01}) {
        CHECK_FALSE(tracker.add_price(price));
    }
    CHECK(tracker.sample_count() == 0);

    CHECK_FALSE(tracker.add_price(1.0));
    CHECK(tracker.current() == Catch::Approx(0.01));
    CHECK(tracker.sample_count() == 1);
    CHECK_FALSE(tracker.baseline());
}

TEST_CASE("VolatilityTracker freezes its baseline once captured") {
    grid::VolatilityTracker tracker(2, 100, 50, 3);
    tracker.add_price(1.0);
    tracker.add_price(1.02);
    CHECK_FALSE(tracker.add_price(1.0));
    CHECK_FALSE(tracker.add_price(1.02));
    CHECK(tracker.add_price(1.0));
    REQUIRE(tracker.baseline());
    CHECK(*tracker.baseline() == Catch::Approx(0.02));

    for (int i = 0; i < 10; ++i) {
        CHECK_FALSE(tracker.add_price(i % 2 == 0 ? 1.1 : 1.0));
    }
    CHECK(*tracker.baseline() == Catch::Approx(0.02));
    CHECK(tracker.current() == Catch::Approx(0.1));
}

TEST_CASE("VolatilityTracker ignores non-positive prices and restores baselines") {
    grid::VolatilityTracker tracker;
    CHECK_FALSE(tracker.add_price(0.0));
    CHECK_FALSE(tracker.add_price(-3.0));
    tracker.restore_baseline(0.002);
    REQUIRE(tracker.baseline());
    CHECK(*tracker.baseline() == Catch::Approx(0.002));
    tracker.restore_baseline(0.0);
    CHECK(*tracker.baseline() == Catch::Approx(0.002));
}
