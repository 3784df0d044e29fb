#include "strategy/price_resolver.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using Catch::Approx;
using strategy::Ladder;

namespace {

const Ladder kBids = {{0.50, 60.0}, {0.49, 200.0}, {0.48, 100.0}};
const Ladder kAsks = {{0.52, 50.0}, {0.53, 100.0}, {0.55, 40.0}};

} // namespace

TEST_CASE("Price for value uses the cumulative notional crossing rule") {
    const Ladder ladder = {{0.50, 60.0}, {0.49, 200.0}};
    // 0.50 * 60 = 30 < 40, crossing happens at 0.49 (30 + 98 = 128).
    CHECK(strategy::resolve_price_for_value(ladder, 40.0, true) == Approx(0.49));
    CHECK(strategy::resolve_price_for_value(ladder, 30.0, true) == Approx(0.50));
    CHECK(strategy::resolve_price_for_value(ladder, 29.99, true) == Approx(0.50));
}

TEST_CASE("Price for value walks the ask side from the lowest ask") {
    CHECK(strategy::resolve_price_for_value(kAsks, 26.0, false) == Approx(0.52));
    CHECK(strategy::resolve_price_for_value(kAsks, 27.0, false) == Approx(0.53));
    CHECK(strategy::resolve_price_for_value(kAsks, 79.0, false) == Approx(0.53));
    CHECK(strategy::resolve_price_for_value(kAsks, 80.0, false) == Approx(0.55));
}

TEST_CASE("A non-positive target returns the best price") {
    for (const double target : {0.0, -1.0, -1000.0}) {
        CHECK(strategy::resolve_price_for_value(kBids, target, true) == Approx(0.50));
        CHECK(strategy::resolve_price_for_value(kAsks, target, false) == Approx(0.52));
    }
}

TEST_CASE("An empty ladder returns the degenerate bound") {
    CHECK(strategy::resolve_price_for_value({}, 10.0, true) == 0.0);
    CHECK(strategy::resolve_price_for_value({}, 10.0, false) == 1.0);
    CHECK(strategy::resolve_price_for_value({}, 0.0, true) == 0.0);
    CHECK(strategy::resolve_price_for_value({}, 0.0, false) == 1.0);
}

TEST_CASE("A target deeper than the ladder saturates at the worst price") {
    CHECK(strategy::resolve_price_for_value(kBids, 1e6, true) == Approx(0.48));
    CHECK(strategy::resolve_price_for_value(kAsks, 1e6, false) == Approx(0.55));
}

TEST_CASE("Cumulative value includes the level that reaches the limit") {
    CHECK(strategy::cumulative_value_to_price(kBids, 0.50, true) == Approx(30.0));
    CHECK(strategy::cumulative_value_to_price(kBids, 0.49, true) == Approx(128.0));
    CHECK(strategy::cumulative_value_to_price(kBids, 0.40, true) == Approx(176.0));
    // A limit better than the best level still counts the best level.
    CHECK(strategy::cumulative_value_to_price(kBids, 0.55, true) == Approx(30.0));

    CHECK(strategy::cumulative_value_to_price(kAsks, 0.52, false) == Approx(26.0));
    CHECK(strategy::cumulative_value_to_price(kAsks, 0.54, false) == Approx(101.0));
    CHECK(strategy::cumulative_value_to_price({}, 0.5, true) == 0.0);
    CHECK(strategy::cumulative_value_to_price({}, 0.5, false) == 0.0);
}

TEST_CASE("Cumulative value never shrinks as the limit moves away from the best price") {
    double previous = 0.0;
    for (int cents = 55; cents >= 40; --cents) {
        const double value = strategy::cumulative_value_to_price(kBids, cents / 100.0, true);
        CHECK(value >= previous);
        previous = value;
    }

    previous = 0.0;
    for (int cents = 50; cents <= 60; ++cents) {
        const double value = strategy::cumulative_value_to_price(kAsks, cents / 100.0, false);
        CHECK(value >= previous);
        previous = value;
    }
}
