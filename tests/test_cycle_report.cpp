#include "strategy/cycle_report.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

strategy::MarketResult sample_result() {
    strategy::MarketResult result;
    result.name = "Rain in NYC";
    result.market_id = "m1";
    result.side = "no";
    result.tick_size = 0.01;
    result.best_bid = 0.50;
    result.best_ask = 0.53;
    result.buy_price = 0.49;
    result.sell_price = 0.53;
    result.position_value = 12.34;
    result.max_position_value = 25.0;
    result.position_ratio = 12.34 / 25.0;
    result.bid_depth_ahead = 128.0;
    result.ask_depth_ahead = 53.0;
    result.buy_order_count = 2;
    result.sell_order_count = 1;
    return result;
}

} // namespace

TEST_CASE("Price precision follows the tick size") {
    CHECK(strategy::format_price(0.5, 0.01) == "0.50");
    CHECK(strategy::format_price(0.5, 0.001) == "0.500");
    CHECK(strategy::format_value(12.345) == "12.35");
    CHECK(strategy::format_value(12.345, 0) == "12");
}

TEST_CASE("Cycle report summarizes each market") {
    const auto text = strategy::render_cycle_report({sample_result()}, 7, false);

    CHECK(text.find("round 7") != std::string::npos);
    CHECK(text.find("[Rain in NYC] [NO]") != std::string::npos);
    CHECK(text.find("market: bid@0.50 ask@0.53") != std::string::npos);
    CHECK(text.find("quotes: buy@0.49 sell@0.53 | edge=0.04(8.16%)") != std::string::npos);
    CHECK(text.find("ahead: bid $128.00 ask $53.00") != std::string::npos);
    CHECK(text.find("position=12.3/25(49%)") != std::string::npos);
    CHECK(text.find("buys 2") != std::string::npos);
    CHECK(text.find("sells 1") != std::string::npos);
    CHECK(text.find("1/1 markets ok") != std::string::npos);
    CHECK(text.find("\033[") == std::string::npos);
}

TEST_CASE("Failed markets are shown with their error") {
    auto failed = sample_result();
    failed.name = "Broken";
    failed.error = "tick size unavailable";

    const auto text = strategy::render_cycle_report({sample_result(), failed}, 1, false);
    CHECK(text.find("[Broken] [NO]") != std::string::npos);
    CHECK(text.find("error: tick size unavailable") != std::string::npos);
    CHECK(text.find("1/2 markets ok") != std::string::npos);
}

TEST_CASE("Colored output wraps sections in ANSI codes") {
    const auto text = strategy::render_cycle_report({sample_result()}, 1, true);
    CHECK(text.find("\033[33m[Rain in NYC]") != std::string::npos);
    CHECK(text.find("\033[0m") != std::string::npos);
}
