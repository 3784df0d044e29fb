#include "strategy/market_maker.hpp"

#include "fake_exchange.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <string>

using Catch::Approx;
using strategy::OrderSide;
using testing::make_order;

namespace {

struct Fixture {
    testing::FakeExchange exchange;
    testing::RecordingNotifier notifier;
    strategy::FillTracker fills;
    strategy::MarketMaker maker{exchange, notifier, fills, strategy::QuotingParams{}};
    strategy::MarketConfig market = testing::make_market("Election", "m1", "t1");

    Fixture() {
        exchange.ticks["t1"] = 0.01;
        exchange.books["t1"].bids = {{0.50, 100.0}, {0.49, 200.0}};
        exchange.books["t1"].asks = {{0.53, 100.0}};
        exchange.free_cash = 100.0;
    }
};

strategy::OwnOrder own(std::string id, OrderSide side, double price, double size, std::string asset = "t1") {
    auto order = make_order(std::move(id), side, price, size, 1);
    order.asset_id = std::move(asset);
    return order;
}

} // namespace

TEST_CASE("A flat market gets a chunked bid and a summary result") {
    Fixture f;
    const auto result = f.maker.process_market(f.market);

    REQUIRE(result.ok());
    CHECK(result.name == "Election");
    CHECK(result.market_id == "m1");
    CHECK(result.side == "no");
    CHECK(result.tick_size == Approx(0.01));
    CHECK(result.best_bid == Approx(0.50));
    CHECK(result.best_ask == Approx(0.53));
    CHECK(result.buy_price == Approx(0.50));
    CHECK(result.sell_price == Approx(0.53));
    CHECK(result.buy_order_count == 3);
    CHECK(result.sell_order_count == 0);
    CHECK(result.bid_depth_ahead == Approx(50.0));
    CHECK(result.ask_depth_ahead == Approx(53.0));
    CHECK(result.max_position_value == Approx(25.0));

    const auto created = f.exchange.created_orders();
    REQUIRE(created.size() == 3);
    for (const auto& order : created) {
        CHECK(order.token_id == "t1");
        CHECK(order.side == OrderSide::Buy);
        CHECK(order.price == Approx(0.50));
    }
}

TEST_CASE("Own resting orders are excluded from the book and topped up") {
    Fixture f;
    f.exchange.open_orders["m1"] = {
        own("mine", OrderSide::Buy, 0.50, 40.0),
        own("other-token", OrderSide::Buy, 0.40, 40.0, "m1-yes"),
    };

    const auto result = f.maker.process_market(f.market);
    REQUIRE(result.ok());
    CHECK(result.best_bid == Approx(0.50));
    CHECK(result.bid_depth_ahead == Approx(30.0));
    CHECK(result.buy_order_count == 2);
    CHECK(f.exchange.cancelled_orders().empty());

    const auto created = f.exchange.created_orders();
    REQUIRE(created.size() == 1);
    CHECK(created[0].size * created[0].price == Approx(5.0));
}

TEST_CASE("A held position is offered above its entry price") {
    Fixture f;
    f.exchange.set_position("t1", 20.0, 0.45, 10.0);

    const auto result = f.maker.process_market(f.market);
    REQUIRE(result.ok());
    CHECK(result.position_value == Approx(10.0));
    CHECK(result.position_ratio == Approx(0.4));
    CHECK(result.sell_price == Approx(0.53));
    CHECK(result.sell_order_count == 1);

    bool found_sell = false;
    for (const auto& order : f.exchange.created_orders()) {
        if (order.side == OrderSide::Sell) {
            found_sell = true;
            CHECK(order.size == Approx(20.0));
            CHECK(order.price == Approx(0.53));
        }
    }
    CHECK(found_sell);
}

TEST_CASE("A missing order book degrades to no new orders") {
    Fixture f;
    f.exchange.failing_books.insert("t1");
    f.exchange.open_orders["m1"] = {own("resting", OrderSide::Buy, 0.48, 20.0)};

    const auto result = f.maker.process_market(f.market);
    REQUIRE(result.ok());
    CHECK(result.best_bid == 0.0);
    CHECK(result.best_ask == 1.0);
    CHECK(result.buy_order_count == 0);
    CHECK(f.exchange.created_orders().empty());
    REQUIRE(f.exchange.cancelled_orders().size() == 1);
}

TEST_CASE("An unreadable position stands aside without touching the fill baseline") {
    Fixture f;
    f.exchange.failing_positions.insert("m1");
    f.exchange.open_orders["m1"] = {own("bid", OrderSide::Buy, 0.50, 20.0)};

    const auto result = f.maker.process_market(f.market);
    REQUIRE(result.ok());
    CHECK(f.exchange.created_orders().empty());
    CHECK(f.exchange.cancelled_orders().size() == 1);
    CHECK_FALSE(f.fills.last_size("m1").has_value());
}

TEST_CASE("An unreadable balance means no cash to buy with") {
    Fixture f;
    f.exchange.fail_cash = true;

    const auto result = f.maker.process_market(f.market);
    REQUIRE(result.ok());
    CHECK(result.buy_order_count == 0);
    CHECK(f.exchange.created_orders().empty());
}

TEST_CASE("Mandatory read and order failures become an error marker") {
    Fixture f;

    SECTION("tick size") {
        f.exchange.failing_ticks.insert("t1");
        const auto result = f.maker.process_market(f.market);
        CHECK_FALSE(result.ok());
        CHECK(result.name == "Election");
        CHECK(result.error.find("tick size") != std::string::npos);
        CHECK(f.exchange.created_orders().empty());
    }

    SECTION("rejected order") {
        f.exchange.fail_creates = true;
        const auto result = f.maker.process_market(f.market);
        CHECK_FALSE(result.ok());
        CHECK(result.error == "not enough balance");
    }
}

TEST_CASE("A position change between rounds is announced as a fill") {
    Fixture f;
    f.exchange.set_position("t1", 10.0, 0.45, 5.0);
    f.exchange.holdings = {{"Election", "t1", 13.5, 6.75}, {"Dust", "t9", 0.001, 0.0}};

    f.maker.process_market(f.market);
    CHECK(f.notifier.notifications().empty());

    f.exchange.set_position("t1", 13.5, 0.45, 6.75);
    f.maker.process_market(f.market);

    const auto notifications = f.notifier.notifications();
    REQUIRE(notifications.size() == 1);
    CHECK(notifications[0].title == "Buy filled - Election");
    CHECK(notifications[0].body.find("+3.50") != std::string::npos);
    CHECK(notifications[0].body.find("Dust") == std::string::npos);
    CHECK(notifications[0].body.find("Cash: $100.00") != std::string::npos);
}
