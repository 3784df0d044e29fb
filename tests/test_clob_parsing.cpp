#include "strategy/clob_exchange.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using Catch::Approx;
using nlohmann::json;

TEST_CASE("Order book levels are decoded and malformed ones dropped") {
    const auto book = strategy::parse_order_book(json::parse(R"({
        "market": "0xabc",
        "asset_id": "123",
        "bids": [{"price": "0.48", "size": "30"}, {"price": "abc", "size": "5"},
                 {"price": "0.47", "size": "-1"}, {"price": "0.46", "size": "0"}],
        "asks": [{"price": 0.52, "size": 12.5}, {"size": "4"}, {"price": "0", "size": "4"}]
    })"));

    REQUIRE(book.bids.size() == 1);
    CHECK(book.bids[0].price == Approx(0.48));
    CHECK(book.bids[0].size == Approx(30.0));
    REQUIRE(book.asks.size() == 1);
    CHECK(book.asks[0].price == Approx(0.52));
    CHECK(book.asks[0].size == Approx(12.5));

    const auto empty = strategy::parse_order_book(json::parse(R"({"bids": []})"));
    CHECK(empty.bids.empty());
    CHECK(empty.asks.empty());
    CHECK_THROWS_AS(strategy::parse_order_book(json::array()), strategy::ExchangeError);
}

TEST_CASE("Tick size must be a positive fraction") {
    CHECK(strategy::parse_tick_size(json::parse(R"({"minimum_tick_size": 0.001})")) == Approx(0.001));
    CHECK(strategy::parse_tick_size(json::parse(R"({"minimum_tick_size": "0.01"})")) == Approx(0.01));
    CHECK(strategy::parse_tick_size(json(0.01)) == Approx(0.01));
    CHECK_THROWS_AS(strategy::parse_tick_size(json::parse(R"({"minimum_tick_size": 0})")), strategy::ExchangeError);
    CHECK_THROWS_AS(strategy::parse_tick_size(json::parse(R"({})")), strategy::ExchangeError);
}

TEST_CASE("Open orders page carries orders and the next cursor") {
    const auto page = strategy::parse_open_orders(json::parse(R"({
        "limit": 100, "count": 3, "next_cursor": "LTE=",
        "data": [
            {"id": "0x1", "asset_id": "222", "side": "BUY", "price": "0.45", "original_size": "20",
             "size_matched": "5", "created_at": 1700000000},
            {"id": "0x2", "asset_id": "222", "side": "sell", "price": "0.55", "original_size": "10",
             "size_matched": "0", "created_at": "1700000100"},
            {"id": "", "side": "BUY", "price": "0.45", "original_size": "20"},
            {"id": "0x4", "side": "HOLD", "price": "0.45", "original_size": "20"}
        ]
    })"));

    CHECK(page.next_cursor == "LTE=");
    REQUIRE(page.orders.size() == 2);
    CHECK(page.orders[0].id == "0x1");
    CHECK(page.orders[0].asset_id == "222");
    CHECK(page.orders[0].side == strategy::OrderSide::Buy);
    CHECK(page.orders[0].remaining() == Approx(15.0));
    CHECK(page.orders[0].created_at == 1700000000);
    CHECK(page.orders[1].side == strategy::OrderSide::Sell);
    CHECK(page.orders[1].created_at == 1700000100);

    const auto bare = strategy::parse_open_orders(json::array());
    CHECK(bare.orders.empty());
    CHECK(bare.next_cursor.empty());
    CHECK_THROWS_AS(strategy::parse_open_orders(json::parse(R"({"error": "unauthorized"})")),
                    strategy::ExchangeError);
}

TEST_CASE("Positions come from the data API shape") {
    const auto records = strategy::parse_positions(json::parse(R"([
        {"asset": "222", "conditionId": "0xabc", "size": 13.5, "avgPrice": 0.45,
         "currentValue": 6.75, "title": "Will it rain?"},
        {"asset": "333", "conditionId": "0xdef", "size": "2", "avgPrice": "0.1"},
        {"asset": "444", "title": "no size"}
    ])"));

    REQUIRE(records.size() == 2);
    CHECK(records[0].asset_id == "222");
    CHECK(records[0].title == "Will it rain?");
    CHECK(records[0].position.size == Approx(13.5));
    CHECK(records[0].position.avg_price == Approx(0.45));
    CHECK(records[0].position.current_value == Approx(6.75));
    CHECK(records[1].title == "0xdef");
    CHECK(records[1].position.current_value == 0.0);
    CHECK_THROWS_AS(strategy::parse_positions(json::object()), strategy::ExchangeError);
}

TEST_CASE("Collateral balance is scaled from base units") {
    CHECK(strategy::parse_collateral_balance(json::parse(R"({"balance": "123450000", "allowance": "0"})")) ==
          Approx(123.45));
    CHECK(strategy::parse_collateral_balance(json::parse(R"({"balance": 0})")) == 0.0);
    CHECK_THROWS_AS(strategy::parse_collateral_balance(json::object()), strategy::ExchangeError);
}

TEST_CASE("Order placement and cancel responses are checked") {
    CHECK(strategy::parse_posted_order_id(json::parse(R"({"success": true, "errorMsg": "", "orderID": "0xfeed"})")) ==
          "0xfeed");
    CHECK_THROWS_AS(strategy::parse_posted_order_id(json::parse(
                        R"({"success": false, "errorMsg": "not enough balance / allowance"})")),
                    strategy::ExchangeError);
    CHECK_THROWS_AS(strategy::parse_posted_order_id(json::parse(R"({"success": true})")), strategy::ExchangeError);

    CHECK_NOTHROW(strategy::check_cancel_response(json::parse(R"({"canceled": ["0x1"], "not_canceled": {}})"), "0x1"));
    CHECK_THROWS_AS(strategy::check_cancel_response(
                        json::parse(R"({"canceled": [], "not_canceled": {"0x1": "order already filled"}})"), "0x1"),
                    strategy::ExchangeError);
}

TEST_CASE("Order sizes are floored to hundredths") {
    CHECK(strategy::floor_order_size(20.0) == Approx(20.0));
    CHECK(strategy::floor_order_size(14.2857) == Approx(14.28));
    CHECK(strategy::floor_order_size(0.009) == 0.0);
}

TEST_CASE("Without a signer the adapter never mutates the venue") {
    clob::HttpClient http;
    clob::ClobClient clob_client{clob::Credentials{}, http, "http://127.0.0.1:9"};
    clob::DataClient data_client{http, "http://127.0.0.1:9"};
    strategy::ClobExchange exchange{clob_client, data_client, "0xWallet", nullptr};

    CHECK(exchange.dry_run());
    CHECK(exchange.create_order("222", strategy::OrderSide::Buy, 0.45, 22.22) == "dry-1");
    CHECK(exchange.create_order("222", strategy::OrderSide::Sell, 0.55, 10.0) == "dry-2");
    CHECK_NOTHROW(exchange.cancel_order("0x1"));
    CHECK_THROWS_AS(exchange.create_order("222", strategy::OrderSide::Buy, 0.45, 0.004), strategy::ExchangeError);
    CHECK_THROWS_AS(exchange.create_order("222", strategy::OrderSide::Buy, 1.0, 10.0), strategy::ExchangeError);
}
