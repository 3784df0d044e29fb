#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace strategy {

enum class OrderSide { Buy, Sell };

// Which of the market's two outcome tokens this engine trades.
enum class Outcome { Yes, No };

inline const char* to_string(OrderSide side) {
    return side == OrderSide::Buy ? "BUY" : "SELL";
}

inline const char* to_string(Outcome outcome) {
    return outcome == Outcome::Yes ? "yes" : "no";
}

struct MarketConfig {
    std::string name;
    std::string market_id;
    std::string yes_token_id;
    std::string no_token_id;
    Outcome trade_side = Outcome::No;
    bool enabled = true;
    double max_position_value = 25.0;

    [[nodiscard]] const std::string& token_id() const {
        return trade_side == Outcome::Yes ? yes_token_id : no_token_id;
    }
};

struct BookLevel {
    double price = 0.0;
    double size = 0.0;
};

struct OrderBookLevels {
    std::vector<BookLevel> bids;
    std::vector<BookLevel> asks;
};

struct OwnOrder {
    std::string id;
    std::string asset_id;
    OrderSide side = OrderSide::Buy;
    double price = 0.0;
    double original_size = 0.0;
    double size_matched = 0.0;
    long long created_at = 0;

    [[nodiscard]] double remaining() const {
        return std::max(0.0, original_size - size_matched);
    }
};

// One ladder rung: a tick-aligned price and the size resting there from others.
struct LadderLevel {
    double price = 0.0;
    double size = 0.0;
};

using Ladder = std::vector<LadderLevel>;

struct Position {
    double size = 0.0;
    double avg_price = 0.0;
    double current_value = 0.0;

    [[nodiscard]] double cost_basis() const { return size * avg_price; }
};

// Any holding in the account, used for the portfolio line of fill notices.
struct Holding {
    std::string title;
    std::string asset_id;
    double size = 0.0;
    double current_value = 0.0;
};

struct QuoteSide {
    double price = 0.0;
    double value = 0.0;

    [[nodiscard]] double size() const { return price > 0.0 ? value / price : 0.0; }
};

struct TargetQuote {
    QuoteSide buy;
    QuoteSide sell;
};

struct MarketResult {
    std::string name;
    std::string market_id;
    std::string side;
    double best_bid = 0.0;
    double best_ask = 1.0;
    double buy_price = 0.0;
    double sell_price = 0.0;
    double tick_size = 0.0;
    double position_value = 0.0;
    double max_position_value = 0.0;
    double position_ratio = 0.0;
    double bid_depth_ahead = 0.0;
    double ask_depth_ahead = 0.0;
    std::size_t buy_order_count = 0;
    std::size_t sell_order_count = 0;
    std::string error;

    [[nodiscard]] bool ok() const { return error.empty(); }
};

struct FillEvent {
    std::string market_id;
    std::string market_name;
    double delta = 0.0;
    double new_size = 0.0;
    double new_value = 0.0;

    [[nodiscard]] bool is_buy() const { return delta > 0.0; }
};

} // namespace strategy
