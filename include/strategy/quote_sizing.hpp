#pragma once

#include "strategy/liquidity_view.hpp"
#include "strategy/types.hpp"

namespace strategy {

struct QuotingParams {
    double min_profit = 0.007;          // minimum edge in price units
    double min_order_value = 5.0;       // smallest order worth posting
    double max_buy_order_value = 10.0;  // buy top-ups are split into chunks of at most this
    double max_price = 0.999;           // highest sell price the engine will ask
    double value_tolerance = 0.01;      // resting notional may exceed target by this much
};

struct QuoteInputs {
    Position position;
    double free_cash = 0.0;
    double max_position_value = 0.0;
    double tick_size = 0.01;
};

// max(0, min(max_position_value - cost basis, free_cash)). Cost basis, not market
// value, so unrealized gains never enlarge the budget.
[[nodiscard]] double available_to_buy(const Position& position, double free_cash, double max_position_value);

// Highest tick-aligned price not above `params.max_price` and strictly below 1.
[[nodiscard]] double sell_price_cap(double tick_size, const QuotingParams& params);

[[nodiscard]] TargetQuote compute_target_quote(const LiquidityView& view,
                                               const QuoteInputs& inputs,
                                               const QuotingParams& params);

// Target used when the position could not be read: post nothing on either side.
[[nodiscard]] TargetQuote idle_target_quote(const LiquidityView& view);

} // namespace strategy
