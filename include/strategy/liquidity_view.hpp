#pragma once

#include "strategy/types.hpp"

#include <vector>

namespace strategy {

// Index of the tick multiple nearest to `price`; two prices are the same level
// exactly when their tick indices match.
[[nodiscard]] long long tick_index(double price, double tick_size);

// round(price / tick) * tick
[[nodiscard]] double normalize_price(double price, double tick_size);

// Book liquidity on both sides with the caller's own resting size netted out.
struct LiquidityView {
    Ladder bids;   // descending by price
    Ladder asks;   // ascending by price

    [[nodiscard]] bool has_bids() const { return !bids.empty(); }
    [[nodiscard]] bool has_asks() const { return !asks.empty(); }

    // 0.0 without a buyer, 1.0 without a seller.
    [[nodiscard]] double best_bid() const { return bids.empty() ? 0.0 : bids.front().price; }
    [[nodiscard]] double best_ask() const { return asks.empty() ? 1.0 : asks.front().price; }
};

// Aggregates `levels` per normalized price, subtracts the remaining size of
// `own_orders` resting at that price and drops rungs left with nothing.
// Throws std::invalid_argument for a non-positive tick size.
[[nodiscard]] Ladder build_ladder(const std::vector<BookLevel>& levels,
                                  const std::vector<OwnOrder>& own_orders,
                                  double tick_size,
                                  bool is_bid);

// Own buy orders are netted against bids and own sell orders against asks.
[[nodiscard]] LiquidityView build_liquidity_view(const OrderBookLevels& book,
                                                 const std::vector<OwnOrder>& own_orders,
                                                 double tick_size);

} // namespace strategy
