#pragma once

#include "strategy/types.hpp"

namespace strategy {

// Walks the ladder from its best rung inward, accumulating price * size, and
// returns the first price at which the running notional reaches `target_value`.
// A non-positive target returns the best price; an empty ladder returns 0.0 for
// bids and 1.0 for asks; a target deeper than the ladder saturates at its worst price.
[[nodiscard]] double resolve_price_for_value(const Ladder& ladder, double target_value, bool is_bid);

// Notional resting from the best rung inward up to and including the first rung
// at or beyond `price_limit` (<= for bids, >= for asks). Empty ladder gives 0.
[[nodiscard]] double cumulative_value_to_price(const Ladder& ladder, double price_limit, bool is_bid);

} // namespace strategy
