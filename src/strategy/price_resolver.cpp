#include "strategy/price_resolver.hpp"

namespace strategy {

double resolve_price_for_value(const Ladder& ladder, double target_value, bool is_bid) {
    if (ladder.empty()) {
        return is_bid ? 0.0 : 1.0;
    }
    if (target_value <= 0.0) {
        return ladder.front().price;
    }

    double cumulative = 0.0;
    for (const auto& level : ladder) {
        cumulative += level.price * level.size;
        if (cumulative >= target_value) {
            return level.price;
        }
    }
    return ladder.back().price;
}

double cumulative_value_to_price(const Ladder& ladder, double price_limit, bool is_bid) {
    double cumulative = 0.0;
    for (const auto& level : ladder) {
        cumulative += level.price * level.size;
        const bool reached = is_bid ? level.price <= price_limit : level.price >= price_limit;
        if (reached) {
            break;
        }
    }
    return cumulative;
}

} // namespace strategy
