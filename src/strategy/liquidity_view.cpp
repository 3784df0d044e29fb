#include "strategy/liquidity_view.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace strategy {

long long tick_index(double price, double tick_size) {
    return std::llround(price / tick_size);
}

double normalize_price(double price, double tick_size) {
    if (tick_size <= 0.0) {
        return price;
    }
    return static_cast<double>(tick_index(price, tick_size)) * tick_size;
}

Ladder build_ladder(const std::vector<BookLevel>& levels,
                    const std::vector<OwnOrder>& own_orders,
                    double tick_size,
                    bool is_bid) {
    if (!(tick_size > 0.0)) {
        throw std::invalid_argument("tick size must be positive");
    }

    const OrderSide own_side = is_bid ? OrderSide::Buy : OrderSide::Sell;
    std::map<long long, double> own_sizes;
    for (const auto& order : own_orders) {
        if (order.side != own_side) {
            continue;
        }
        own_sizes[tick_index(order.price, tick_size)] += order.remaining();
    }

    std::map<long long, double> book_sizes;
    for (const auto& level : levels) {
        book_sizes[tick_index(level.price, tick_size)] += level.size;
    }

    Ladder ladder;
    ladder.reserve(book_sizes.size());
    for (const auto& [index, book_size] : book_sizes) {
        const auto own = own_sizes.find(index);
        const double external = book_size - (own == own_sizes.end() ? 0.0 : own->second);
        if (external <= 0.0) {
            continue;
        }
        ladder.push_back(LadderLevel{static_cast<double>(index) * tick_size, external});
    }

    // std::map iterates ascending, which is already the ask order.
    if (is_bid) {
        std::reverse(ladder.begin(), ladder.end());
    }
    return ladder;
}

LiquidityView build_liquidity_view(const OrderBookLevels& book,
                                   const std::vector<OwnOrder>& own_orders,
                                   double tick_size) {
    LiquidityView view;
    view.bids = build_ladder(book.bids, own_orders, tick_size, true);
    view.asks = build_ladder(book.asks, own_orders, tick_size, false);
    return view;
}

} // namespace strategy
