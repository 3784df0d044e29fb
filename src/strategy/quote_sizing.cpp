#include "strategy/quote_sizing.hpp"

#include "strategy/price_resolver.hpp"

#include <algorithm>
#include <cmath>

namespace strategy {
namespace {

constexpr double kEpsilon = 1e-9;

} // namespace

double available_to_buy(const Position& position, double free_cash, double max_position_value) {
    const double headroom = max_position_value - position.cost_basis();
    return std::max(0.0, std::min(headroom, free_cash));
}

double sell_price_cap(double tick_size, const QuotingParams& params) {
    if (tick_size <= 0.0) {
        return params.max_price;
    }
    double cap = std::floor(params.max_price / tick_size + kEpsilon) * tick_size;
    if (cap >= 1.0 - kEpsilon) {
        cap = 1.0 - tick_size;
    }
    return normalize_price(cap, tick_size);
}

TargetQuote compute_target_quote(const LiquidityView& view,
                                 const QuoteInputs& inputs,
                                 const QuotingParams& params) {
    TargetQuote quote;
    const auto& position = inputs.position;

    const double budget = available_to_buy(position, inputs.free_cash, inputs.max_position_value);
    if (view.has_bids() && view.has_asks()) {
        quote.buy.price = resolve_price_for_value(view.bids, budget, true);
        // Only rest a bid when the visible edge to the best ask clears the minimum.
        const double edge = view.best_ask() - quote.buy.price;
        quote.buy.value = (edge + kEpsilon >= params.min_profit && quote.buy.price > 0.0) ? budget : 0.0;
    } else {
        quote.buy.price = view.best_bid();
        quote.buy.value = 0.0;
    }

    if (position.size > 0.0) {
        const double cap = sell_price_cap(inputs.tick_size, params);
        const double profit_floor = std::min(
            normalize_price(std::min(position.avg_price + params.min_profit, params.max_price), inputs.tick_size),
            cap);
        double sell_price = profit_floor;
        if (view.has_asks()) {
            const double sweep_price =
                resolve_price_for_value(view.asks, position.size * view.best_ask(), false);
            sell_price = std::max(sweep_price, profit_floor);
        }
        quote.sell.price = std::min(sell_price, cap);
        quote.sell.value = position.size * quote.sell.price;
    } else {
        quote.sell.price = view.best_ask();
        quote.sell.value = 0.0;
    }

    return quote;
}

TargetQuote idle_target_quote(const LiquidityView& view) {
    TargetQuote quote;
    quote.buy.price = view.best_bid();
    quote.sell.price = view.best_ask();
    return quote;
}

} // namespace strategy
