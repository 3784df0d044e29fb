#include "strategy/market_maker.hpp"

#include "strategy/log.hpp"
#include "strategy/price_resolver.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>

namespace strategy {
namespace {

constexpr double kMinHoldingSize = 0.01;

std::vector<OwnOrder> orders_on_side(const std::vector<OwnOrder>& orders, OrderSide side) {
    std::vector<OwnOrder> selected;
    std::copy_if(orders.begin(), orders.end(), std::back_inserter(selected), [side](const OwnOrder& order) {
        return order.side == side;
    });
    return selected;
}

} // namespace

MarketMaker::MarketMaker(Exchange& exchange, Notifier& notifier, FillTracker& fills, QuotingParams params)
    : exchange_(exchange),
      notifier_(notifier),
      fills_(fills),
      params_(std::move(params)),
      reconciler_(exchange, params_) {}

MarketResult MarketMaker::process_market(const MarketConfig& market) {
    try {
        return run_market(market);
    } catch (const std::exception& ex) {
        log_error("Market") << market.name << ": " << ex.what();
        MarketResult result;
        result.name = market.name;
        result.market_id = market.market_id;
        result.side = to_string(market.trade_side);
        result.max_position_value = market.max_position_value;
        result.error = ex.what();
        return result;
    }
}

MarketResult MarketMaker::run_market(const MarketConfig& market) {
    const auto& token_id = market.token_id();

    // Mandatory reads; a failure aborts this market for the round.
    const double tick_size = exchange_.get_tick_size(token_id);
    const auto own_orders = read_own_orders(market);

    const auto book = read_order_book(market);
    const auto view = build_liquidity_view(book, own_orders, tick_size);

    const auto position = read_position(market);
    const double free_cash = read_free_cash(market);

    TargetQuote target;
    if (position.ok) {
        track_fill(market, position.position);
        target = compute_target_quote(view,
                                      QuoteInputs{position.position, free_cash, market.max_position_value, tick_size},
                                      params_);
    } else {
        target = idle_target_quote(view);
    }

    MarketResult result;
    result.name = market.name;
    result.market_id = market.market_id;
    result.side = to_string(market.trade_side);
    result.tick_size = tick_size;
    result.best_bid = view.best_bid();
    result.best_ask = view.best_ask();
    result.buy_price = target.buy.price;
    result.sell_price = target.sell.price;
    result.position_value = position.position.current_value;
    result.max_position_value = market.max_position_value;
    result.position_ratio = market.max_position_value > 0.0
        ? position.position.current_value / market.max_position_value
        : 0.0;
    if (target.buy.price > 0.0) {
        result.bid_depth_ahead = cumulative_value_to_price(view.bids, target.buy.price, true);
    }
    if (target.sell.price > 0.0) {
        result.ask_depth_ahead = cumulative_value_to_price(view.asks, target.sell.price, false);
    }

    result.buy_order_count = reconciler_.reconcile(market.name, token_id, OrderSide::Buy,
                                                   orders_on_side(own_orders, OrderSide::Buy),
                                                   target.buy, tick_size);
    result.sell_order_count = reconciler_.reconcile(market.name, token_id, OrderSide::Sell,
                                                    orders_on_side(own_orders, OrderSide::Sell),
                                                    target.sell, tick_size);
    return result;
}

std::vector<OwnOrder> MarketMaker::read_own_orders(const MarketConfig& market) {
    auto orders = exchange_.get_open_orders(market.market_id);
    const auto& token_id = market.token_id();
    // Orders on the other outcome token of the same market are not ours to manage.
    orders.erase(std::remove_if(orders.begin(), orders.end(), [&token_id](const OwnOrder& order) {
                     return !order.asset_id.empty() && order.asset_id != token_id;
                 }),
                 orders.end());
    return orders;
}

OrderBookLevels MarketMaker::read_order_book(const MarketConfig& market) {
    try {
        return exchange_.get_order_book(market.token_id());
    } catch (const std::exception& ex) {
        log_error("Market") << market.name << ": order book unavailable, quoting against an empty book: " << ex.what();
        return {};
    }
}

MarketMaker::PositionRead MarketMaker::read_position(const MarketConfig& market) {
    try {
        PositionRead read;
        read.position = exchange_.get_position(market.market_id, market.token_id()).value_or(Position{});
        read.ok = true;
        return read;
    } catch (const std::exception& ex) {
        log_error("Market") << market.name << ": position unavailable, standing aside this round: " << ex.what();
        return {};
    }
}

double MarketMaker::read_free_cash(const MarketConfig& market) {
    try {
        return exchange_.get_free_cash();
    } catch (const std::exception& ex) {
        log_error("Market") << market.name << ": balance unavailable, assuming no cash: " << ex.what();
        return 0.0;
    }
}

void MarketMaker::track_fill(const MarketConfig& market, const Position& position) {
    const auto event = fills_.observe(market.market_id, market.name, position.size, position.current_value);
    if (!event) {
        return;
    }

    log_info("Fill") << market.name << ": " << (event->is_buy() ? "BUY" : "SELL") << " filled, delta="
                     << event->delta << " size=" << event->new_size;
    notifier_.notify(fill_notification(*event, read_portfolio()));
}

std::optional<PortfolioSummary> MarketMaker::read_portfolio() {
    try {
        PortfolioSummary summary;
        for (auto& holding : exchange_.get_holdings()) {
            if (holding.size > kMinHoldingSize) {
                summary.holdings.push_back(std::move(holding));
            }
        }
        summary.cash = exchange_.get_free_cash();
        return summary;
    } catch (const std::exception& ex) {
        log_error("Fill") << "Portfolio summary unavailable: " << ex.what();
        return std::nullopt;
    }
}

} // namespace strategy
