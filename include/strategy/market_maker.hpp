#pragma once

#include "strategy/exchange.hpp"
#include "strategy/fill_tracker.hpp"
#include "strategy/liquidity_view.hpp"
#include "strategy/notifier.hpp"
#include "strategy/order_reconciler.hpp"
#include "strategy/quote_sizing.hpp"
#include "strategy/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace strategy {

// Runs one polling round for one market: build the self-excluded liquidity view,
// size the quote, reconcile resting orders and feed the fill tracker. Safe to run
// for different markets concurrently; all shared state lives in the collaborators.
class MarketMaker {
public:
    MarketMaker(Exchange& exchange, Notifier& notifier, FillTracker& fills, QuotingParams params);

    // Never throws for market-level failures; they are reported through
    // MarketResult::error and logged under [Market].
    MarketResult process_market(const MarketConfig& market);

private:
    struct PositionRead {
        Position position;
        bool ok = false;
    };

    MarketResult run_market(const MarketConfig& market);

    std::vector<OwnOrder> read_own_orders(const MarketConfig& market);
    OrderBookLevels read_order_book(const MarketConfig& market);
    PositionRead read_position(const MarketConfig& market);
    double read_free_cash(const MarketConfig& market);

    void track_fill(const MarketConfig& market, const Position& position);
    std::optional<PortfolioSummary> read_portfolio();

    Exchange& exchange_;
    Notifier& notifier_;
    FillTracker& fills_;
    QuotingParams params_;
    OrderReconciler reconciler_;
};

} // namespace strategy
