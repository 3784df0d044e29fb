#pragma once

#include "strategy/exchange.hpp"
#include "strategy/quote_sizing.hpp"
#include "strategy/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace strategy {

struct OrderToCreate {
    double price = 0.0;
    double size = 0.0;
    double value = 0.0;
};

struct ReconciliationPlan {
    std::vector<std::string> cancel_ids;
    std::vector<OrderToCreate> creates;
    std::size_t kept = 0;            // correctly priced orders left resting
    double resting_value = 0.0;      // notional after the plan is applied

    [[nodiscard]] std::size_t resulting_count() const { return kept + creates.size(); }
    [[nodiscard]] bool empty() const { return cancel_ids.empty() && creates.empty(); }
};

// Diffs `live` orders of one side against `target`:
//  1. cancel every order not resting at the target tick;
//  2. if the remaining notional exceeds the target by more than the tolerance,
//     cancel newest-first until it no longer does;
//  3. top up a shortfall of at least min_order_value, buys split into chunks of
//     at most max_buy_order_value, sells as one order.
[[nodiscard]] ReconciliationPlan plan_reconciliation(const std::vector<OwnOrder>& live,
                                                     const QuoteSide& target,
                                                     OrderSide side,
                                                     double tick_size,
                                                     const QuotingParams& params);

class OrderReconciler {
public:
    OrderReconciler(Exchange& exchange, QuotingParams params);

    // Applies the plan for one side of one market and returns the number of orders
    // left resting. Cancel/create failures propagate; nothing is retried in-round.
    std::size_t reconcile(const std::string& market_name,
                          const std::string& token_id,
                          OrderSide side,
                          const std::vector<OwnOrder>& live,
                          const QuoteSide& target,
                          double tick_size);

private:
    Exchange& exchange_;
    QuotingParams params_;
};

} // namespace strategy
