#include "strategy/order_reconciler.hpp"

#include "strategy/liquidity_view.hpp"
#include "strategy/log.hpp"

#include <algorithm>
#include <iomanip>
#include <utility>

namespace strategy {
namespace {

constexpr double kEpsilon = 1e-9;

} // namespace

ReconciliationPlan plan_reconciliation(const std::vector<OwnOrder>& live,
                                       const QuoteSide& target,
                                       OrderSide side,
                                       double tick_size,
                                       const QuotingParams& params) {
    ReconciliationPlan plan;
    const double target_price = normalize_price(target.price, tick_size);
    const long long target_tick = tick_index(target_price, tick_size);

    std::vector<const OwnOrder*> correct;
    for (const auto& order : live) {
        if (tick_index(order.price, tick_size) != target_tick) {
            plan.cancel_ids.push_back(order.id);
        } else {
            correct.push_back(&order);
        }
    }

    std::stable_sort(correct.begin(), correct.end(), [](const OwnOrder* a, const OwnOrder* b) {
        return a->created_at > b->created_at;
    });

    double current_value = 0.0;
    for (const auto* order : correct) {
        current_value += order->remaining() * target_price;
    }

    std::size_t trimmed = 0;
    if (current_value > target.value + params.value_tolerance) {
        for (const auto* order : correct) {
            if (current_value <= target.value + params.value_tolerance) {
                break;
            }
            plan.cancel_ids.push_back(order->id);
            current_value -= order->remaining() * target_price;
            ++trimmed;
        }
    }
    plan.kept = correct.size() - trimmed;

    double shortfall = target.value - current_value;
    if (target_price > 0.0 && shortfall + kEpsilon >= params.min_order_value) {
        if (side == OrderSide::Buy) {
            while (shortfall + kEpsilon >= params.min_order_value) {
                const double chunk = std::min(shortfall, params.max_buy_order_value);
                plan.creates.push_back(OrderToCreate{target_price, chunk / target_price, chunk});
                current_value += chunk;
                shortfall -= chunk;
            }
        } else {
            plan.creates.push_back(OrderToCreate{target_price, shortfall / target_price, shortfall});
            current_value += shortfall;
        }
    }

    plan.resting_value = std::max(0.0, current_value);
    return plan;
}

OrderReconciler::OrderReconciler(Exchange& exchange, QuotingParams params)
    : exchange_(exchange),
      params_(std::move(params)) {}

std::size_t OrderReconciler::reconcile(const std::string& market_name,
                                       const std::string& token_id,
                                       OrderSide side,
                                       const std::vector<OwnOrder>& live,
                                       const QuoteSide& target,
                                       double tick_size) {
    const auto plan = plan_reconciliation(live, target, side, tick_size, params_);

    for (const auto& order_id : plan.cancel_ids) {
        exchange_.cancel_order(order_id);
        log_info("Orders") << market_name << ": cancelled " << to_string(side) << " order " << order_id;
    }

    for (const auto& order : plan.creates) {
        const auto order_id = exchange_.create_order(token_id, side, order.price, order.size);
        log_info("Orders") << market_name << ": placed " << to_string(side) << " id=" << order_id
                           << std::fixed << std::setprecision(3) << " price=" << order.price
                           << std::setprecision(2) << " size=" << order.size
                           << " value=$" << order.value;
    }

    return plan.resulting_count();
}

} // namespace strategy
