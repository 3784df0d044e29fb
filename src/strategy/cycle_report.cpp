#include "strategy/cycle_report.hpp"

#include "strategy/notifier.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace strategy {

CycleReport::CycleReport(bool use_color)
    : use_color_(use_color) {}

const char* CycleReport::color(const char* code) const {
    return use_color_ ? code : "";
}

std::string format_price(double price, double tick_size) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(tick_size > 0.0 && tick_size < 0.01 - 1e-12 ? 3 : 2) << price;
    return oss.str();
}

std::string format_value(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

void CycleReport::render_market(std::string& out, const MarketResult& result) const {
    std::ostringstream oss;
    std::string side = result.side;
    std::transform(side.begin(), side.end(), side.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    oss << color(YELLOW) << "[" << result.name << "] [" << side << "]" << color(RESET) << "\n";
    if (!result.ok()) {
        oss << "  " << color(RED) << "error: " << result.error << color(RESET) << "\n\n";
        out += oss.str();
        return;
    }

    const double edge = result.sell_price - result.buy_price;
    const double edge_pct = result.buy_price > 0.0 ? edge / result.buy_price * 100.0 : 0.0;

    oss << "  " << color(GRAY) << "market: bid@" << format_price(result.best_bid, result.tick_size)
        << " ask@" << format_price(result.best_ask, result.tick_size) << color(RESET) << "\n";
    oss << "  " << color(GRAY) << "quotes: buy@" << format_price(result.buy_price, result.tick_size)
        << " sell@" << format_price(result.sell_price, result.tick_size)
        << " | edge=" << format_price(edge, result.tick_size) << "(" << format_value(edge_pct) << "%)"
        << color(RESET) << "\n";
    oss << "  " << color(GRAY) << "ahead: bid $" << format_value(result.bid_depth_ahead)
        << " ask $" << format_value(result.ask_depth_ahead) << color(RESET) << "\n";

    const char* position_color = result.position_value > 0.0 ? GREEN : GRAY;
    const char* buy_color = result.buy_order_count > 0 ? GREEN : GRAY;
    const char* sell_color = result.sell_order_count > 0 ? GREEN : GRAY;
    oss << "  " << color(position_color) << "position=" << format_value(result.position_value, 1) << "/"
        << format_value(result.max_position_value, 0) << "(" << format_value(result.position_ratio * 100.0, 0)
        << "%)" << color(RESET) << " " << color(GRAY) << "|" << color(RESET) << " "
        << color(buy_color) << "buys " << result.buy_order_count << color(RESET) << " "
        << color(sell_color) << "sells " << result.sell_order_count << color(RESET) << "\n\n";
    out += oss.str();
}

std::string CycleReport::render(const std::vector<MarketResult>& results, long long round) const {
    std::string out;
    const std::string rule(60, '=');
    out += std::string(color(BOLD)) + color(BLUE) + rule + "\n";
    out += "[" + format_timestamp(std::chrono::system_clock::now()) + "] round " + std::to_string(round) + "\n";
    out += rule + color(RESET) + "\n";

    std::size_t failed = 0;
    for (const auto& result : results) {
        render_market(out, result);
        if (!result.ok()) {
            ++failed;
        }
    }

    out += std::to_string(results.size() - failed) + "/" + std::to_string(results.size()) + " markets ok\n";
    return out;
}

std::string render_cycle_report(const std::vector<MarketResult>& results, long long round, bool use_color) {
    return CycleReport(use_color).render(results, round);
}

} // namespace strategy
