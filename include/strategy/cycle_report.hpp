#pragma once

#include "strategy/types.hpp"

#include <string>
#include <vector>

namespace strategy {

// Terminal summary of one polling round, one block per market.
class CycleReport {
public:
    explicit CycleReport(bool use_color = true);

    [[nodiscard]] std::string render(const std::vector<MarketResult>& results, long long round) const;

private:
    bool use_color_;

    // Color codes (ANSI)
    static constexpr const char* RESET = "\033[0m";
    static constexpr const char* BOLD = "\033[1m";
    static constexpr const char* RED = "\033[31m";
    static constexpr const char* GREEN = "\033[32m";
    static constexpr const char* YELLOW = "\033[33m";
    static constexpr const char* BLUE = "\033[34m";
    static constexpr const char* GRAY = "\033[90m";

    const char* color(const char* code) const;
    void render_market(std::string& out, const MarketResult& result) const;
};

std::string render_cycle_report(const std::vector<MarketResult>& results, long long round, bool use_color = true);

// Prices print with 3 decimals on 0.001-tick markets, 2 otherwise.
std::string format_price(double price, double tick_size);
std::string format_value(double value, int precision = 2);

} // namespace strategy
