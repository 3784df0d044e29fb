#pragma once

#include "strategy/config.hpp"
#include "strategy/market_maker.hpp"
#include "strategy/notifier.hpp"
#include "strategy/types.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace strategy {

struct SchedulerOptions {
    std::chrono::seconds interval{10};
    int alert_after_failures = 50;
    std::string wallet;                 // shown in start-up notices only
    bool print_reports = true;
};

// Polling loop: every round reloads the enabled markets, runs one market task per
// market in parallel and prints the cycle report once all have finished.
class MarketScheduler {
public:
    MarketScheduler(MarketConfigSource& markets,
                    MarketMaker& market_maker,
                    Notifier& notifier,
                    SchedulerOptions options);

    MarketScheduler(const MarketScheduler&) = delete;
    MarketScheduler& operator=(const MarketScheduler&) = delete;

    // Results come back in the order of `markets`. A failing market yields an
    // error marker and never affects its siblings.
    std::vector<MarketResult> run_cycle(const std::vector<MarketConfig>& markets);

    // Loads the markets and runs one cycle. Returns false when the round itself
    // failed; the consecutive-failure counter and alerting are handled here.
    bool run_round();

    // Runs rounds until stop() is called or `external_stop` becomes true. The
    // in-flight round always completes.
    void run(const std::atomic<bool>* external_stop = nullptr);

    void stop() noexcept { stop_requested_.store(true); }

    [[nodiscard]] int consecutive_failures() const noexcept { return consecutive_failures_; }
    [[nodiscard]] long long rounds() const noexcept { return rounds_; }

private:
    bool should_stop(const std::atomic<bool>* external_stop) const;
    void sleep_between_rounds(const std::atomic<bool>* external_stop) const;

    MarketConfigSource& markets_;
    MarketMaker& market_maker_;
    Notifier& notifier_;
    SchedulerOptions options_;
    std::atomic<bool> stop_requested_{false};
    int consecutive_failures_ = 0;
    long long rounds_ = 0;
};

} // namespace strategy
