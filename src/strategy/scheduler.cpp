#include "strategy/scheduler.hpp"

#include "strategy/cycle_report.hpp"
#include "strategy/log.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <thread>
#include <utility>

namespace strategy {
namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds(250);

} // namespace

MarketScheduler::MarketScheduler(MarketConfigSource& markets,
                                 MarketMaker& market_maker,
                                 Notifier& notifier,
                                 SchedulerOptions options)
    : markets_(markets),
      market_maker_(market_maker),
      notifier_(notifier),
      options_(std::move(options)) {}

std::vector<MarketResult> MarketScheduler::run_cycle(const std::vector<MarketConfig>& markets) {
    std::vector<std::future<MarketResult>> tasks;
    tasks.reserve(markets.size());
    for (const auto& market : markets) {
        tasks.push_back(std::async(std::launch::async, [this, &market] {
            return market_maker_.process_market(market);
        }));
    }

    std::vector<MarketResult> results;
    results.reserve(markets.size());
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        try {
            results.push_back(tasks[i].get());
        } catch (const std::exception& ex) {
            log_error("Scheduler") << markets[i].name << ": task failed: " << ex.what();
            MarketResult failed;
            failed.name = markets[i].name;
            failed.market_id = markets[i].market_id;
            failed.side = to_string(markets[i].trade_side);
            failed.max_position_value = markets[i].max_position_value;
            failed.error = ex.what();
            results.push_back(std::move(failed));
        }
    }
    return results;
}

bool MarketScheduler::run_round() {
    ++rounds_;
    try {
        const auto markets = markets_.load_enabled_markets();
        if (markets.empty()) {
            log_info("Scheduler") << "No enabled markets configured";
        }

        const auto results = run_cycle(markets);
        if (options_.print_reports && !results.empty()) {
            write_block(std::cout, render_cycle_report(results, rounds_));
        }
        consecutive_failures_ = 0;
        return true;
    } catch (const std::exception& ex) {
        ++consecutive_failures_;
        log_error("Scheduler") << "Round " << rounds_ << " failed (" << consecutive_failures_
                               << " consecutive): " << ex.what();
        if (consecutive_failures_ == options_.alert_after_failures) {
            notifier_.notify(failure_alert(consecutive_failures_, ex.what()));
        }
        return false;
    }
}

void MarketScheduler::run(const std::atomic<bool>* external_stop) {
    log_info("Scheduler") << "Starting, interval " << options_.interval.count() << "s";
    notifier_.notify(startup_notification(options_.wallet, static_cast<int>(options_.interval.count())));

    while (!should_stop(external_stop)) {
        run_round();
        sleep_between_rounds(external_stop);
    }

    log_info("Scheduler") << "Stopped after " << rounds_ << " rounds";
    notifier_.notify(shutdown_notification(rounds_, "stop requested"));
}

bool MarketScheduler::should_stop(const std::atomic<bool>* external_stop) const {
    return stop_requested_.load() || (external_stop != nullptr && external_stop->load());
}

void MarketScheduler::sleep_between_rounds(const std::atomic<bool>* external_stop) const {
    const auto deadline = std::chrono::steady_clock::now() + options_.interval;
    while (!should_stop(external_stop)) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kSleepSlice, deadline - now));
    }
}

} // namespace strategy
