#pragma once

#include "strategy/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace strategy {

struct Notification {
    std::string title;
    std::string body;
};

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const Notification& notification) = 0;
};

// Delivers notices to the console under the [Notify] tag.
class LogNotifier : public Notifier {
public:
    void notify(const Notification& notification) override;
};

struct PortfolioSummary {
    std::vector<Holding> holdings;   // size > 0.01 only
    double cash = 0.0;

    [[nodiscard]] double total() const;
};

std::string format_timestamp(std::chrono::system_clock::time_point time);
std::string abbreviate_address(const std::string& address);

Notification fill_notification(const FillEvent& event, const std::optional<PortfolioSummary>& portfolio);
Notification startup_notification(const std::string& wallet, int scan_interval_sec);
Notification shutdown_notification(long long rounds, const std::string& reason);
Notification failure_alert(int consecutive_failures, const std::string& last_error);

} // namespace strategy
