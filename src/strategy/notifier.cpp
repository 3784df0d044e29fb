#include "strategy/notifier.hpp"

#include "strategy/log.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace strategy {

void LogNotifier::notify(const Notification& notification) {
    std::string body = notification.body;
    for (auto& ch : body) {
        if (ch == '\n') {
            ch = ' ';
        }
    }
    log_info("Notify") << notification.title << " | " << body;
}

double PortfolioSummary::total() const {
    double sum = cash;
    for (const auto& holding : holdings) {
        sum += holding.current_value;
    }
    return sum;
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    const std::time_t raw = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&raw, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string abbreviate_address(const std::string& address) {
    if (address.size() <= 18) {
        return address;
    }
    return address.substr(0, 10) + "..." + address.substr(address.size() - 8);
}

Notification fill_notification(const FillEvent& event, const std::optional<PortfolioSummary>& portfolio) {
    Notification notification;
    notification.title = std::string(event.is_buy() ? "Buy filled" : "Sell filled") + " - " + event.market_name;

    std::ostringstream body;
    body << std::fixed << std::setprecision(2);
    body << "Market: " << event.market_name << '\n'
         << "Size change: " << std::showpos << event.delta << std::noshowpos << '\n'
         << "Position: " << event.new_size << " ($" << event.new_value << ")\n";
    if (portfolio) {
        body << "Portfolio:\n";
        for (const auto& holding : portfolio->holdings) {
            body << "- " << holding.title.substr(0, 30) << ": " << holding.size
                 << " ($" << holding.current_value << ")\n";
        }
        body << "- Cash: $" << portfolio->cash << '\n'
             << "Total: $" << portfolio->total();
    } else {
        body << "Portfolio: unavailable";
    }
    notification.body = body.str();
    return notification;
}

Notification startup_notification(const std::string& wallet, int scan_interval_sec) {
    std::ostringstream body;
    body << "Started: " << format_timestamp(std::chrono::system_clock::now()) << '\n'
         << "Wallet: " << abbreviate_address(wallet) << '\n'
         << "Scan interval: " << scan_interval_sec << "s";
    return Notification{"Market maker started", body.str()};
}

Notification shutdown_notification(long long rounds, const std::string& reason) {
    std::ostringstream body;
    body << "Stopped: " << format_timestamp(std::chrono::system_clock::now()) << '\n'
         << "Rounds: " << rounds << '\n'
         << "Reason: " << reason;
    return Notification{"Market maker stopped", body.str()};
}

Notification failure_alert(int consecutive_failures, const std::string& last_error) {
    std::ostringstream body;
    body << "Time: " << format_timestamp(std::chrono::system_clock::now()) << '\n'
         << "Consecutive failed rounds: " << consecutive_failures << '\n'
         << "Last error: " << last_error.substr(0, 200);
    return Notification{"Consecutive failure alert", body.str()};
}

} // namespace strategy
