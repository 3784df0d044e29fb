#pragma once

#include "strategy/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace strategy {

// Remembers the last observed position size per market and turns size changes
// between polling rounds into fill events. Safe to call from one worker per
// market concurrently: the map lock is only held to find a market's slot.
class FillTracker {
public:
    explicit FillTracker(double threshold = 0.01);

    FillTracker(const FillTracker&) = delete;
    FillTracker& operator=(const FillTracker&) = delete;

    // Records `size` as the market's latest size. Returns an event when a previous
    // size exists and differs from `size` by more than the threshold.
    std::optional<FillEvent> observe(const std::string& market_id,
                                     const std::string& market_name,
                                     double size,
                                     double value);

    [[nodiscard]] std::optional<double> last_size(const std::string& market_id) const;

private:
    struct Slot {
        mutable std::mutex mutex;
        std::optional<double> size;
    };

    Slot& slot_for(const std::string& market_id);

    double threshold_;
    mutable std::mutex slots_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

} // namespace strategy
