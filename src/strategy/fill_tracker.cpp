#include "strategy/fill_tracker.hpp"

#include <cmath>

namespace strategy {

FillTracker::FillTracker(double threshold)
    : threshold_(threshold) {}

FillTracker::Slot& FillTracker::slot_for(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& slot = slots_[market_id];
    if (!slot) {
        slot = std::make_unique<Slot>();
    }
    return *slot;
}

std::optional<FillEvent> FillTracker::observe(const std::string& market_id,
                                              const std::string& market_name,
                                              double size,
                                              double value) {
    auto& slot = slot_for(market_id);
    std::lock_guard<std::mutex> lock(slot.mutex);

    std::optional<FillEvent> event;
    if (slot.size) {
        const double delta = size - *slot.size;
        if (std::fabs(delta) > threshold_) {
            event = FillEvent{market_id, market_name, delta, size, value};
        }
    }
    slot.size = size;
    return event;
}

std::optional<double> FillTracker::last_size(const std::string& market_id) const {
    std::unique_lock<std::mutex> map_lock(slots_mutex_);
    const auto it = slots_.find(market_id);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    const Slot& slot = *it->second;
    map_lock.unlock();

    std::lock_guard<std::mutex> lock(slot.mutex);
    return slot.size;
}

} // namespace strategy
