#include "HeatingActuator.hpp"

#include <algorithm>
#include <stdexcept>

std::vector<double> modulatingLevels(int steps) {
    if (steps < 1) steps = 1;
    std::vector<double> out;
    for (int i = 0; i <= steps; ++i) {
        out.push_back(static_cast<double>(i) / static_cast<double>(steps));
    }
    return out;
}

CommandQueueActuator::CommandQueueActuator(std::vector<double> levels)
    : levels_(std::move(levels)) {
    if (levels_.empty()) {
        throw std::invalid_argument("actuator needs at least one level");
    }
    std::sort(levels_.begin(), levels_.end());
    levels_.erase(std::unique(levels_.begin(), levels_.end()), levels_.end());
    if (levels_.front() < 0.0 || levels_.back() > 1.0) {
        throw std::invalid_argument("actuator levels must lie within [0, 1]");
    }
}

void CommandQueueActuator::setHeatingLevel(const std::string& zoneId, double level,
                                           Timestamp effectiveFrom) {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.push_back({zoneId, level, effectiveFrom});
}

std::vector<HeatingCommand> CommandQueueActuator::drain() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<HeatingCommand> out;
    out.swap(queue_);
    return out;
}

std::size_t CommandQueueActuator::pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
}
