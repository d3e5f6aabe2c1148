#include "ThermalHistory.hpp"

ThermalHistory::ThermalHistory(double retentionDays)
    : retention_days_(retentionDays > 0.0 ? retentionDays : 14.0) {}

bool ThermalHistory::append(const ThermalState& s) {
    if (!entries_.empty() && s.time <= entries_.back().time) return false;
    entries_.push_back(s);
    evictBefore(s.time);
    return true;
}

std::size_t ThermalHistory::evictBefore(Timestamp now) {
    const Timestamp cutoff = now - static_cast<Timestamp>(retention_days_ * 86400.0);
    std::size_t n = 0;
    while (!entries_.empty() && entries_.front().time < cutoff) {
        entries_.pop_front();
        ++n;
    }
    return n;
}
