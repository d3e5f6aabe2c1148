#pragma once
#include <deque>
#include <optional>
#include "PlanIssues.hpp"

struct ThermalState {
    Timestamp time  = 0;
    double    tempC = 0.0;                 // measured indoor temperature
    double    level = 0.0;                 // heating level active from this sample on
    std::optional<double> outdoorC;        // exogenous input, may be missing
};

// Append-only per-zone log with a retention window.
class ThermalHistory {
public:
    explicit ThermalHistory(double retentionDays = 14.0);

    // Returns false (and ignores the sample) if it is not newer than the last one.
    bool append(const ThermalState& s);

    // Drop entries older than the retention window relative to now.
    std::size_t evictBefore(Timestamp now);

    const std::deque<ThermalState>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const ThermalState& back() const { return entries_.back(); }

    double retentionDays() const { return retention_days_; }

private:
    std::deque<ThermalState> entries_;
    double retention_days_;
};
