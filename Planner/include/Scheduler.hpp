#pragma once
#include <atomic>
#include <optional>
#include <string>
#include <vector>
#include "ActionPlan.hpp"
#include "ComfortPolicy.hpp"
#include "PriceCurve.hpp"
#include "ThermalModel.hpp"

struct SchedulerSettings {
    // Temperature resolution used to merge search states. States in one
    // bucket keep only the cheapest, so a coarser bucket trades a slightly
    // costlier plan for fewer states.
    double bucketC       = 0.05;
    double overshootTolC = 0.3;   // allowed excursion above the comfort max
    double relaxStepC    = 0.5;
    double relaxMaxC     = 3.0;
    double reachSlackC   = 0.05;  // margin kept under the full-heat envelope
};

// Everything the optimizer needs about one zone, already fetched.
struct PlanRequest {
    std::string          zoneId;
    ThermalModel         model;
    const ComfortPolicy* comfort = nullptr;

    std::vector<double>  levels;            // actuator capability, ascending
    double ratedKw          = 2.0;
    int    stepSeconds      = 3600;
    int    minDwellMinutes  = 0;

    double currentTempC     = 20.0;
    double currentLevel     = 0.0;
    int    minutesAtLevel   = 1 << 20;      // time since the last switch

    // Outdoor forecast per step; missing entries are carried forward.
    std::vector<std::optional<double>> outdoorC;

    // Issues already known upstream (stale prices, stale sensor, ...).
    std::vector<PlanIssue> upstreamIssues;

    Timestamp createdAt = 0;
    int       tickIndex = 0;
};

class Scheduler {
public:
    explicit Scheduler(SchedulerSettings settings = {});

    // Least-cost plan over [horizonStart, horizonEnd). Returns nullopt only
    // when *cancel becomes true during the search. Throws
    // std::invalid_argument for requests that cannot be planned at all
    // (no comfort policy, no levels, empty horizon).
    std::optional<ActionPlan> plan(const PlanRequest& request,
                                   const PriceCurve& prices,
                                   Timestamp horizonStart,
                                   Timestamp horizonEnd,
                                   const std::atomic<bool>* cancel = nullptr) const;

    const SchedulerSettings& settings() const { return settings_; }

    // Minimum dwell expressed in whole steps.
    static int dwellSteps(int minDwellMinutes, int stepSeconds);

private:
    SchedulerSettings settings_;
};
