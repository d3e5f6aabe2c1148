#pragma once
#include <optional>
#include <string>
#include <vector>
#include "PlanIssues.hpp"
#include "ThermalModel.hpp"

struct PlannedAction {
    Timestamp time        = 0;     // step start
    double    level       = 0.0;
    double    energyKwh   = 0.0;
    double    price       = 0.0;
    double    predictedC  = 0.0;   // end-of-step temperature
    double    outdoorC    = 0.0;   // outdoor input the prediction used
    double    minC        = 0.0;   // effective bounds after any relaxation
    double    maxC        = 0.0;
    double    relaxedC    = 0.0;   // how far the bounds were widened at this step
    std::string window;            // comfort window label
};

// A bound that had to be widened to find a plan.
struct Relaxation {
    std::string window;
    Timestamp   from       = 0;
    Timestamp   until      = 0;     // exclusive
    double      magnitudeC = 0.0;   // largest widening inside the span
    std::string reason;
};

struct PlanMetadata {
    std::string zoneId;
    Timestamp   createdAt    = 0;
    int         stepSeconds  = 0;
    double      totalCost    = 0.0;
    double      totalEnergyKwh = 0.0;
    double      startTempC   = 0.0;
    ThermalParams params;           // model the predictions were made with
    std::vector<PlanIssue>  issues;
    std::vector<Relaxation> relaxations;
};

// Immutable once built; a new plan supersedes it.
class ActionPlan {
public:
    ActionPlan(std::vector<PlannedAction> actions, PlanMetadata meta);

    const std::vector<PlannedAction>& actions() const { return actions_; }
    const PlanMetadata& metadata() const { return meta_; }

    bool empty() const { return actions_.empty(); }
    std::size_t size() const { return actions_.size(); }
    Timestamp start() const;
    Timestamp end() const;   // exclusive

    // Action whose step contains t.
    std::optional<PlannedAction> actionAt(Timestamp t) const;

    // Predicted temperature at t, following the model inside the step.
    std::optional<double> predictedAt(Timestamp t) const;

    // First step after t whose level differs from the one in force at t.
    std::optional<PlannedAction> nextChangeAfter(Timestamp t) const;

    bool relaxed() const { return !meta_.relaxations.empty(); }
    bool hasIssue(IssueKind kind) const { return ::hasIssue(meta_.issues, kind); }

    // One line per issue/relaxation, for logs and status reports.
    std::vector<std::string> describe() const;

private:
    std::vector<PlannedAction> actions_;
    PlanMetadata meta_;
};
