#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "PriceCurve.hpp"
#include "ThermalModel.hpp"

// One executed control step, as realized.
struct ExecutedStep {
    Timestamp time        = 0;
    int       stepSeconds = 3600;
    double    level       = 0.0;
    double    energyKwh   = 0.0;
    double    price       = 0.0;
    double    startTempC  = 20.0;
    std::optional<double> outdoorC;
    double    minC        = 19.0;   // comfort bounds in force
    double    maxC        = 23.0;
};

struct SavingsRecord {
    Timestamp periodStart  = 0;
    Timestamp periodEnd    = 0;
    double    realizedCost = 0.0;
    double    baselineCost = 0.0;
    double    delta        = 0.0;   // baseline - realized, positive is a saving
    double    realizedKwh  = 0.0;
    double    baselineKwh  = 0.0;
    int       correctionOf = -1;    // ledger index this record corrects
    bool      degraded     = false; // baseline used a default/low-confidence model
};

// Append-only ledger of realized vs. baseline cost per period.
class SavingsTracker {
public:
    SavingsTracker(std::string zoneId,
                   double periodHours = 24.0,
                   double ratedKw = 2.0,
                   double maxLevel = 1.0,
                   int keepPeriods = 7);

    // Adds a step to the open period. A step past the open period first
    // settles it; the records settled that way are returned.
    std::vector<SavingsRecord> record(const ExecutedStep& step, const ThermalModel& model);

    // Settles the open period if it ended at or before now.
    std::optional<SavingsRecord> settle(Timestamp now, const ThermalModel& model);

    // Closes the open period early (shutdown); the record covers what ran.
    std::optional<SavingsRecord> settleOpen(const ThermalModel& model);

    // Late price data: recompute a settled period and append a correction.
    // The original record is left untouched.
    std::optional<SavingsRecord> reprice(std::size_t ledgerIndex,
                                         const PriceCurve& corrected,
                                         const ThermalModel& model);

    const std::vector<SavingsRecord>& ledger() const { return ledger_; }

    // Latest record per period (corrections supersede), summed.
    double totalSavings() const;

    // Savings so far in the open period.
    double openPeriodSavings(const ThermalModel& model) const;

    // Restore a persisted ledger (no step data comes with it).
    void restore(std::vector<SavingsRecord> ledger);

    struct Costs {
        double realizedCost = 0.0;
        double baselineCost = 0.0;
        double realizedKwh  = 0.0;
        double baselineKwh  = 0.0;
    };

    // Ideal modulating thermostat holding the comfort midpoint, simulated
    // with the model over the same steps and prices.
    static Costs evaluate(const std::vector<ExecutedStep>& steps,
                          const ThermalModel& model,
                          double ratedKw, double maxLevel);

private:
    SavingsRecord close_(Timestamp start, Timestamp end,
                         const std::vector<ExecutedStep>& steps,
                         const ThermalModel& model, int correctionOf);
    Timestamp periodStartOf_(Timestamp t) const;

    std::string zone_id_;
    Timestamp period_s_;
    double rated_kw_;
    double max_level_;
    int keep_periods_;

    Timestamp open_start_ = 0;
    std::vector<ExecutedStep> open_;

    std::vector<SavingsRecord> ledger_;
    std::map<std::size_t, std::vector<ExecutedStep>> settled_steps_;
};
