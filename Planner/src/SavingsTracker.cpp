#include "SavingsTracker.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>

SavingsTracker::SavingsTracker(std::string zoneId, double periodHours, double ratedKw,
                               double maxLevel, int keepPeriods)
    : zone_id_(std::move(zoneId)),
      period_s_(static_cast<Timestamp>(std::max(periodHours, 1.0) * 3600.0)),
      rated_kw_(ratedKw),
      max_level_(maxLevel),
      keep_periods_(std::max(keepPeriods, 1)) {}

Timestamp SavingsTracker::periodStartOf_(Timestamp t) const {
    return t - (((t % period_s_) + period_s_) % period_s_);
}

std::vector<SavingsRecord> SavingsTracker::record(const ExecutedStep& step,
                                                  const ThermalModel& model) {
    std::vector<SavingsRecord> out;
    const Timestamp ps = periodStartOf_(step.time);
    if (!open_.empty() && ps != open_start_) {
        out.push_back(close_(open_start_, open_start_ + period_s_, open_, model, -1));
        open_.clear();
    }
    if (open_.empty()) open_start_ = ps;
    open_.push_back(step);
    return out;
}

std::optional<SavingsRecord> SavingsTracker::settle(Timestamp now, const ThermalModel& model) {
    if (open_.empty() || now < open_start_ + period_s_) return std::nullopt;
    SavingsRecord r = close_(open_start_, open_start_ + period_s_, open_, model, -1);
    open_.clear();
    return r;
}

std::optional<SavingsRecord> SavingsTracker::settleOpen(const ThermalModel& model) {
    if (open_.empty()) return std::nullopt;
    const auto& last = open_.back();
    SavingsRecord r = close_(open_start_, last.time + last.stepSeconds, open_, model, -1);
    open_.clear();
    return r;
}

std::optional<SavingsRecord> SavingsTracker::reprice(std::size_t ledgerIndex,
                                                     const PriceCurve& corrected,
                                                     const ThermalModel& model) {
    auto it = settled_steps_.find(ledgerIndex);
    if (it == settled_steps_.end()) {
        Logger::instance().warn(zone_id_ + ".Savings",
            "no step data kept for ledger entry " + std::to_string(ledgerIndex) +
            "; correction skipped");
        return std::nullopt;
    }

    std::vector<ExecutedStep> steps = it->second;
    for (auto& s : steps) {
        if (auto p = corrected.priceAt(s.time)) s.price = *p;
    }

    const SavingsRecord& orig = ledger_[ledgerIndex];
    return close_(orig.periodStart, orig.periodEnd, steps, model,
                  static_cast<int>(ledgerIndex));
}

double SavingsTracker::totalSavings() const {
    std::map<Timestamp, double> latest;
    for (const auto& r : ledger_) latest[r.periodStart] = r.delta;
    double sum = 0.0;
    for (const auto& kv : latest) sum += kv.second;
    return sum;
}

double SavingsTracker::openPeriodSavings(const ThermalModel& model) const {
    if (open_.empty()) return 0.0;
    const Costs c = evaluate(open_, model, rated_kw_, max_level_);
    return c.baselineCost - c.realizedCost;
}

void SavingsTracker::restore(std::vector<SavingsRecord> ledger) {
    ledger_ = std::move(ledger);
    settled_steps_.clear();
}

SavingsTracker::Costs SavingsTracker::evaluate(const std::vector<ExecutedStep>& steps,
                                               const ThermalModel& model,
                                               double ratedKw, double maxLevel) {
    Costs c;
    if (steps.empty()) return c;

    const ThermalParams& p = model.params();
    const double k = std::max(p.k_per_h, 1e-4);
    double t = steps.front().startTempC;
    std::optional<double> lastOutdoor;

    for (const auto& s : steps) {
        const double h = s.stepSeconds / 3600.0;

        c.realizedCost += s.price * s.energyKwh;
        c.realizedKwh  += s.energyKwh;

        if (s.outdoorC) lastOutdoor = s.outdoorC;
        const double out = lastOutdoor ? *lastOutdoor : model.settings().defaultOutdoorC;

        // Level that lands exactly on the midpoint at the end of the step.
        const double mid = 0.5 * (s.minC + s.maxC);
        const double e   = std::exp(-k * h);
        const double teq = (mid - t * e) / (1.0 - e);
        double level = 0.0;
        if (p.gain_c_per_h > 0.0) {
            level = (k * (teq - out) - p.offset_c_per_h) / p.gain_c_per_h;
        }
        level = std::clamp(level, 0.0, maxLevel);

        const double kwh = level * ratedKw * h;
        c.baselineCost += s.price * kwh;
        c.baselineKwh  += kwh;

        t = ThermalModel::stepWith(p, t, level, out, h);
    }
    return c;
}

SavingsRecord SavingsTracker::close_(Timestamp start, Timestamp end,
                                     const std::vector<ExecutedStep>& steps,
                                     const ThermalModel& model, int correctionOf) {
    const Costs c = evaluate(steps, model, rated_kw_, max_level_);

    SavingsRecord r;
    r.periodStart  = start;
    r.periodEnd    = end;
    r.realizedCost = c.realizedCost;
    r.baselineCost = c.baselineCost;
    r.delta        = c.baselineCost - c.realizedCost;
    r.realizedKwh  = c.realizedKwh;
    r.baselineKwh  = c.baselineKwh;
    r.correctionOf = correctionOf;
    r.degraded     = model.degraded();

    const std::size_t idx = ledger_.size();
    ledger_.push_back(r);
    settled_steps_[idx] = steps;
    while (static_cast<int>(settled_steps_.size()) > keep_periods_) {
        settled_steps_.erase(settled_steps_.begin());
    }

    Logger::instance().log_wide(
        zone_id_ + ".Savings",
        static_cast<int>(idx),
        end,
        {"period_start", "realized_cost", "baseline_cost", "delta",
         "realized_kwh", "baseline_kwh", "correction_of", "degraded"},
        {static_cast<double>(start), r.realizedCost, r.baselineCost, r.delta,
         r.realizedKwh, r.baselineKwh, static_cast<double>(correctionOf),
         r.degraded ? 1.0 : 0.0}
    );
    return r;
}
