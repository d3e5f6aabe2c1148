#include "Scheduler.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace {

constexpr double kUnbounded = 1.0e9;

struct StepInput {
    Timestamp     time    = 0;
    double        price   = 0.0;
    double        outdoor = 0.0;
    ComfortBounds bounds;         // evaluated at the end of the step
    double        warmC   = 0.0;  // full-heat envelope
    double        coolC   = 0.0;  // heating-off envelope
};

// One search state. parent indexes the previous layer.
struct Label {
    double cost   = 0.0;
    double wear   = 0.0;   // sum of squared level changes
    double temp   = 0.0;
    int    level  = 0;
    int    held   = 0;     // whole steps at the current level, capped at dwell
    int    parent = -1;
};

struct SearchResult {
    bool cancelled = false;
    bool found     = false;
    std::vector<int>    levels;
    std::vector<double> temps;
    std::size_t states = 0;
};

bool better(const Label& a, const Label& b) {
    const double eps = 1e-9 * std::max({1.0, std::fabs(a.cost), std::fabs(b.cost)});
    if (a.cost < b.cost - eps) return true;
    if (a.cost > b.cost + eps) return false;
    return a.wear < b.wear - 1e-12;
}

int nearestLevel(const std::vector<double>& levels, double v) {
    int best = 0;
    for (int i = 1; i < static_cast<int>(levels.size()); ++i) {
        if (std::fabs(levels[i] - v) < std::fabs(levels[best] - v)) best = i;
    }
    return best;
}

struct SearchSpace {
    const std::vector<StepInput>* steps = nullptr;
    const std::vector<double>*    levels = nullptr;
    ThermalParams params;
    double stepH     = 1.0;
    double ratedKw   = 1.0;
    double bucketC   = 0.05;
    int    dwell     = 0;
    int    initLevel = 0;
    int    initHeld  = 0;
    double startC    = 20.0;
};

// Forward DP over (temperature bucket, level, held) per step.
SearchResult search(const SearchSpace& sp,
                    const std::vector<double>& lo,
                    const std::vector<double>& hi,
                    const std::atomic<bool>* cancel) {
    SearchResult res;
    const auto& steps  = *sp.steps;
    const auto& levels = *sp.levels;
    const int L     = static_cast<int>(levels.size());
    const int dcap  = std::max(sp.dwell, 1);
    const std::size_t N = steps.size();

    std::vector<std::vector<Label>> layers(N + 1);
    Label root;
    root.temp  = sp.startC;
    root.level = sp.initLevel;
    root.held  = std::min(sp.initHeld, dcap);
    layers[0].push_back(root);

    for (std::size_t i = 0; i < N; ++i) {
        if (cancel && cancel->load(std::memory_order_relaxed)) {
            res.cancelled = true;
            return res;
        }

        const StepInput& in = steps[i];
        std::unordered_map<long long, std::size_t> index;
        auto& next = layers[i + 1];

        for (std::size_t p = 0; p < layers[i].size(); ++p) {
            const Label& cur = layers[i][p];
            for (int lj = 0; lj < L; ++lj) {
                const bool sw = (lj != cur.level);
                if (sw && cur.held < sp.dwell) continue;

                const double t = ThermalModel::stepWith(sp.params, cur.temp, levels[lj],
                                                        in.outdoor, sp.stepH);
                if (t < lo[i] || t > hi[i]) continue;

                const double d = levels[lj] - levels[cur.level];
                Label nl;
                nl.cost   = cur.cost + in.price * levels[lj] * sp.ratedKw * sp.stepH;
                nl.wear   = cur.wear + (sw ? d * d : 0.0);
                nl.temp   = t;
                nl.level  = lj;
                nl.held   = sw ? 1 : std::min(cur.held + 1, dcap);
                nl.parent = static_cast<int>(p);

                const long long bucket = static_cast<long long>(std::floor(t / sp.bucketC));
                const long long key = (bucket * L + lj) * (dcap + 1) + nl.held;

                auto it = index.find(key);
                if (it == index.end()) {
                    index.emplace(key, next.size());
                    next.push_back(nl);
                } else if (better(nl, next[it->second])) {
                    next[it->second] = nl;
                }
            }
        }
        res.states += next.size();
        if (next.empty()) return res;
    }

    const auto& last = layers[N];
    std::size_t bestIdx = 0;
    for (std::size_t k = 1; k < last.size(); ++k) {
        if (better(last[k], last[bestIdx])) bestIdx = k;
    }

    res.found = true;
    res.levels.assign(N, 0);
    res.temps.assign(N, 0.0);
    int idx = static_cast<int>(bestIdx);
    for (std::size_t i = N; i > 0; --i) {
        const Label& l = layers[i][idx];
        res.levels[i - 1] = l.level;
        res.temps[i - 1]  = l.temp;
        idx = l.parent;
    }
    return res;
}

// Constant-extreme trajectory honouring the dwell the current level still owes.
std::vector<double> envelope(const SearchSpace& sp, int extremeLevel) {
    const auto& steps  = *sp.steps;
    const auto& levels = *sp.levels;
    std::vector<double> out;
    out.reserve(steps.size());

    int locked = (extremeLevel != sp.initLevel) ? std::max(0, sp.dwell - sp.initHeld) : 0;
    double t = sp.startC;
    for (const auto& in : steps) {
        const int lv = (locked > 0) ? sp.initLevel : extremeLevel;
        if (locked > 0) --locked;
        t = ThermalModel::stepWith(sp.params, t, levels[lv], in.outdoor, sp.stepH);
        out.push_back(t);
    }
    return out;
}

std::vector<int> envelopeLevels(const SearchSpace& sp, int extremeLevel) {
    std::vector<int> out;
    int locked = (extremeLevel != sp.initLevel) ? std::max(0, sp.dwell - sp.initHeld) : 0;
    for (std::size_t i = 0; i < sp.steps->size(); ++i) {
        out.push_back(locked > 0 ? sp.initLevel : extremeLevel);
        if (locked > 0) --locked;
    }
    return out;
}

} // namespace

Scheduler::Scheduler(SchedulerSettings settings) : settings_(settings) {
    if (settings_.bucketC <= 0.0) settings_.bucketC = 0.05;
    if (settings_.relaxStepC <= 0.0) settings_.relaxStepC = 0.5;
    if (settings_.relaxMaxC < 0.0) settings_.relaxMaxC = 0.0;
}

int Scheduler::dwellSteps(int minDwellMinutes, int stepSeconds) {
    if (minDwellMinutes <= 0 || stepSeconds <= 0) return 0;
    return static_cast<int>(std::ceil(minDwellMinutes * 60.0 / stepSeconds));
}

std::optional<ActionPlan> Scheduler::plan(const PlanRequest& req,
                                          const PriceCurve& prices,
                                          Timestamp horizonStart,
                                          Timestamp horizonEnd,
                                          const std::atomic<bool>* cancel) const {
    if (!req.comfort) {
        throw std::invalid_argument("Scheduler: zone '" + req.zoneId + "' has no comfort policy");
    }
    if (req.levels.empty()) {
        throw std::invalid_argument("Scheduler: zone '" + req.zoneId + "' has no action levels");
    }
    if (req.stepSeconds <= 0 || horizonEnd <= horizonStart) {
        throw std::invalid_argument("Scheduler: empty horizon for zone '" + req.zoneId + "'");
    }

    std::vector<double> levels = req.levels;
    std::sort(levels.begin(), levels.end());
    levels.erase(std::unique(levels.begin(), levels.end()), levels.end());

    const int    step  = req.stepSeconds;
    const double stepH = step / 3600.0;
    const std::size_t N = static_cast<std::size_t>((horizonEnd - horizonStart + step - 1) / step);
    const ComfortPolicy& comfort = *req.comfort;

    PlanMetadata meta;
    meta.zoneId      = req.zoneId;
    meta.createdAt   = req.createdAt;
    meta.stepSeconds = step;
    meta.startTempC  = req.currentTempC;
    meta.params      = req.model.params();
    meta.issues      = req.upstreamIssues;

    // ------------------------------------------------------------------
    // Per-step inputs: price, outdoor temperature, comfort bounds
    // ------------------------------------------------------------------
    std::vector<StepInput> steps(N);
    std::vector<bool> havePrice(N, false);
    int missingPrice = 0, missingOutdoor = 0;
    std::optional<double> lastOutdoor;

    for (std::size_t i = 0; i < N; ++i) {
        StepInput& in = steps[i];
        in.time = horizonStart + static_cast<Timestamp>(i) * step;

        if (auto p = prices.priceAt(in.time)) {
            in.price = *p;
            havePrice[i] = true;
        } else {
            ++missingPrice;
        }

        if (i < req.outdoorC.size() && req.outdoorC[i]) {
            lastOutdoor = req.outdoorC[i];
            in.outdoor  = *lastOutdoor;
        } else {
            in.outdoor = lastOutdoor ? *lastOutdoor : req.model.settings().defaultOutdoorC;
            ++missingOutdoor;
        }

        in.bounds = comfort.boundsAt(in.time + step);
    }

    if (missingPrice > 0) {
        // Carry forward; leading gaps take the first known price.
        std::optional<double> first;
        for (std::size_t i = 0; i < N && !first; ++i) {
            if (havePrice[i]) first = steps[i].price;
        }
        double last = first ? *first : 1.0;
        for (std::size_t i = 0; i < N; ++i) {
            if (havePrice[i]) last = steps[i].price;
            else steps[i].price = last;
        }
        meta.issues.push_back({IssueKind::DataUnavailable,
            std::to_string(missingPrice) + " of " + std::to_string(N) +
            " price step(s) missing; carried forward",
            static_cast<double>(missingPrice)});
    }
    if (missingOutdoor > 0) {
        meta.issues.push_back({IssueKind::ModelDegraded,
            "outdoor temperature missing for " + std::to_string(missingOutdoor) +
            " step(s); last known value used",
            static_cast<double>(missingOutdoor)});
    }
    if (req.model.usingDefaults()) {
        meta.issues.push_back({IssueKind::ModelDegraded,
            "thermal model on default parameters (" +
            std::to_string(req.model.observations()) + " samples)", 0.0});
    } else if (req.model.lowConfidence()) {
        meta.issues.push_back({IssueKind::ModelDegraded,
            "thermal model low confidence", req.model.accuracyC()});
    }

    // ------------------------------------------------------------------
    // Search space and physical envelopes
    // ------------------------------------------------------------------
    SearchSpace sp;
    sp.steps     = &steps;
    sp.levels    = &levels;
    sp.params    = req.model.params();
    sp.stepH     = stepH;
    sp.ratedKw   = req.ratedKw;
    sp.bucketC   = settings_.bucketC;
    sp.dwell     = dwellSteps(req.minDwellMinutes, step);
    sp.initLevel = nearestLevel(levels, req.currentLevel);
    sp.initHeld  = std::max(0, req.minutesAtLevel) * 60 / step;
    sp.startC    = req.currentTempC;

    const int maxLevel = static_cast<int>(levels.size()) - 1;
    const std::vector<double> warm = envelope(sp, maxLevel);
    const std::vector<double> cool = envelope(sp, 0);

    const double floorC = comfort.freezeFloorC();
    std::vector<double> floorEff(N), lo(N), hi(N);
    for (std::size_t i = 0; i < N; ++i) {
        steps[i].warmC = warm[i];
        steps[i].coolC = cool[i];
        // Unreachable bounds follow the best physically reachable temperature.
        floorEff[i] = std::min(floorC, warm[i] - settings_.reachSlackC);
        lo[i] = std::max(floorEff[i], std::min(steps[i].bounds.minC, warm[i] - settings_.reachSlackC));
        hi[i] = std::max(steps[i].bounds.maxC + settings_.overshootTolC,
                         cool[i] + settings_.reachSlackC);
    }

    // ------------------------------------------------------------------
    // Search, widening progressively when nothing is feasible
    // ------------------------------------------------------------------
    SearchResult found;
    double widen = 0.0;
    std::string fallback;

    for (widen = 0.0; widen <= settings_.relaxMaxC + 1e-9; widen += settings_.relaxStepC) {
        std::vector<double> l(N), h(N);
        for (std::size_t i = 0; i < N; ++i) {
            l[i] = std::max(floorEff[i], lo[i] - widen);
            h[i] = hi[i] + widen;
        }
        found = search(sp, l, h, cancel);
        if (found.cancelled) return std::nullopt;
        if (found.found) break;
    }

    if (!found.found) {
        // Comfort dropped entirely; the freeze floor still holds.
        std::vector<double> h(N, kUnbounded);
        found = search(sp, floorEff, h, cancel);
        if (found.cancelled) return std::nullopt;
        fallback = "comfort bounds dropped, freeze floor only";
        widen = settings_.relaxMaxC;
    }

    if (!found.found) {
        found.found  = true;
        found.levels = envelopeLevels(sp, maxLevel);
        found.temps  = warm;
        fallback = "no plan keeps the freeze floor; full heat";
    }

    // ------------------------------------------------------------------
    // Assemble the plan and report every bound the result violates
    // ------------------------------------------------------------------
    std::vector<PlannedAction> actions;
    actions.reserve(N);
    double maxViolation = 0.0;

    for (std::size_t i = 0; i < N; ++i) {
        const StepInput& in = steps[i];
        PlannedAction a;
        a.time       = in.time;
        a.level      = levels[found.levels[i]];
        a.energyKwh  = a.level * req.ratedKw * stepH;
        a.price      = in.price;
        a.predictedC = found.temps[i];
        a.outdoorC   = in.outdoor;
        a.window     = in.bounds.label;

        const double below = in.bounds.minC - a.predictedC;
        const double above = a.predictedC - (in.bounds.maxC + settings_.overshootTolC);
        a.relaxedC = std::max({0.0, below, above});
        a.minC = in.bounds.minC - (below > 0.0 ? below : 0.0);
        a.maxC = in.bounds.maxC + (above > 0.0 ? above : 0.0);
        maxViolation = std::max(maxViolation, a.relaxedC);

        meta.totalCost      += a.price * a.energyKwh;
        meta.totalEnergyKwh += a.energyKwh;

        if (a.relaxedC > 1e-9) {
            std::string reason;
            if (below > 0.0) {
                reason = (in.warmC < in.bounds.minC)
                    ? "below comfort min; full heat cannot reach it in time"
                    : "below comfort min; bounds widened to find a feasible plan";
            } else {
                reason = (in.coolC > in.bounds.maxC + settings_.overshootTolC)
                    ? "above comfort max; zone cannot cool down in time"
                    : "above comfort max; bounds widened to find a feasible plan";
            }

            auto& rel = meta.relaxations;
            if (!rel.empty() && rel.back().until == a.time &&
                rel.back().window == a.window && rel.back().reason == reason) {
                rel.back().until = a.time + step;
                rel.back().magnitudeC = std::max(rel.back().magnitudeC, a.relaxedC);
            } else {
                rel.push_back({a.window, a.time, a.time + step, a.relaxedC, reason});
            }
        }
        actions.push_back(a);
    }

    if (!meta.relaxations.empty() || !fallback.empty()) {
        std::ostringstream oss;
        oss << "comfort relaxed in " << meta.relaxations.size() << " span(s), up to "
            << maxViolation << " C";
        if (!fallback.empty()) oss << "; " << fallback;
        meta.issues.push_back({IssueKind::InfeasiblePlan, oss.str(), maxViolation});
        Logger::instance().warn(req.zoneId + ".Scheduler", oss.str());
    }

    Logger::instance().log_wide(
        req.zoneId + ".Scheduler",
        req.tickIndex,
        req.createdAt,
        {"steps", "total_cost", "energy_kwh", "widen_c", "max_relax_c",
         "relaxed_spans", "issues", "states", "fallback"},
        {static_cast<double>(N), meta.totalCost, meta.totalEnergyKwh, widen, maxViolation,
         static_cast<double>(meta.relaxations.size()),
         static_cast<double>(meta.issues.size()),
         static_cast<double>(found.states),
         fallback.empty() ? 0.0 : 1.0}
    );

    return ActionPlan(std::move(actions), std::move(meta));
}
