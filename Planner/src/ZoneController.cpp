#include "ZoneController.hpp"
#include "Logger.hpp"
#include "ZoneStore.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

const char* controllerStateName(ControllerState s) {
    switch (s) {
        case ControllerState::Idle:       return "idle";
        case ControllerState::Planning:   return "planning";
        case ControllerState::Committed:  return "committed";
        case ControllerState::Executing:  return "executing";
        case ControllerState::Replanning: return "replanning";
        case ControllerState::Stopped:    return "stopped";
    }
    return "idle";
}

const char* planTriggerName(PlanTrigger t) {
    switch (t) {
        case PlanTrigger::None:          return "none";
        case PlanTrigger::Cadence:       return "cadence";
        case PlanTrigger::PriceUpdate:   return "price_update";
        case PlanTrigger::ComfortChange: return "comfort_change";
        case PlanTrigger::Drift:         return "drift";
        case PlanTrigger::Override:      return "override";
    }
    return "none";
}

namespace {

PlanTrigger higher(PlanTrigger a, PlanTrigger b) {
    return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

std::string fmt(double v, int prec = 2) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(prec) << v;
    return oss.str();
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
ZoneConfig ZoneController::validated_(const ZoneConfig& c) {
    validate_zone(c);
    return c;
}

std::vector<double> ZoneController::resolveLevels_(const ZoneConfig& c, const HeatingActuator* a) {
    std::vector<double> levels;
    if (!a) {
        levels = c.actionLevels;
    } else {
        const auto supported = a->supportsLevels();
        for (double l : c.actionLevels) {
            for (double s : supported) {
                if (std::fabs(l - s) < 1e-9) { levels.push_back(l); break; }
            }
        }
    }
    std::sort(levels.begin(), levels.end());
    if (levels.empty()) {
        throw ConfigInvalidError(c.zoneId, "actuator '" + c.actuatorRef +
                                           "' supports none of the configured levels");
    }
    return levels;
}

ZoneController::ZoneController(const ZoneConfig& config,
                               const PlannerSettings& settings,
                               HeatingActuator* actuator,
                               std::shared_ptr<ThermalGroup> group)
    : Subsystem(config.zoneId),
      cfg_(validated_(config)),
      settings_(settings),
      actuator_(actuator),
      group_(std::move(group)),
      levels_(resolveLevels_(cfg_, actuator)),
      scheduler_(settings.scheduler),
      comfort_(cfg_.defaultWindow, settings.utcOffsetMin, settings.freezeFloorC),
      autoControl_(cfg_.autoControl),
      model_(cfg_.model),
      history_(cfg_.retentionDays),
      savings_(cfg_.zoneId, settings.savingsPeriodHours, cfg_.ratedKw, levels_.back()) {
    try {
        for (const auto& w : cfg_.comfortWindows) comfort_.addWindow(w);
    } catch (const std::invalid_argument& e) {
        throw ConfigInvalidError(cfg_.zoneId, e.what());
    }
    comfort_.setMode(settings_.mode);

    if (group_ && !group_->hasMember(cfg_.zoneId)) {
        group_->addMember(cfg_.zoneId);
    }
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
void ZoneController::initialize() {
    auto& log = Logger::instance();
    const std::string src = cfg_.zoneId + ".Controller";

    bool restoredModel = false;
    if (store_) {
        history_ = store_->loadHistory(cfg_.zoneId, cfg_.retentionDays);
        restoredModel = store_->loadModel(cfg_.zoneId, model_);
        savings_.restore(store_->loadSavings(cfg_.zoneId));
    }
    if (!restoredModel && cfg_.initialParams) {
        model_.restore(*cfg_.initialParams, false, true, 0.0, 0);
    }
    if (group_) {
        if ((restoredModel || cfg_.initialParams) && group_->model().usingDefaults()) {
            group_->restore(model_);
        }
        if (history_.size() > static_cast<std::size_t>(cfg_.model.minSamples)) {
            group_->learn(cfg_.zoneId, history_);
        }
    }

    state_ = ControllerState::Idle;
    {
        std::lock_guard<std::mutex> lock(report_mtx_);
        historySamples_ = history_.size();
    }

    const ThermalModel m = model();
    std::ostringstream oss;
    oss << "initialized: " << history_.size() << " history sample(s), "
        << levels_.size() << " level(s), model k=" << fmt(m.params().k_per_h, 3)
        << " gain=" << fmt(m.params().gain_c_per_h, 3)
        << (m.usingDefaults() ? " (defaults)" : "")
        << (group_ ? ", group " + group_->id() : std::string());
    log.info(src, oss.str());
}

void ZoneController::tick(const TickContext& ctx) {
    const Timestamp now = ctx.time;

    Pending in;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        in = pending_;
        pending_ = Pending{};
        if (comfort_.expireOverrides(now)) {
            Logger::instance().info(cfg_.zoneId + ".Controller", "override expired");
            in.trigger = higher(in.trigger, PlanTrigger::ComfortChange);
        }
    }
    {
        std::lock_guard<std::mutex> lock(report_mtx_);
        tickIssues_.clear();
        reportTime_ = now;
    }

    if (in.prices) prices_ = in.prices;
    if (in.outdoorC) lastOutdoorC_ = in.outdoorC;

    const SensorView view = ingestReading_(now, in);
    const bool settled = recordExecuted_(now);
    const bool learned = learn_(now);

    PlanTrigger trigger = detectTrigger_(now, view, in.trigger);
    const PlanTrigger logged = trigger;

    bool committed = false;
    if (trigger != PlanTrigger::None && view.currentC) {
        if (state_ == ControllerState::Executing) state_ = ControllerState::Replanning;

        // A strictly higher trigger raised during the pass gets its own pass
        // now; equal or lower ones wait for the next tick.
        for (int pass = 0; pass < 4 && trigger != PlanTrigger::None; ++pass) {
            committed = planCycle_(ctx, *view.currentC, trigger) || committed;

            std::lock_guard<std::mutex> lock(mtx_);
            if (static_cast<int>(pending_.trigger) > static_cast<int>(trigger)) {
                trigger = pending_.trigger;
                pending_.trigger = PlanTrigger::None;
            } else {
                trigger = PlanTrigger::None;
            }
        }
    } else if (trigger != PlanTrigger::None) {
        addIssue_(IssueKind::DataUnavailable, "no temperature known yet; planning deferred");
    }

    bool emitted = false;
    if (view.currentC) emitted = execute_(now, *view.currentC, committed);

    if (view.newSample && !view.anomaly) {
        ThermalState s;
        s.time     = lastReading_->timestamp;
        s.tempC    = lastReading_->value;
        s.level    = currentLevel_;
        s.outdoorC = lastOutdoorC_;
        history_.append(s);
    }

    persist_(view.newSample, learned, committed, settled);

    {
        std::lock_guard<std::mutex> lock(report_mtx_);
        if (view.currentC) lastTempC_ = view.currentC;
        historySamples_ = history_.size();
    }

    state_ = currentPlan() ? ControllerState::Executing : ControllerState::Idle;
    logRow_(ctx, logged, view, emitted);
}

void ZoneController::shutdown() {
    cancel_ = true;
    if (runningStep_) {
        ExecutedStep s = *runningStep_;
        s.energyKwh = s.level * cfg_.ratedKw * s.stepSeconds / 3600.0;
        savings_.record(s, model());
        runningStep_.reset();
    }
    persist_(true, true, false, true);
    state_ = ControllerState::Stopped;

    std::ostringstream oss;
    oss << "stopped: savings settled " << fmt(savings_.totalSavings(), 4)
        << ", open period " << fmt(savings_.openPeriodSavings(model()), 4);
    Logger::instance().info(cfg_.zoneId + ".Controller", oss.str());
}

// ---------------------------------------------------------------------------
// Inputs
// ---------------------------------------------------------------------------
void ZoneController::raiseLocked_(PlanTrigger t) {
    pending_.trigger = higher(pending_.trigger, t);
    if (state_ == ControllerState::Planning &&
        static_cast<int>(t) > static_cast<int>(inflight_)) {
        cancel_ = true;
    }
}

void ZoneController::observe(const SensorReading& indoor, std::optional<double> outdoorC) {
    std::lock_guard<std::mutex> lock(mtx_);
    pending_.indoor = indoor;
    if (outdoorC) pending_.outdoorC = outdoorC;
}

void ZoneController::setOutdoorForecast(std::map<Timestamp, double> forecast) {
    std::lock_guard<std::mutex> lock(mtx_);
    forecast_ = std::move(forecast);
}

void ZoneController::setPrices(std::shared_ptr<const PriceSnapshot> prices) {
    std::lock_guard<std::mutex> lock(mtx_);
    pending_.prices = std::move(prices);
}

void ZoneController::setOverride(const ComfortOverride& o) {
    std::lock_guard<std::mutex> lock(mtx_);
    comfort_.setOverride(o);
    raiseLocked_(PlanTrigger::Override);
}

void ZoneController::clearOverride() {
    std::lock_guard<std::mutex> lock(mtx_);
    comfort_.clearOverride();
    raiseLocked_(PlanTrigger::ComfortChange);
}

void ZoneController::setVacation(const VacationSpec& v) {
    std::lock_guard<std::mutex> lock(mtx_);
    comfort_.setVacation(v);
    raiseLocked_(PlanTrigger::ComfortChange);
}

void ZoneController::clearVacation() {
    std::lock_guard<std::mutex> lock(mtx_);
    comfort_.clearVacation();
    raiseLocked_(PlanTrigger::ComfortChange);
}

void ZoneController::setMode(OptimizationMode m) {
    std::lock_guard<std::mutex> lock(mtx_);
    comfort_.setMode(m);
    raiseLocked_(PlanTrigger::ComfortChange);
}

void ZoneController::setAutoControl(bool on) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (on && !autoControl_) forceEmit_ = true;
    autoControl_ = on;
}

void ZoneController::requestReplan(PlanTrigger trigger) {
    if (trigger == PlanTrigger::None) return;
    std::lock_guard<std::mutex> lock(mtx_);
    raiseLocked_(trigger);
}

void ZoneController::addIssue_(IssueKind kind, const std::string& detail, double magnitude) {
    std::lock_guard<std::mutex> lock(report_mtx_);
    tickIssues_.push_back({kind, detail, magnitude});
}

// ---------------------------------------------------------------------------
// Tick steps
// ---------------------------------------------------------------------------
ZoneController::SensorView ZoneController::ingestReading_(Timestamp now, const Pending& in) {
    SensorView v;
    const std::string src = cfg_.zoneId + ".Controller";

    if (in.indoor && std::isfinite(in.indoor->value)) {
        SensorReading r = *in.indoor;
        if (r.timestamp > now) r.timestamp = now;
        const bool newer = !lastReading_ || r.timestamp > lastReading_->timestamp;
        if (newer) {
            if (lastReading_) {
                const double jump = std::fabs(r.value - lastReading_->value);
                if (jump > settings_.anomalyJumpC) {
                    v.anomaly = true;
                    Logger::instance().warn(src, "sensor jumped " + fmt(jump) +
                                                 " C; reading not learned");
                    addIssue_(IssueKind::DataUnavailable,
                              "sensor jump of " + fmt(jump) + " C excluded from learning", jump);
                }
            }
            lastReading_ = r;
            v.newSample  = true;
        }
    }

    const Timestamp staleAfter = static_cast<Timestamp>(settings_.sensorStaleMinutes) * 60;
    if (lastReading_ && now - lastReading_->timestamp <= staleAfter) {
        v.measured = lastReading_->value;
        v.currentC = v.measured;
        return v;
    }

    v.stale = true;
    v.newSample = false;
    std::optional<double> predicted;
    if (auto plan = currentPlan()) predicted = plan->predictedAt(now);

    if (predicted) {
        v.currentC = predicted;
        addIssue_(IssueKind::DataUnavailable, "sensor reading stale or missing; plan prediction used");
    } else if (lastReading_) {
        v.currentC = lastReading_->value;
        addIssue_(IssueKind::DataUnavailable, "sensor reading stale; last known value used");
    }
    return v;
}

bool ZoneController::learn_(Timestamp now) {
    history_.evictBefore(now);
    if (++ticksSinceFit_ < settings_.refitEveryTicks) return false;
    ticksSinceFit_ = 0;

    const FitReport r = group_ ? group_->learn(cfg_.zoneId, history_) : model_.update(history_);
    if (r.fitted && !r.usingDefaults) {
        const ThermalModel m = model();
        std::ostringstream oss;
        oss << "model refit on " << r.samples << " sample(s): k=" << fmt(m.params().k_per_h, 3)
            << " gain=" << fmt(m.params().gain_c_per_h, 3)
            << " offset=" << fmt(m.params().offset_c_per_h, 3)
            << " rmse=" << fmt(r.rmseC, 3) << (r.lowConfidence ? " (low confidence)" : "");
        Logger::instance().info(cfg_.zoneId + ".Controller", oss.str());
    } else if (!r.reason.empty()) {
        addIssue_(IssueKind::ModelDegraded, r.reason);
    }
    return true;
}

bool ZoneController::recordExecuted_(Timestamp now) {
    bool settled = false;
    const ThermalModel m = model();

    if (runningStep_ && now > runningStep_->time) {
        ExecutedStep s = *runningStep_;
        s.stepSeconds = static_cast<int>(now - s.time);
        s.energyKwh   = s.level * cfg_.ratedKw * s.stepSeconds / 3600.0;
        if (!savings_.record(s, m).empty()) settled = true;
        runningStep_.reset();
    }
    if (savings_.settle(now, m)) settled = true;
    return settled;
}

PlanTrigger ZoneController::detectTrigger_(Timestamp now, const SensorView& view,
                                           PlanTrigger requested) {
    PlanTrigger t = requested;
    const auto plan = currentPlan();
    const std::string src = cfg_.zoneId + ".Controller";

    if (view.anomaly) t = higher(t, PlanTrigger::Drift);

    if (!plan) {
        t = higher(t, PlanTrigger::Cadence);
    } else {
        const Timestamp cadence = static_cast<Timestamp>(settings_.replanEveryMinutes) * 60;
        if (now - lastPlanAt_ >= cadence ||
            now >= plan->end() - settings_.stepSeconds()) {
            t = higher(t, PlanTrigger::Cadence);
        }
    }

    if (prices_ && prices_->revision != planPriceRevision_) {
        t = higher(t, PlanTrigger::PriceUpdate);
    }

    long comfortRev = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        comfortRev = comfort_.revision();
    }
    if (comfortRev != planComfortRevision_) t = higher(t, PlanTrigger::ComfortChange);

    if (plan && view.measured) {
        if (auto expected = plan->predictedAt(now)) {
            const double dev = *view.measured - *expected;
            if (std::fabs(dev) > settings_.driftThresholdC) {
                Logger::instance().info(src, "drift " + fmt(dev) + " C from plan; replanning");
                t = higher(t, PlanTrigger::Drift);
            }
        }
    }
    return t;
}

std::vector<std::optional<double>> ZoneController::outdoorFor_(Timestamp start, int steps) const {
    std::vector<std::optional<double>> out(static_cast<std::size_t>(steps));
    const int step = settings_.stepSeconds();
    const Timestamp maxAge = 3 * 3600;

    std::lock_guard<std::mutex> lock(mtx_);
    for (int i = 0; i < steps; ++i) {
        const Timestamp t = start + static_cast<Timestamp>(i) * step;
        auto it = forecast_.upper_bound(t);
        if (it != forecast_.begin()) {
            --it;
            if (t - it->first <= maxAge) out[i] = it->second;
        }
    }
    if (!out.empty() && !out[0] && lastOutdoorC_) out[0] = lastOutdoorC_;
    return out;
}

bool ZoneController::planCycle_(const TickContext& ctx, double currentTempC, PlanTrigger trigger) {
    const Timestamp now = ctx.time;
    const std::string src = cfg_.zoneId + ".Controller";
    const int step = settings_.stepSeconds();
    const int nsteps = settings_.horizonSteps();
    const Timestamp start = now - (((now % step) + step) % step);
    const Timestamp end   = start + static_cast<Timestamp>(nsteps) * step;

    std::unique_lock<std::mutex> lock(mtx_);
    const ComfortPolicy comfort = comfort_;
    const long comfortRev = comfort_.revision();
    inflight_ = trigger;
    cancel_   = false;
    state_    = ControllerState::Planning;
    lock.unlock();

    PlanRequest req;
    req.zoneId          = cfg_.zoneId;
    req.model           = model();
    req.comfort         = &comfort;
    req.levels          = levels_;
    req.ratedKw         = cfg_.ratedKw;
    req.stepSeconds     = step;
    req.minDwellMinutes = cfg_.minDwellMinutes;
    req.currentTempC    = currentTempC;
    req.currentLevel    = currentLevel_;
    req.minutesAtLevel  = everEmitted_ ? static_cast<int>((now - levelSince_) / 60) : (1 << 20);
    req.outdoorC        = outdoorFor_(start, nsteps);
    req.createdAt       = now;
    req.tickIndex       = ctx.tick_index;
    {
        std::lock_guard<std::mutex> rl(report_mtx_);
        req.upstreamIssues = tickIssues_;
    }

    PriceCurve curve;
    if (prices_) {
        curve = prices_->curve;
        req.upstreamIssues.insert(req.upstreamIssues.end(),
                                  prices_->issues.begin(), prices_->issues.end());
    } else {
        std::vector<PricePoint> flat;
        for (int i = 0; i < nsteps; ++i) {
            flat.push_back({start + static_cast<Timestamp>(i) * step, settings_.defaultPrice});
        }
        curve = PriceCurve(std::move(flat), step);
        req.upstreamIssues.push_back({IssueKind::DataUnavailable,
            "no price data; default price " + fmt(settings_.defaultPrice, 4) + " assumed",
            static_cast<double>(nsteps)});
    }

    std::optional<ActionPlan> result;
    try {
        result = scheduler_.plan(req, curve, start, end, &cancel_);
    } catch (const std::invalid_argument& e) {
        setStatusError_(e.what());
        std::lock_guard<std::mutex> l(mtx_);
        inflight_ = PlanTrigger::None;
        return false;
    }

    {
        std::lock_guard<std::mutex> l(mtx_);
        inflight_ = PlanTrigger::None;
    }

    if (!result) {
        {
            std::lock_guard<std::mutex> rl(report_mtx_);
            ++plansCancelled_;
        }
        Logger::instance().info(src, std::string("planning for ") + planTriggerName(trigger) +
                                     " cancelled by a higher-priority trigger");
        return false;
    }

    state_ = ControllerState::Committed;
    auto committed = std::make_shared<const ActionPlan>(std::move(*result));
    {
        std::lock_guard<std::mutex> rl(report_mtx_);
        plan_ = committed;
        errorMsg_.clear();
        ++plansCommitted_;
    }
    planPriceRevision_   = prices_ ? prices_->revision : -1;
    planComfortRevision_ = comfortRev;
    lastPlanAt_          = now;

    std::ostringstream oss;
    oss << "committed plan (" << planTriggerName(trigger) << "): " << committed->size()
        << " step(s), cost " << fmt(committed->metadata().totalCost, 4)
        << ", " << fmt(committed->metadata().totalEnergyKwh) << " kWh";
    if (!committed->metadata().issues.empty()) {
        oss << ", " << committed->metadata().issues.size() << " issue(s)";
    }
    Logger::instance().info(src, oss.str());
    return true;
}

bool ZoneController::execute_(Timestamp now, double currentTempC, bool newPlan) {
    const auto plan = currentPlan();
    if (!plan) return false;
    const auto action = plan->actionAt(now);
    if (!action) return false;

    bool autoOn = true;
    ComfortBounds bounds;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        autoOn = autoControl_;
        bounds = comfort_.boundsAt(now + settings_.stepSeconds());
    }

    bool emitted = false;
    if (autoOn) {
        const bool force = forceEmit_.exchange(false);
        if (newPlan || force || !everEmitted_ || action->level != currentLevel_) {
            if (actuator_) actuator_->setHeatingLevel(cfg_.zoneId, action->level, now);
            if (!everEmitted_ || action->level != currentLevel_) levelSince_ = now;
            currentLevel_ = action->level;
            everEmitted_  = true;
            emitted       = true;
        }
    }

    ExecutedStep s;
    s.time        = now;
    s.stepSeconds = settings_.stepSeconds();
    s.level       = currentLevel_;
    s.price       = action->price;
    s.startTempC  = currentTempC;
    s.outdoorC    = lastOutdoorC_;
    s.minC        = bounds.minC;
    s.maxC        = bounds.maxC;
    runningStep_  = s;
    return emitted;
}

void ZoneController::persist_(bool history, bool learned, bool planned, bool settled) {
    if (!store_) return;
    try {
        if (history || learned) store_->saveHistory(cfg_.zoneId, history_);
        if (learned)            store_->saveModel(cfg_.zoneId, model());
        if (planned) {
            if (auto plan = currentPlan()) store_->savePlan(cfg_.zoneId, *plan);
        }
        if (settled)            store_->saveSavings(cfg_.zoneId, savings_.ledger());
    } catch (const std::runtime_error& e) {
        Logger::instance().warn(cfg_.zoneId + ".Controller",
                                std::string("persistence failed: ") + e.what());
    }
}

void ZoneController::setStatusError_(const std::string& msg) {
    Logger::instance().warn(cfg_.zoneId + ".Controller", "planning failed: " + msg);
    std::lock_guard<std::mutex> lock(report_mtx_);
    errorMsg_ = msg;
}

void ZoneController::logRow_(const TickContext& ctx, PlanTrigger trigger,
                             const SensorView& view, bool emitted) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const auto plan = currentPlan();
    std::optional<PlannedAction> a;
    if (plan) a = plan->actionAt(ctx.time);

    const ThermalModel m = model();
    int committed = 0, cancelled = 0;
    {
        std::lock_guard<std::mutex> lock(report_mtx_);
        committed = plansCommitted_;
        cancelled = plansCancelled_;
    }

    Logger::instance().log_wide(
        cfg_.zoneId + ".Controller",
        ctx.tick_index,
        ctx.time,
        {
            "state","trigger","measured_c","current_c","level","emitted",
            "price","min_c","max_c","predicted_c","stale","anomaly",
            "plans_committed","plans_cancelled",
            "model_k","model_gain","model_offset","model_degraded",
            "history","savings_total"
        },
        {
            static_cast<double>(static_cast<int>(state_.load())),
            static_cast<double>(static_cast<int>(trigger)),
            view.measured ? *view.measured : nan,
            view.currentC ? *view.currentC : nan,
            currentLevel_, emitted ? 1.0 : 0.0,
            a ? a->price : nan, a ? a->minC : nan, a ? a->maxC : nan,
            a ? a->predictedC : nan,
            view.stale ? 1.0 : 0.0, view.anomaly ? 1.0 : 0.0,
            static_cast<double>(committed), static_cast<double>(cancelled),
            m.params().k_per_h, m.params().gain_c_per_h, m.params().offset_c_per_h,
            m.degraded() ? 1.0 : 0.0,
            static_cast<double>(history_.size()), savings_.totalSavings()
        }
    );
}

// ---------------------------------------------------------------------------
// Reporting
// ---------------------------------------------------------------------------
ThermalModel ZoneController::model() const {
    return group_ ? group_->model() : model_;
}

std::shared_ptr<const ActionPlan> ZoneController::currentPlan() const {
    std::lock_guard<std::mutex> lock(report_mtx_);
    return plan_;
}

std::string ZoneController::statusLabel() const {
    bool autoOn = true;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        autoOn = autoControl_;
    }
    std::size_t samples = 0;
    {
        std::lock_guard<std::mutex> lock(report_mtx_);
        if (!errorMsg_.empty()) return "error";
        if (!autoOn) return "manual";
        if (!lastTempC_) return "initializing";
        samples = historySamples_;
    }
    if (samples < static_cast<std::size_t>(cfg_.model.minSamples)) return "collecting";
    if (model().degraded()) return "learning";
    return "optimizing";
}

std::string ZoneController::changeReason_(const PlannedAction& a, double fromLevel) const {
    std::ostringstream oss;
    oss << (a.level > fromLevel ? "raise to " : "lower to ") << fmt(a.level);

    const auto plan = currentPlan();
    if (plan && !plan->empty()) {
        double avg = 0.0;
        for (const auto& x : plan->actions()) avg += x.price;
        avg /= static_cast<double>(plan->size());
        const char* tag = "normal";
        if (avg > 0.0 && a.price < 0.85 * avg) tag = "cheap";
        else if (avg > 0.0 && a.price > 1.15 * avg) tag = "expensive";
        oss << " (" << tag << " price " << fmt(a.price, 4);
    } else {
        oss << " (price " << fmt(a.price, 4);
    }
    if (!a.window.empty()) oss << ", window " << a.window;
    if (a.relaxedC > 0.0) oss << ", bounds relaxed " << fmt(a.relaxedC) << " C";
    oss << ")";
    return oss.str();
}

ZoneReport ZoneController::report() const {
    ZoneReport r;
    r.zoneId = cfg_.zoneId;
    r.state  = state_.load();
    r.status = statusLabel();
    r.level  = currentLevel_;

    Timestamp now = 0;
    std::shared_ptr<const ActionPlan> plan;
    {
        std::lock_guard<std::mutex> lock(report_mtx_);
        r.temperatureC   = lastTempC_;
        r.plansCommitted = plansCommitted_;
        r.plansCancelled = plansCancelled_;
        for (const auto& i : tickIssues_) {
            r.issues.push_back(std::string(issueKindName(i.kind)) + ": " + i.detail);
        }
        if (!errorMsg_.empty()) r.issues.push_back("error: " + errorMsg_);
        now  = reportTime_;
        plan = plan_;
    }

    if (plan) {
        r.planCost = plan->metadata().totalCost;
        for (const auto& line : plan->describe()) r.issues.push_back(line);
        if (auto next = plan->nextChangeAfter(now)) {
            r.nextChange = NextChange{next->time, next->level, changeReason_(*next, r.level)};
        }
    }

    r.savingsTotal = savings_.totalSavings();
    r.savingsOpen  = savings_.openPeriodSavings(model());
    return r;
}
