#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "ActionPlan.hpp"
#include "ComfortPolicy.hpp"
#include "HeatingActuator.hpp"
#include "PriceFeed.hpp"
#include "SavingsTracker.hpp"
#include "Scheduler.hpp"
#include "Subsystem.hpp"
#include "ThermalGroup.hpp"
#include "ThermalHistory.hpp"
#include "ThermalModel.hpp"
#include "ZoneConfig.hpp"

class ZoneStore;

struct SensorReading {
    double    value     = 0.0;
    Timestamp timestamp = 0;
};

enum class ControllerState { Idle, Planning, Committed, Executing, Replanning, Stopped };

// Ordered by priority; a higher trigger cancels an in-flight lower one.
enum class PlanTrigger { None = 0, Cadence, PriceUpdate, ComfortChange, Drift, Override };

const char* controllerStateName(ControllerState s);
const char* planTriggerName(PlanTrigger t);

struct NextChange {
    Timestamp   time  = 0;
    double      level = 0.0;
    std::string reason;
};

struct ZoneReport {
    std::string     zoneId;
    ControllerState state = ControllerState::Idle;
    std::string     status;             // initializing/collecting/learning/optimizing/manual/error
    std::optional<double> temperatureC;
    double          level = 0.0;
    std::optional<NextChange> nextChange;
    double          planCost        = 0.0;
    double          savingsTotal    = 0.0;
    double          savingsOpen     = 0.0;
    int             plansCommitted  = 0;
    int             plansCancelled  = 0;
    std::vector<std::string> issues;
};

// Orchestrates one zone: learn, plan, commit, execute, settle.
//
// Inputs arrive as snapshots (observe, setPrices, setters) from any thread;
// tick() runs the cycle on the engine thread. Only one planning pass is in
// flight per zone; triggers raised meanwhile are coalesced, and one with a
// strictly higher priority cancels the pass. The committed plan stays in
// force until its replacement is committed.
class ZoneController : public Subsystem {
public:
    // Throws ConfigInvalidError if the zone definition is unusable or the
    // actuator supports none of the configured levels.
    ZoneController(const ZoneConfig& config,
                   const PlannerSettings& settings,
                   HeatingActuator* actuator,
                   std::shared_ptr<ThermalGroup> group = nullptr);

    void initialize() override;
    void tick(const TickContext& ctx) override;
    void shutdown() override;

    // hookups
    void setZoneStore(ZoneStore* store) { store_ = store; }

    // snapshots in
    void observe(const SensorReading& indoor, std::optional<double> outdoorC = std::nullopt);
    void setOutdoorForecast(std::map<Timestamp, double> forecast);
    void setPrices(std::shared_ptr<const PriceSnapshot> prices);

    // user controls
    void setOverride(const ComfortOverride& o);
    void clearOverride();
    void setVacation(const VacationSpec& v);
    void clearVacation();
    void setMode(OptimizationMode m);
    void setAutoControl(bool on);
    void requestReplan(PlanTrigger trigger);

    // reporting
    ControllerState state() const { return state_.load(); }
    std::shared_ptr<const ActionPlan> currentPlan() const;
    ZoneReport report() const;
    std::string statusLabel() const;

    const std::string& zoneId() const { return cfg_.zoneId; }
    const std::vector<double>& levels() const { return levels_; }

    // Engine-thread state; read between ticks.
    ThermalModel model() const;
    const ThermalHistory& history() const { return history_; }
    const SavingsTracker& savings() const { return savings_; }

private:
    struct Pending {
        std::optional<SensorReading> indoor;
        std::optional<double> outdoorC;
        std::shared_ptr<const PriceSnapshot> prices;
        PlanTrigger trigger = PlanTrigger::None;
    };

    // What the sensor tells this tick.
    struct SensorView {
        std::optional<double> measured;   // fresh reading
        std::optional<double> currentC;   // measured, else predicted/last known
        bool newSample = false;
        bool stale     = false;
        bool anomaly   = false;
    };

    // Per-tick steps.
    SensorView ingestReading_(Timestamp now, const Pending& in);
    bool learn_(Timestamp now);
    bool recordExecuted_(Timestamp now);
    PlanTrigger detectTrigger_(Timestamp now, const SensorView& view, PlanTrigger requested);
    bool planCycle_(const TickContext& ctx, double currentTempC, PlanTrigger trigger);
    bool execute_(Timestamp now, double currentTempC, bool newPlan);
    void persist_(bool history, bool learned, bool planned, bool settled);
    void logRow_(const TickContext& ctx, PlanTrigger trigger, const SensorView& view,
                 bool emitted);

    void raiseLocked_(PlanTrigger t);
    void addIssue_(IssueKind kind, const std::string& detail, double magnitude = 0.0);
    static ZoneConfig validated_(const ZoneConfig& c);
    static std::vector<double> resolveLevels_(const ZoneConfig& c, const HeatingActuator* a);

    std::vector<std::optional<double>> outdoorFor_(Timestamp start, int steps) const;
    std::string changeReason_(const PlannedAction& a, double fromLevel) const;
    void setStatusError_(const std::string& msg);

    ZoneConfig cfg_;
    PlannerSettings settings_;
    HeatingActuator* actuator_ = nullptr;
    std::shared_ptr<ThermalGroup> group_;
    ZoneStore* store_ = nullptr;
    std::vector<double> levels_;
    Scheduler scheduler_;

    // mailbox, guarded by mtx_
    mutable std::mutex mtx_;
    Pending pending_;
    ComfortPolicy comfort_;
    std::map<Timestamp, double> forecast_;
    bool autoControl_ = true;
    PlanTrigger inflight_ = PlanTrigger::None;
    std::atomic<bool> cancel_{false};
    std::atomic<bool> forceEmit_{false};
    std::atomic<ControllerState> state_{ControllerState::Idle};

    // published results, guarded by report_mtx_
    mutable std::mutex report_mtx_;
    std::shared_ptr<const ActionPlan> plan_;
    std::string errorMsg_;
    std::optional<double> lastTempC_;
    std::vector<PlanIssue> tickIssues_;
    int plansCommitted_ = 0;
    int plansCancelled_ = 0;
    std::size_t historySamples_ = 0;
    Timestamp reportTime_ = 0;

    // engine-thread only
    ThermalModel model_;
    ThermalHistory history_;
    SavingsTracker savings_;
    std::shared_ptr<const PriceSnapshot> prices_;
    std::optional<SensorReading> lastReading_;
    std::optional<double> lastOutdoorC_;
    std::optional<ExecutedStep> runningStep_;
    long planPriceRevision_   = -1;
    long planComfortRevision_ = -1;
    Timestamp lastPlanAt_     = 0;
    Timestamp levelSince_     = 0;
    double currentLevel_      = 0.0;
    bool   everEmitted_       = false;
    int    ticksSinceFit_     = 0;
};
