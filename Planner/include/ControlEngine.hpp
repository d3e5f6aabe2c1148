#pragma once
#include <string>
#include <vector>
#include "PlanIssues.hpp"
#include "Subsystem.hpp"
#include "ZoneTickEngine.hpp"

// Drives the control loop. Plant-side subsystems tick first, in the order
// added; zone subsystems tick after them, concurrently when parallel.
class ControlEngine {
public:
    void addSubsystem(Subsystem* subsystem);
    void addZone(Subsystem* zone);

    void setTickStep(double dt);
    void setStartTime(Timestamp t);
    void setParallel(bool on);
    // CSV stream name; one per MPI rank.
    void setLogStream(const std::string& name) { log_stream_ = name; }

    void initialize();
    void tick();
    void shutdown();

    int tickCount() const { return tick_count_; }
    Timestamp time() const { return time_; }
    double tickStep() const { return tick_step_; }

private:
    std::vector<Subsystem*> subsystems_;
    std::vector<Subsystem*> zones_;
    ZoneTickEngine tickEngine_;
    bool parallel_ = false;
    std::string log_stream_ = "ControlEngine";

    int       tick_count_ = 0;
    Timestamp time_       = 0;
    double    tick_step_  = 3600.0;   // seconds per tick

    void logRow_(int tick, Timestamp time, double wall_ms);
};
