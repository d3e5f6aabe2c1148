#include "ControlEngine.hpp"
#include "Logger.hpp"

#include <chrono>

void ControlEngine::addSubsystem(Subsystem* subsystem) {
    subsystems_.push_back(subsystem);
}

void ControlEngine::addZone(Subsystem* zone) {
    zones_.push_back(zone);
}

void ControlEngine::setTickStep(double dt) {
    tick_step_ = dt;
}

void ControlEngine::setStartTime(Timestamp t) {
    time_ = t;
}

void ControlEngine::setParallel(bool on) {
    parallel_ = on;
}

void ControlEngine::initialize() {
    for (auto* s : subsystems_) s->initialize();
    for (auto* z : zones_) z->initialize();

    if (parallel_ && zones_.size() > 1) {
        for (auto* z : zones_) tickEngine_.addSubsystem(z);
        tickEngine_.start();
    }
    tick_count_ = 0;
}

void ControlEngine::tick() {
    const TickContext ctx{ tick_count_, time_, tick_step_ };
    const auto t0 = std::chrono::steady_clock::now();

    for (auto* s : subsystems_) s->tick(ctx);

    if (tickEngine_.running()) {
        tickEngine_.runTick(ctx);
    } else {
        for (auto* z : zones_) z->tick(ctx);
    }

    const double wall_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();
    logRow_(tick_count_, time_, wall_ms);

    tick_count_ += 1;
    time_       += static_cast<Timestamp>(tick_step_);
}

void ControlEngine::shutdown() {
    tickEngine_.stop();
    for (auto* z : zones_) z->shutdown();
    for (auto* s : subsystems_) s->shutdown();
}

void ControlEngine::logRow_(int tick, Timestamp time, double wall_ms) {
    Logger::instance().log_wide(
        log_stream_,
        tick,
        time,
        {"status", "zones", "plants", "parallel", "tick_wall_ms"},
        {1.0,
         static_cast<double>(zones_.size()),
         static_cast<double>(subsystems_.size()),
         tickEngine_.running() ? 1.0 : 0.0,
         wall_ms}
    );
}
