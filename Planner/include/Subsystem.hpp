#pragma once
#include <string>
#include <utility>
#include "TickContext.hpp"

// Anything the ControlEngine ticks: a zone controller, or a plant standing
// in for the building (RoomSimulator).
class Subsystem {
public:
    explicit Subsystem(std::string name) : name_(std::move(name)) {}
    virtual ~Subsystem() = default;

    // Once before the first tick; may load persisted state.
    virtual void initialize() = 0;
    // One control step starting at ctx.time. Zones may tick concurrently.
    virtual void tick(const TickContext& ctx) = 0;
    // Last call; settles and persists whatever is still open.
    virtual void shutdown() = 0;

    const std::string& getName() const { return name_; }

protected:
    std::string name_;
};
