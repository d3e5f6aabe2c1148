#pragma once
#include <cstdint>

// One control step as seen by every subsystem.
// time is UTC epoch seconds at the start of the step, dt is the step length (s).
struct TickContext {
    int          tick_index = 0;
    std::int64_t time       = 0;
    double       dt         = 3600.0;
};
