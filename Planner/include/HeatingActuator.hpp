#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "PlanIssues.hpp"

struct HeatingCommand {
    std::string zoneId;
    double      level         = 0.0;
    Timestamp   effectiveFrom = 0;
};

// Actuation boundary. The planner only reads the capability and produces
// commands; the outcome is observed later through the sensor.
class HeatingActuator {
public:
    virtual ~HeatingActuator() = default;

    // Levels the device accepts, as fractions of rated heat, ascending.
    // An on/off relay is {0, 1}; a modulating valve exposes a grid.
    virtual std::vector<double> supportsLevels() const = 0;

    virtual void setHeatingLevel(const std::string& zoneId, double level,
                                 Timestamp effectiveFrom) = 0;
};

// Grid of n+1 evenly spaced levels for a continuously modulating device.
std::vector<double> modulatingLevels(int steps);

// Queues commands for the caller to deliver over whatever transport it has.
class CommandQueueActuator : public HeatingActuator {
public:
    // Throws std::invalid_argument unless levels are within [0, 1].
    explicit CommandQueueActuator(std::vector<double> levels);

    std::vector<double> supportsLevels() const override { return levels_; }
    void setHeatingLevel(const std::string& zoneId, double level,
                         Timestamp effectiveFrom) override;

    std::vector<HeatingCommand> drain();
    std::size_t pending() const;

private:
    std::vector<double> levels_;
    mutable std::mutex mtx_;
    std::vector<HeatingCommand> queue_;
};
