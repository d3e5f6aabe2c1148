#pragma once
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <vector>
#include "HeatingActuator.hpp"
#include "Subsystem.hpp"
#include "ThermalModel.hpp"

class ZoneController;

// Simulated room: plays the thermostat (receives levels) and the sensor
// (pushes readings) for one zone, integrating the RC response with its own
// "true" parameters between ticks.
class RoomSimulator : public Subsystem, public HeatingActuator {
public:
    RoomSimulator(const std::string& zoneId, ThermalParams truth,
                  double initialTempC, std::vector<double> levels);

    void initialize() override;
    void tick(const TickContext& ctx) override;
    void shutdown() override;

    // HeatingActuator
    std::vector<double> supportsLevels() const override { return levels_; }
    void setHeatingLevel(const std::string& zoneId, double level,
                         Timestamp effectiveFrom) override;

    // Optional hookup: readings are pushed to the controller every tick.
    void setController(ZoneController* zc) { controller_ = zc; }

    // Outdoor series; values are held between points.
    void setWeather(std::map<Timestamp, double> outdoor);
    void setDefaultOutdoorC(double c) { default_outdoor_c_ = c; }

    // Gaussian sensor noise (C); zero disables it.
    void setSensorNoise(double sigmaC, unsigned seed);

    double outdoorAt(Timestamp t) const;
    double getTemperature() const;
    double getLevel() const;
    int commandsReceived() const;

private:
    std::string zone_id_;
    ThermalParams truth_;
    std::vector<double> levels_;
    double initial_temp_c_;

    mutable std::mutex mtx_;
    double temperature_c_;
    double level_ = 0.0;
    int    commands_ = 0;

    std::map<Timestamp, double> weather_;
    double default_outdoor_c_ = 5.0;

    double noise_sigma_c_ = 0.0;
    std::mt19937 rng_{42};

    bool      started_   = false;
    Timestamp last_time_ = 0;
    double    level_hours_ = 0.0;   // integral of level over time

    ZoneController* controller_ = nullptr;
};
