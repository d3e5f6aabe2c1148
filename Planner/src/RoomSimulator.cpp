#include "RoomSimulator.hpp"
#include "Logger.hpp"
#include "ZoneController.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

RoomSimulator::RoomSimulator(const std::string& zoneId, ThermalParams truth,
                             double initialTempC, std::vector<double> levels)
    : Subsystem(zoneId + ".Room"),
      zone_id_(zoneId),
      truth_(truth),
      levels_(std::move(levels)),
      initial_temp_c_(initialTempC),
      temperature_c_(initialTempC) {
    std::sort(levels_.begin(), levels_.end());
}

void RoomSimulator::initialize() {
    std::lock_guard<std::mutex> lock(mtx_);
    temperature_c_ = initial_temp_c_;
    level_         = 0.0;
    commands_      = 0;
    level_hours_   = 0.0;
    started_       = false;
}

void RoomSimulator::tick(const TickContext& ctx) {
    double temp = 0.0, level = 0.0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (started_ && ctx.time > last_time_) {
            const double hours = (ctx.time - last_time_) / 3600.0;
            temperature_c_ = ThermalModel::stepWith(truth_, temperature_c_, level_,
                                                    outdoorAt(last_time_), hours);
            level_hours_ += level_ * hours;
            // Basic safety clamp
            if (!std::isfinite(temperature_c_)) temperature_c_ = outdoorAt(ctx.time);
        }
        started_   = true;
        last_time_ = ctx.time;
        temp  = temperature_c_;
        level = level_;
    }

    const double outdoor = outdoorAt(ctx.time);
    double reading = temp;
    if (noise_sigma_c_ > 0.0) {
        std::normal_distribution<double> noise(0.0, noise_sigma_c_);
        reading += noise(rng_);
    }
    if (controller_) controller_->observe({reading, ctx.time}, outdoor);

    Logger::instance().log_wide(
        getName(),
        ctx.tick_index,
        ctx.time,
        {"status", "temp_c", "reading_c", "level", "outdoor_c", "level_hours"},
        {1.0, temp, reading, level, outdoor, level_hours_}
    );
}

void RoomSimulator::shutdown() {
    // No special rows on shutdown
}

void RoomSimulator::setHeatingLevel(const std::string& zoneId, double level, Timestamp) {
    if (zoneId != zone_id_) {
        Logger::instance().warn(getName(), "command for zone '" + zoneId + "' ignored");
        return;
    }
    std::lock_guard<std::mutex> lock(mtx_);
    level_ = std::min(1.0, std::max(0.0, level));
    ++commands_;
}

void RoomSimulator::setWeather(std::map<Timestamp, double> outdoor) {
    std::lock_guard<std::mutex> lock(mtx_);
    weather_ = std::move(outdoor);
}

void RoomSimulator::setSensorNoise(double sigmaC, unsigned seed) {
    noise_sigma_c_ = std::max(0.0, sigmaC);
    rng_.seed(seed);
}

double RoomSimulator::outdoorAt(Timestamp t) const {
    if (weather_.empty()) return default_outdoor_c_;
    auto it = weather_.upper_bound(t);
    if (it == weather_.begin()) return it->second;
    return std::prev(it)->second;
}

double RoomSimulator::getTemperature() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return temperature_c_;
}

double RoomSimulator::getLevel() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return level_;
}

int RoomSimulator::commandsReceived() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return commands_;
}
