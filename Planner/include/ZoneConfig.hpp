#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include "ComfortPolicy.hpp"
#include "Scheduler.hpp"
#include "ThermalModel.hpp"

enum class HeatingType { Unknown, Electric, Hydronic, Mixed };

const char* heatingTypeName(HeatingType t);

// Deck-wide settings (lines outside any zone block).
struct PlannerSettings {
    int    stepMinutes        = 60;
    double horizonHours       = 24.0;
    int    replanEveryMinutes = 60;
    double driftThresholdC    = 1.0;
    double freezeFloorC       = 5.0;
    int    utcOffsetMin       = 0;
    OptimizationMode mode     = OptimizationMode::Balanced;
    double defaultPrice       = 1.0;
    double savingsPeriodHours = 24.0;
    int    sensorStaleMinutes = 30;
    double anomalyJumpC       = 5.0;
    int    refitEveryTicks    = 6;
    SchedulerSettings scheduler;

    int stepSeconds() const { return stepMinutes * 60; }
    int horizonSteps() const;
};

struct ZoneConfig {
    std::string zoneId;
    std::string sensorRef;
    std::string actuatorRef;
    std::string group;                      // empty: the zone owns its model
    HeatingType heatingType = HeatingType::Unknown;

    double ratedKw         = 2.0;
    std::vector<double> actionLevels{0.0, 1.0};
    int    minDwellMinutes = 0;

    ComfortWindow defaultWindow;            // 19-23 C unless configured
    std::vector<ComfortWindow> comfortWindows;

    ModelSettings model;
    double retentionDays = 14.0;
    bool   autoControl   = true;
    std::optional<ThermalParams> initialParams;

    // Replay only: parameters and start temperature of the simulated room.
    std::optional<ThermalParams> simParams;
    std::optional<double> simStartC;
};

struct DeckConfig {
    PlannerSettings settings;
    std::vector<ZoneConfig> zones;
    std::vector<std::string> rejected;      // one message per rejected zone
};

// Throws ConfigInvalidError describing the first problem found.
void validate_zone(const ZoneConfig& z);

// Line-oriented deck. Malformed global lines are skipped with a warning;
// a malformed zone block rejects that zone only (listed in `rejected`).
DeckConfig parse_zone_deck(std::istream& in, const std::string& sourceName);

// Throws std::runtime_error if the file cannot be opened.
DeckConfig load_zone_deck(const std::string& path);

// "06:30" -> 390. Throws std::invalid_argument.
int parse_minute_of_day(const std::string& hhmm);
