#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "ZoneController.hpp"

namespace PlanHelpers {

// ---------------------------
// CLI arguments / config
// ---------------------------
struct Args {
  std::string mode     = "plan";               // "plan" or "replay"
  std::string deck     = "input/zones.deck";
  std::string prices   = "input/prices.csv";
  std::string weather;                         // optional "epoch,outdoor_c"
  std::string sensors;                         // optional "zone,epoch,temp_c[,outdoor_c]"
  std::string stateDir;                        // empty: no persistence
  long long   start    = -1;                   // epoch s; -1 = first price point
  int         nticks   = 48;                   // replay length in steps
  bool        parallel = false;                // tick zones on worker threads
  bool        showHelp = false;
};

// One row of a sensor snapshot file.
struct SensorRow {
  std::string   zoneId;
  SensorReading reading;
  std::optional<double> outdoorC;
};

// Warning sink used by helpers (implemented in main.cpp).
using LogFn = std::function<void(const std::string&)>;

// Argument helpers
Args parse_args(int argc, char** argv);
void print_usage();

// Loaders. Malformed lines are reported through log_fn and skipped;
// a file that cannot be opened throws std::runtime_error.
std::map<Timestamp, double> load_weather_csv(const std::string& path, LogFn log_fn);
std::vector<SensorRow> load_sensor_csv(const std::string& path, LogFn log_fn);

// Latest row per zone at or before t.
std::map<std::string, SensorRow> latest_readings(const std::vector<SensorRow>& rows, Timestamp t);

// Align t down to the step grid.
Timestamp align_to_step(Timestamp t, int stepSeconds);

} // namespace PlanHelpers
