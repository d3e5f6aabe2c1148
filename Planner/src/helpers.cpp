#include "helpers.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace PlanHelpers {

// ---------------------------
// Tiny CLI helpers (no deps)
// ---------------------------
static bool arg_eq(const char* a, const char* b) {
  return std::strcmp(a, b) == 0;
}

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    if (arg_eq(argv[i], "--mode") && i + 1 < argc)           a.mode = argv[++i];
    else if (arg_eq(argv[i], "--deck") && i + 1 < argc)      a.deck = argv[++i];
    else if (arg_eq(argv[i], "--prices") && i + 1 < argc)    a.prices = argv[++i];
    else if (arg_eq(argv[i], "--weather") && i + 1 < argc)   a.weather = argv[++i];
    else if (arg_eq(argv[i], "--sensors") && i + 1 < argc)   a.sensors = argv[++i];
    else if (arg_eq(argv[i], "--state-dir") && i + 1 < argc) a.stateDir = argv[++i];
    else if (arg_eq(argv[i], "--start") && i + 1 < argc)     a.start = std::atoll(argv[++i]);
    else if (arg_eq(argv[i], "--nticks") && i + 1 < argc)    a.nticks = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--parallel"))                  a.parallel = true;
    else if (arg_eq(argv[i], "--help"))                      a.showHelp = true;
  }
  return a;
}

void print_usage() {
  std::cout <<
    "Usage: heatplan [--mode plan|replay]\n"
    "                [--deck input/zones.deck] [--prices input/prices.csv]\n"
    "                [--weather FILE] [--sensors FILE] [--state-dir DIR]\n"
    "                [--start EPOCH] [--nticks N] [--parallel]\n"
    "\n"
    "Modes:\n"
    "  plan    - one planning cycle per zone from the latest sensor snapshot;\n"
    "            prints the next change and the commands that would be sent\n"
    "  replay  - closed loop against a simulated room per zone for N steps;\n"
    "            zones learn, replan and accumulate savings\n"
    "\n"
    "Zones are spread across MPI ranks; rank 0 reads prices and weather and\n"
    "broadcasts them. Logs go to $HEATPLAN_LOG_DIR/$RUN_ID.\n";
}

// ---------------------------
// CSV loaders
// ---------------------------
std::map<Timestamp, double> load_weather_csv(const std::string& path, LogFn log_fn) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open weather file " + path);
  }

  std::map<Timestamp, double> out;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    if (line.empty() || line[0] == '#') continue;
    for (auto& ch : line) if (ch == ',') ch = ' ';

    std::istringstream iss(line);
    long long t = 0;
    double c = 0.0;
    if (!(iss >> t >> c)) {
      if (lineno == 1) continue;   // header
      std::ostringstream oss;
      oss << path << " line " << lineno << " malformed, skipping: " << line;
      if (log_fn) log_fn(oss.str());
      continue;
    }
    out[static_cast<Timestamp>(t)] = c;
  }
  return out;
}

std::vector<SensorRow> load_sensor_csv(const std::string& path, LogFn log_fn) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open sensor file " + path);
  }

  std::vector<SensorRow> rows;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    if (line.empty() || line[0] == '#') continue;
    for (auto& ch : line) if (ch == ',') ch = ' ';

    std::istringstream iss(line);
    SensorRow r;
    long long t = 0;
    if (!(iss >> r.zoneId >> t >> r.reading.value)) {
      if (lineno == 1) continue;   // header
      std::ostringstream oss;
      oss << path << " line " << lineno << " malformed, skipping: " << line;
      if (log_fn) log_fn(oss.str());
      continue;
    }
    r.reading.timestamp = static_cast<Timestamp>(t);
    double outdoor = 0.0;
    if (iss >> outdoor) r.outdoorC = outdoor;
    rows.push_back(r);
  }
  return rows;
}

std::map<std::string, SensorRow> latest_readings(const std::vector<SensorRow>& rows, Timestamp t) {
  std::map<std::string, SensorRow> latest;
  for (const auto& r : rows) {
    if (r.reading.timestamp > t) continue;
    auto it = latest.find(r.zoneId);
    if (it == latest.end() || it->second.reading.timestamp < r.reading.timestamp) {
      latest[r.zoneId] = r;
    }
  }
  return latest;
}

Timestamp align_to_step(Timestamp t, int stepSeconds) {
  if (stepSeconds <= 0) return t;
  return t - (((t % stepSeconds) + stepSeconds) % stepSeconds);
}

} // namespace PlanHelpers
