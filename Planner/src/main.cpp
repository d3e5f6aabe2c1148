// Planner/src/main.cpp
// mpirun -np 2 ./build/heatplan --mode replay
/**
Build (from repo root):
  cmake -S . -B build -DCMAKE_BUILD_TYPE=Release
  cmake --build build -j

Run (from repo root):
  mpirun -np 2 ./build/heatplan --mode plan \
    --deck input/zones.deck --prices input/prices.csv --sensors input/sensors.csv

  RUN_ID=winter_week mpirun -np 2 ./build/heatplan --mode replay --nticks 96 \
    --deck input/zones.deck --prices input/prices.csv --weather input/weather.csv \
    --state-dir data/state --parallel
*/

#include <mpi.h>
#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ControlEngine.hpp"
#include "HeatingActuator.hpp"
#include "Logger.hpp"
#include "MpiExchange.hpp"
#include "PriceFeed.hpp"
#include "RoomSimulator.hpp"
#include "ThermalGroup.hpp"
#include "ZoneConfig.hpp"
#include "ZoneController.hpp"
#include "ZoneStore.hpp"
#include "helpers.hpp"

using PlanHelpers::Args;
using PlanHelpers::SensorRow;
using PlanHelpers::parse_args;
using PlanHelpers::print_usage;
using PlanHelpers::align_to_step;

namespace {

// Everything one rank owns for a zone.
struct LocalZone {
  ZoneConfig cfg;
  std::unique_ptr<CommandQueueActuator> queue;   // plan mode
  std::unique_ptr<RoomSimulator>        room;    // replay mode
  std::unique_ptr<ZoneController>       controller;
};

void log_msg(const std::string& level, const std::string& msg) {
  Logger::instance().event(level, "heatplan", msg);
}

std::string format_report(const ZoneReport& r) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2);
  oss << "zone " << r.zoneId << " [" << r.status << ", " << controllerStateName(r.state) << "]";
  if (r.temperatureC) oss << " temp=" << *r.temperatureC << "C";
  oss << " level=" << r.level << " plan_cost=" << std::setprecision(4) << r.planCost
      << " savings=" << r.savingsTotal << " open=" << r.savingsOpen;
  if (r.nextChange) {
    oss << "\n    next change at " << r.nextChange->time << ": " << r.nextChange->reason;
  }
  for (const auto& issue : r.issues) oss << "\n    " << issue;
  return oss.str();
}

// Points a fetch for [start, end) would return, plus one day back so the
// feed can fill same-time-yesterday gaps.
std::vector<PricePoint> window_of(const std::vector<PricePoint>& all, Timestamp start, Timestamp end) {
  std::vector<PricePoint> out;
  for (const auto& p : all) {
    if (p.time >= start - 86400 && p.time < end) out.push_back(p);
  }
  return out;
}

} // namespace

int main(int argc, char** argv) {
  MPI_Init(&argc, &argv);

  int rank = 0;
  int size = 1;
  MPI_Comm_rank(MPI_COMM_WORLD, &rank);
  MPI_Comm_size(MPI_COMM_WORLD, &size);

  Args args = parse_args(argc, argv);
  Logger::instance().setEcho(rank == 0);

  if (args.showHelp) {
    if (rank == 0) print_usage();
    MPI_Finalize();
    return 0;
  }

  // ------------------------------------------------------------------------
  // Sanity clamps so bad CLI values cannot kill the control loop.
  // ------------------------------------------------------------------------
  if (args.nticks <= 0) {
    if (rank == 0) log_msg("warn", "nticks <= 0 from CLI; defaulting to 48.");
    args.nticks = 48;
  }
  if (args.mode != "plan" && args.mode != "replay") {
    if (rank == 0) {
      log_msg("fatal", "Unknown mode '" + args.mode + "'. Expected 'plan' or 'replay'.");
      print_usage();
    }
    MPI_Abort(MPI_COMM_WORLD, 1);
    return EXIT_FAILURE;
  }

  try {
    if (rank == 0) {
      std::ostringstream oss;
      oss << "MPI world size = " << size
          << "; mode=" << args.mode
          << " deck=" << args.deck
          << " prices=" << args.prices
          << " weather=" << (args.weather.empty() ? "<none>" : args.weather)
          << " sensors=" << (args.sensors.empty() ? "<none>" : args.sensors)
          << " state-dir=" << (args.stateDir.empty() ? "<none>" : args.stateDir)
          << " nticks=" << args.nticks
          << " parallel=" << (args.parallel ? 1 : 0);
      const char* env_run_id = std::getenv("RUN_ID");
      oss << "; RUN_ID=" << (env_run_id ? env_run_id : "<unset>")
          << " logs=" << Logger::instance().baseDir();
      log_msg("info", oss.str());
    }

    auto warn_fn = [](const std::string& m) { log_msg("warn", m); };

    // --------------------------------------------------------------------
    // Zone deck (small; every rank parses it)
    // --------------------------------------------------------------------
    const DeckConfig deck = load_zone_deck(args.deck);
    const PlannerSettings& settings = deck.settings;
    const int step = settings.stepSeconds();
    const Timestamp horizon = static_cast<Timestamp>(settings.horizonSteps()) * step;

    // --------------------------------------------------------------------
    // Prices and weather: rank 0 reads, everyone receives
    // --------------------------------------------------------------------
    std::vector<PricePoint> pricePoints;
    std::map<Timestamp, double> weather;
    if (rank == 0) {
      try {
        pricePoints = CsvPriceSource::readFile(args.prices);
      } catch (const DataUnavailableError& e) {
        log_msg("warn", std::string(e.what()) + "; planning on default prices");
      }
      if (!args.weather.empty()) weather = PlanHelpers::load_weather_csv(args.weather, warn_fn);

      std::ostringstream oss;
      oss << "Loaded " << pricePoints.size() << " price point(s), "
          << weather.size() << " weather point(s)";
      log_msg("info", oss.str());
    }
    MpiExchange::broadcastPrices(pricePoints, 0, MPI_COMM_WORLD);
    MpiExchange::broadcastSeries(weather, 0, MPI_COMM_WORLD);

    Timestamp start = args.start;
    if (start < 0) {
      start = pricePoints.empty() ? static_cast<Timestamp>(std::time(nullptr))
                                  : pricePoints.front().time;
    }
    start = align_to_step(start, step);

    std::vector<SensorRow> sensorRows;
    if (!args.sensors.empty()) sensorRows = PlanHelpers::load_sensor_csv(args.sensors, warn_fn);

    // --------------------------------------------------------------------
    // Zones: round-robin over ranks, a thermal group stays on one rank
    // --------------------------------------------------------------------
    std::map<std::string, int> ownerOf;
    int nextOwner = 0;
    for (const auto& z : deck.zones) {
      const std::string key = z.group.empty() ? "zone:" + z.zoneId : "group:" + z.group;
      if (!ownerOf.count(key)) ownerOf[key] = nextOwner++ % size;
    }

    std::unique_ptr<ZoneStore> store;
    if (!args.stateDir.empty()) store = std::make_unique<ZoneStore>(args.stateDir);

    std::map<std::string, std::shared_ptr<ThermalGroup>> groups;
    std::vector<LocalZone> zones;
    zones.reserve(deck.zones.size());

    for (const auto& cfg : deck.zones) {
      const std::string key = cfg.group.empty() ? "zone:" + cfg.zoneId : "group:" + cfg.group;
      if (ownerOf[key] != rank) continue;

      LocalZone lz;
      lz.cfg = cfg;
      HeatingActuator* actuator = nullptr;
      if (args.mode == "replay") {
        const ThermalParams truth = cfg.simParams.value_or(ThermalModel::defaults());
        const double startC = cfg.simStartC.value_or(
            0.5 * (cfg.defaultWindow.minC + cfg.defaultWindow.maxC));
        lz.room = std::make_unique<RoomSimulator>(cfg.zoneId, truth, startC, cfg.actionLevels);
        lz.room->setWeather(weather);
        lz.room->setDefaultOutdoorC(cfg.model.defaultOutdoorC);
        actuator = lz.room.get();
      } else {
        lz.queue = std::make_unique<CommandQueueActuator>(cfg.actionLevels);
        actuator = lz.queue.get();
      }

      std::shared_ptr<ThermalGroup> group;
      if (!cfg.group.empty()) {
        auto& g = groups[cfg.group];
        if (!g) g = std::make_shared<ThermalGroup>(cfg.group, cfg.model);
        group = g;
      }

      try {
        lz.controller = std::make_unique<ZoneController>(cfg, settings, actuator, group);
      } catch (const ConfigInvalidError& e) {
        log_msg("warn", std::string("zone skipped: ") + e.what());
        continue;
      }
      lz.controller->setZoneStore(store.get());
      lz.controller->setOutdoorForecast(weather);
      if (lz.room) lz.room->setController(lz.controller.get());
      zones.push_back(std::move(lz));
    }

    {
      std::ostringstream oss;
      oss << "rank " << rank << " runs " << zones.size() << " zone(s)";
      log_msg("info", oss.str());
    }

    // --------------------------------------------------------------------
    // Engine
    // --------------------------------------------------------------------
    ControlEngine engine;
    engine.setTickStep(static_cast<double>(step));
    engine.setStartTime(start);
    engine.setParallel(args.parallel);
    engine.setLogStream(size > 1 ? "ControlEngine.rank" + std::to_string(rank) : "ControlEngine");
    for (auto& z : zones) {
      if (z.room) engine.addSubsystem(z.room.get());
      engine.addZone(z.controller.get());
    }
    engine.initialize();

    PriceFeed feed(step, settings.defaultPrice);
    auto pushPrices = [&](Timestamp t) {
      auto snap = feed.ingest(window_of(pricePoints, t, t + horizon), t, t + horizon);
      for (auto& z : zones) z.controller->setPrices(snap);
    };

    double commands = 0.0;

    if (args.mode == "plan") {
      // ------------------------------------------------------------------
      // One planning cycle from the latest snapshot
      // ------------------------------------------------------------------
      const auto latest = PlanHelpers::latest_readings(sensorRows, start);
      for (auto& z : zones) {
        auto it = latest.find(z.cfg.zoneId);
        if (it == latest.end()) {
          log_msg("warn", "no sensor reading for zone '" + z.cfg.zoneId + "'; planning deferred");
          continue;
        }
        z.controller->observe(it->second.reading, it->second.outdoorC);
      }
      pushPrices(start);
      engine.tick();

      for (auto& z : zones) {
        std::cout << format_report(z.controller->report()) << "\n";
        for (const auto& c : z.queue->drain()) {
          std::cout << "    command " << c.zoneId << " level=" << c.level
                    << " from " << c.effectiveFrom << "\n";
          commands += 1.0;
        }
      }
    } else {
      // ------------------------------------------------------------------
      // Closed-loop replay; prices are re-fetched at the replan cadence
      // ------------------------------------------------------------------
      const int refreshEvery = std::max(1, settings.replanEveryMinutes * 60 / step);
      for (int i = 0; i < args.nticks; ++i) {
        if (i % refreshEvery == 0) pushPrices(engine.time());
        engine.tick();

        // Ensure all ranks stay roughly in sync
        MPI_Barrier(MPI_COMM_WORLD);
      }
      if (rank == 0) log_msg("info", "replay loop completed; shutting down.");

      for (auto& z : zones) {
        std::cout << format_report(z.controller->report()) << "\n";
        commands += z.room->commandsReceived();
      }
    }

    engine.shutdown();

    // --------------------------------------------------------------------
    // Totals to rank 0
    // --------------------------------------------------------------------
    MpiExchange::Totals local;
    for (auto& z : zones) {
      const ZoneReport r = z.controller->report();
      local.settledSavings += r.savingsTotal;
      local.openSavings    += r.savingsOpen;
      local.planCost       += r.planCost;
      local.zones          += 1.0;
      if (r.status != "optimizing" && r.status != "manual") local.degradedZones += 1.0;
    }
    local.commands = commands;

    const MpiExchange::Totals totals = MpiExchange::reduceTotals(local, 0, MPI_COMM_WORLD);
    if (rank == 0) {
      std::ostringstream oss;
      oss << std::fixed << std::setprecision(4)
          << "zones=" << totals.zones
          << " degraded=" << totals.degradedZones
          << " commands=" << totals.commands
          << " plan_cost=" << totals.planCost
          << " savings_settled=" << totals.settledSavings
          << " savings_open=" << totals.openSavings;
      log_msg("info", oss.str());
      std::cout << oss.str() << "\n";
    }

    MPI_Barrier(MPI_COMM_WORLD);
    MPI_Finalize();
    return EXIT_SUCCESS;
  }
  catch (const std::exception& e) {
    Logger::instance().setEcho(true);
    std::ostringstream oss;
    oss << "std::exception on rank " << rank << ": " << e.what();
    log_msg("fatal", oss.str());
    MPI_Abort(MPI_COMM_WORLD, 1);
    return EXIT_FAILURE;
  }
  catch (...) {
    Logger::instance().setEcho(true);
    std::ostringstream oss;
    oss << "Unknown non-std exception on rank " << rank;
    log_msg("fatal", oss.str());
    MPI_Abort(MPI_COMM_WORLD, 1);
    return EXIT_FAILURE;
  }
}
