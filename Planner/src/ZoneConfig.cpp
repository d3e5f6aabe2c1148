#include "ZoneConfig.hpp"
#include "Logger.hpp"
#include "PlanIssues.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

const char* heatingTypeName(HeatingType t) {
    switch (t) {
        case HeatingType::Unknown:  return "unknown";
        case HeatingType::Electric: return "electric";
        case HeatingType::Hydronic: return "hydronic";
        case HeatingType::Mixed:    return "mixed";
    }
    return "unknown";
}

int PlannerSettings::horizonSteps() const {
    return std::max(1, static_cast<int>(std::ceil(horizonHours * 60.0 / stepMinutes)));
}

int parse_minute_of_day(const std::string& hhmm) {
    const auto colon = hhmm.find(':');
    if (colon == std::string::npos) {
        throw std::invalid_argument("expected HH:MM, got '" + hhmm + "'");
    }
    int h = 0, m = 0;
    try {
        h = std::stoi(hhmm.substr(0, colon));
        m = std::stoi(hhmm.substr(colon + 1));
    } catch (const std::exception&) {
        throw std::invalid_argument("expected HH:MM, got '" + hhmm + "'");
    }
    if (h < 0 || h > 24 || m < 0 || m > 59 || (h == 24 && m != 0)) {
        throw std::invalid_argument("time of day out of range: '" + hhmm + "'");
    }
    return (h * 60 + m) % 1440;
}

void validate_zone(const ZoneConfig& z) {
    const std::string id = z.zoneId.empty() ? "<unnamed>" : z.zoneId;
    if (z.zoneId.empty())      throw ConfigInvalidError(id, "missing zone id");
    if (z.sensorRef.empty())   throw ConfigInvalidError(id, "missing sensor reference");
    if (z.actuatorRef.empty()) throw ConfigInvalidError(id, "missing actuator reference");
    if (!(z.ratedKw > 0.0))    throw ConfigInvalidError(id, "rated_kw must be positive");
    if (z.minDwellMinutes < 0) throw ConfigInvalidError(id, "min_dwell_min must not be negative");
    if (z.retentionDays <= 0.0) throw ConfigInvalidError(id, "retention_days must be positive");
    if (z.model.minSamples < 3) throw ConfigInvalidError(id, "min_samples must be at least 3");
    if (!(z.model.halfLifeH > 0.0)) throw ConfigInvalidError(id, "half_life_h must be positive");

    if (z.actionLevels.size() < 2) {
        throw ConfigInvalidError(id, "need at least two action levels");
    }
    std::set<double> seen;
    for (double l : z.actionLevels) {
        if (!std::isfinite(l) || l < 0.0 || l > 1.0) {
            throw ConfigInvalidError(id, "action levels must lie within [0, 1]");
        }
        if (!seen.insert(l).second) {
            throw ConfigInvalidError(id, "duplicate action level");
        }
    }

    auto checkWindow = [&](const ComfortWindow& w) {
        if (!(w.minC < w.maxC)) {
            throw ConfigInvalidError(id, "comfort window '" + w.label + "' min must be below max");
        }
        if (w.kind == ComfortWindow::Kind::Absolute && w.end <= w.start) {
            throw ConfigInvalidError(id, "comfort window '" + w.label + "' ends before it starts");
        }
    };
    checkWindow(z.defaultWindow);
    for (const auto& w : z.comfortWindows) checkWindow(w);

    if (z.initialParams) {
        const auto& p = *z.initialParams;
        if (!(p.k_per_h > 0.0) || !(p.gain_c_per_h > 0.0)) {
            throw ConfigInvalidError(id, "model_params need positive k and gain");
        }
    }
}

namespace {

// Leaves out untouched when the value does not parse.
template <typename T>
bool readValue(std::istringstream& iss, T& out) {
    T v{};
    if (!(iss >> v)) return false;
    out = v;
    return true;
}

// Applies one global line; false if it was malformed.
bool applyGlobal(PlannerSettings& s, const std::string& key, std::istringstream& iss) {
    if (key == "step_minutes")       return readValue(iss, s.stepMinutes);
    if (key == "horizon_hours")      return readValue(iss, s.horizonHours);
    if (key == "replan_every_min")   return readValue(iss, s.replanEveryMinutes);
    if (key == "drift_threshold_c")  return readValue(iss, s.driftThresholdC);
    if (key == "freeze_floor_c")     return readValue(iss, s.freezeFloorC);
    if (key == "utc_offset_min")     return readValue(iss, s.utcOffsetMin);
    if (key == "default_price")      return readValue(iss, s.defaultPrice);
    if (key == "savings_period_h")   return readValue(iss, s.savingsPeriodHours);
    if (key == "sensor_stale_min")   return readValue(iss, s.sensorStaleMinutes);
    if (key == "anomaly_jump_c")     return readValue(iss, s.anomalyJumpC);
    if (key == "refit_every_ticks")  return readValue(iss, s.refitEveryTicks);
    if (key == "bucket_c")           return readValue(iss, s.scheduler.bucketC);
    if (key == "overshoot_c")        return readValue(iss, s.scheduler.overshootTolC);
    if (key == "relax_step_c")       return readValue(iss, s.scheduler.relaxStepC);
    if (key == "relax_max_c")        return readValue(iss, s.scheduler.relaxMaxC);
    if (key == "mode") {
        std::string m;
        if (!(iss >> m)) return false;
        auto mode = parseMode(m);
        if (!mode) return false;
        s.mode = *mode;
        return true;
    }
    return false;
}

// Sanity clamps so bad deck values cannot stall the control loop.
void clampSettings(PlannerSettings& s, const std::string& src) {
    auto& log = Logger::instance();
    if (s.stepMinutes <= 0 || 1440 % s.stepMinutes != 0) {
        log.warn(src, "step_minutes must divide a day; defaulting to 60");
        s.stepMinutes = 60;
    }
    if (s.horizonHours * 60.0 < s.stepMinutes) {
        log.warn(src, "horizon_hours shorter than one step; defaulting to 24");
        s.horizonHours = 24.0;
    }
    if (s.replanEveryMinutes <= 0) {
        log.warn(src, "replan_every_min <= 0; defaulting to 60");
        s.replanEveryMinutes = 60;
    }
    if (s.driftThresholdC <= 0.0) {
        log.warn(src, "drift_threshold_c <= 0; defaulting to 1.0");
        s.driftThresholdC = 1.0;
    }
    if (s.savingsPeriodHours <= 0.0) {
        log.warn(src, "savings_period_h <= 0; defaulting to 24");
        s.savingsPeriodHours = 24.0;
    }
    if (s.refitEveryTicks <= 0) {
        log.warn(src, "refit_every_ticks <= 0; defaulting to 6");
        s.refitEveryTicks = 6;
    }
    if (s.sensorStaleMinutes <= 0) {
        log.warn(src, "sensor_stale_min <= 0; defaulting to 30");
        s.sensorStaleMinutes = 30;
    }
    if (s.anomalyJumpC <= 0.0) {
        log.warn(src, "anomaly_jump_c <= 0; defaulting to 5.0");
        s.anomalyJumpC = 5.0;
    }
}

ComfortWindow parseComfort(std::istringstream& iss, const std::string& zone) {
    std::string kind;
    if (!(iss >> kind)) throw ConfigInvalidError(zone, "comfort line without a kind");

    ComfortWindow w;
    try {
        if (kind == "default") {
            if (!(iss >> w.minC >> w.maxC)) throw ConfigInvalidError(zone, "comfort default needs min max");
            w.label = "default";
            return w;
        }
        if (kind == "daily") {
            std::string a, b;
            if (!(iss >> a >> b >> w.minC >> w.maxC)) {
                throw ConfigInvalidError(zone, "comfort daily needs HH:MM HH:MM min max");
            }
            w.kind        = ComfortWindow::Kind::Daily;
            w.startMinute = parse_minute_of_day(a);
            w.endMinute   = parse_minute_of_day(b);
        } else if (kind == "absolute") {
            if (!(iss >> w.start >> w.end >> w.minC >> w.maxC)) {
                throw ConfigInvalidError(zone, "comfort absolute needs start end min max");
            }
            w.kind = ComfortWindow::Kind::Absolute;
        } else {
            throw ConfigInvalidError(zone, "unknown comfort kind '" + kind + "'");
        }
    } catch (const std::invalid_argument& e) {
        throw ConfigInvalidError(zone, e.what());
    }

    int prio = 0;
    if (iss >> prio) w.priority = prio;
    std::string label;
    if (iss >> label) w.label = label;
    if (w.label.empty()) w.label = kind + std::to_string(w.priority);
    return w;
}

void applyZoneLine(ZoneConfig& z, const std::string& key, std::istringstream& iss) {
    const std::string& id = z.zoneId;
    auto need = [&](bool ok) {
        if (!ok) throw ConfigInvalidError(id, "malformed '" + key + "' line");
    };

    if (key == "sensor")        { need(static_cast<bool>(iss >> z.sensorRef)); return; }
    if (key == "actuator")      { need(static_cast<bool>(iss >> z.actuatorRef)); return; }
    if (key == "group")         { need(static_cast<bool>(iss >> z.group)); return; }
    if (key == "rated_kw")      { need(static_cast<bool>(iss >> z.ratedKw)); return; }
    if (key == "min_dwell_min") { need(static_cast<bool>(iss >> z.minDwellMinutes)); return; }
    if (key == "min_samples")   { need(static_cast<bool>(iss >> z.model.minSamples)); return; }
    if (key == "half_life_h")   { need(static_cast<bool>(iss >> z.model.halfLifeH)); return; }
    if (key == "default_outdoor_c") { need(static_cast<bool>(iss >> z.model.defaultOutdoorC)); return; }
    if (key == "retention_days")    { need(static_cast<bool>(iss >> z.retentionDays)); return; }
    if (key == "heating_type") {
        std::string t;
        need(static_cast<bool>(iss >> t));
        if (t == "electric")      z.heatingType = HeatingType::Electric;
        else if (t == "hydronic") z.heatingType = HeatingType::Hydronic;
        else if (t == "mixed")    z.heatingType = HeatingType::Mixed;
        else if (t == "unknown")  z.heatingType = HeatingType::Unknown;
        else throw ConfigInvalidError(id, "unknown heating_type '" + t + "'");
        return;
    }
    if (key == "levels") {
        z.actionLevels.clear();
        double l = 0.0;
        while (iss >> l) z.actionLevels.push_back(l);
        need(!z.actionLevels.empty());
        std::sort(z.actionLevels.begin(), z.actionLevels.end());
        return;
    }
    if (key == "auto_control") {
        std::string v;
        need(static_cast<bool>(iss >> v));
        if (v == "on")       z.autoControl = true;
        else if (v == "off") z.autoControl = false;
        else throw ConfigInvalidError(id, "auto_control must be on or off");
        return;
    }
    if (key == "model_params") {
        ThermalParams p;
        need(static_cast<bool>(iss >> p.k_per_h >> p.gain_c_per_h >> p.offset_c_per_h));
        z.initialParams = p;
        return;
    }
    if (key == "sim_params") {
        ThermalParams p;
        need(static_cast<bool>(iss >> p.k_per_h >> p.gain_c_per_h >> p.offset_c_per_h));
        z.simParams = p;
        return;
    }
    if (key == "sim_start_c") {
        double c = 0.0;
        need(static_cast<bool>(iss >> c));
        z.simStartC = c;
        return;
    }
    if (key == "comfort") {
        ComfortWindow w = parseComfort(iss, id);
        if (w.label == "default" && w.kind == ComfortWindow::Kind::Daily &&
            w.startMinute == 0 && w.endMinute == 0 && w.priority == 0) {
            z.defaultWindow = w;
        } else {
            z.comfortWindows.push_back(w);
        }
        return;
    }
    throw ConfigInvalidError(id, "unknown key '" + key + "'");
}

} // namespace

DeckConfig parse_zone_deck(std::istream& in, const std::string& sourceName) {
    DeckConfig deck;
    auto& log = Logger::instance();

    std::set<std::string> ids;
    std::optional<ZoneConfig> current;
    bool currentBad = false;
    std::string line;
    int lineno = 0;

    auto finishZone = [&]() {
        if (!current) return;
        if (!currentBad) {
            try {
                validate_zone(*current);
                if (!ids.insert(current->zoneId).second) {
                    throw ConfigInvalidError(current->zoneId, "duplicate zone id");
                }
                deck.zones.push_back(*current);
            } catch (const ConfigInvalidError& e) {
                deck.rejected.push_back(e.what());
                log.warn(sourceName, std::string("rejected ") + e.what());
            }
        }
        current.reset();
        currentBad = false;
    };

    while (std::getline(in, line)) {
        ++lineno;
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key)) continue;

        if (key == "zone") {
            finishZone();
            current = ZoneConfig{};
            if (!(iss >> current->zoneId)) {
                deck.rejected.push_back("line " + std::to_string(lineno) + ": zone without an id");
                log.warn(sourceName, "line " + std::to_string(lineno) + ": zone without an id");
                currentBad = true;
            }
            continue;
        }
        if (key == "end") {
            finishZone();
            continue;
        }

        if (current) {
            if (currentBad) continue;
            try {
                applyZoneLine(*current, key, iss);
            } catch (const ConfigInvalidError& e) {
                const std::string msg = std::string(e.what()) + " (line " + std::to_string(lineno) + ")";
                deck.rejected.push_back(msg);
                log.warn(sourceName, "rejected " + msg);
                currentBad = true;
            }
            continue;
        }

        if (!applyGlobal(deck.settings, key, iss)) {
            log.warn(sourceName, "line " + std::to_string(lineno) +
                                 " malformed, skipping: " + line);
        }
    }
    finishZone();

    clampSettings(deck.settings, sourceName);

    std::ostringstream oss;
    oss << "loaded " << deck.zones.size() << " zone(s), rejected " << deck.rejected.size();
    log.info(sourceName, oss.str());
    return deck;
}

DeckConfig load_zone_deck(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open zone deck " + path);
    }
    return parse_zone_deck(in, path);
}
