#include "ZoneStore.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::ofstream openForWrite(const std::string& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("ZoneStore: cannot open " + path + " for writing");
    }
    out << std::setprecision(10);
    return out;
}

void finish(std::ofstream& out, const std::string& path) {
    out.flush();
    if (!out) {
        throw std::runtime_error("ZoneStore: write to " + path + " failed");
    }
}

std::vector<std::string> splitCsv(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) cells.push_back(cell);
    if (!line.empty() && line.back() == ',') cells.emplace_back();
    return cells;
}

} // namespace

ZoneStore::ZoneStore(std::string root) : root_(std::move(root)) {
    if (root_.empty()) {
        throw std::invalid_argument("ZoneStore: empty state directory");
    }
}

std::string ZoneStore::zoneDir(const std::string& zoneId) const {
    return (fs::path(root_) / zoneId).string();
}

std::string ZoneStore::ensureZoneDir_(const std::string& zoneId) {
    const std::string dir = zoneDir(zoneId);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("ZoneStore: cannot create " + dir + ": " + ec.message());
    }
    return dir;
}

// ---------------------------------------------------------------------------
// history.csv
// ---------------------------------------------------------------------------
void ZoneStore::saveHistory(const std::string& zoneId, const ThermalHistory& history) {
    const std::string path = ensureZoneDir_(zoneId) + "/history.csv";
    auto out = openForWrite(path);
    out << "time,temp_c,level,outdoor_c\n";
    for (const auto& s : history.entries()) {
        out << s.time << ',' << s.tempC << ',' << s.level << ',';
        if (s.outdoorC) out << *s.outdoorC;
        out << '\n';
    }
    finish(out, path);
}

ThermalHistory ZoneStore::loadHistory(const std::string& zoneId, double retentionDays) const {
    ThermalHistory history(retentionDays);
    const std::string path = zoneDir(zoneId) + "/history.csv";
    std::ifstream in(path);
    if (!in) return history;

    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (lineno == 1 || line.empty()) continue;
        const auto cells = splitCsv(line);
        try {
            if (cells.size() < 3) throw std::invalid_argument("short row");
            ThermalState s;
            s.time  = std::stoll(cells[0]);
            s.tempC = std::stod(cells[1]);
            s.level = std::stod(cells[2]);
            if (cells.size() > 3 && !cells[3].empty()) s.outdoorC = std::stod(cells[3]);
            history.append(s);
        } catch (const std::exception&) {
            Logger::instance().warn(zoneId + ".Store",
                path + " line " + std::to_string(lineno) + " malformed, skipping");
        }
    }
    return history;
}

// ---------------------------------------------------------------------------
// savings.csv
// ---------------------------------------------------------------------------
void ZoneStore::saveSavings(const std::string& zoneId, const std::vector<SavingsRecord>& ledger) {
    const std::string path = ensureZoneDir_(zoneId) + "/savings.csv";
    auto out = openForWrite(path);
    out << "period_start,period_end,realized_cost,baseline_cost,delta,"
           "realized_kwh,baseline_kwh,correction_of,degraded\n";
    for (const auto& r : ledger) {
        out << r.periodStart << ',' << r.periodEnd << ','
            << r.realizedCost << ',' << r.baselineCost << ',' << r.delta << ','
            << r.realizedKwh << ',' << r.baselineKwh << ','
            << r.correctionOf << ',' << (r.degraded ? 1 : 0) << '\n';
    }
    finish(out, path);
}

std::vector<SavingsRecord> ZoneStore::loadSavings(const std::string& zoneId) const {
    std::vector<SavingsRecord> ledger;
    const std::string path = zoneDir(zoneId) + "/savings.csv";
    std::ifstream in(path);
    if (!in) return ledger;

    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (lineno == 1 || line.empty()) continue;
        const auto c = splitCsv(line);
        try {
            if (c.size() < 9) throw std::invalid_argument("short row");
            SavingsRecord r;
            r.periodStart  = std::stoll(c[0]);
            r.periodEnd    = std::stoll(c[1]);
            r.realizedCost = std::stod(c[2]);
            r.baselineCost = std::stod(c[3]);
            r.delta        = std::stod(c[4]);
            r.realizedKwh  = std::stod(c[5]);
            r.baselineKwh  = std::stod(c[6]);
            r.correctionOf = std::stoi(c[7]);
            r.degraded     = std::stoi(c[8]) != 0;
            ledger.push_back(r);
        } catch (const std::exception&) {
            Logger::instance().warn(zoneId + ".Store",
                path + " line " + std::to_string(lineno) + " malformed, skipping");
        }
    }
    return ledger;
}

// ---------------------------------------------------------------------------
// model.txt
// ---------------------------------------------------------------------------
void ZoneStore::saveModel(const std::string& zoneId, const ThermalModel& model) {
    const std::string path = ensureZoneDir_(zoneId) + "/model.txt";
    auto out = openForWrite(path);
    const auto& p = model.params();
    out << "k_per_h "        << p.k_per_h        << '\n'
        << "gain_c_per_h "   << p.gain_c_per_h   << '\n'
        << "offset_c_per_h " << p.offset_c_per_h << '\n'
        << "using_defaults " << (model.usingDefaults() ? 1 : 0) << '\n'
        << "low_confidence " << (model.lowConfidence() ? 1 : 0) << '\n'
        << "accuracy_c "     << model.accuracyC()     << '\n'
        << "observations "   << model.observations()  << '\n';
    finish(out, path);
}

bool ZoneStore::loadModel(const std::string& zoneId, ThermalModel& model) const {
    const std::string path = zoneDir(zoneId) + "/model.txt";
    std::ifstream in(path);
    if (!in) return false;

    std::map<std::string, double> kv;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        std::istringstream iss(line);
        std::string key;
        double v = 0.0;
        if (!(iss >> key)) continue;
        if (!(iss >> v)) {
            Logger::instance().warn(zoneId + ".Store",
                path + " line " + std::to_string(lineno) + " malformed, skipping");
            continue;
        }
        kv[key] = v;
    }

    if (!kv.count("k_per_h") || !kv.count("gain_c_per_h")) {
        Logger::instance().warn(zoneId + ".Store", path + " incomplete; model not restored");
        return false;
    }

    ThermalParams p;
    p.k_per_h        = kv["k_per_h"];
    p.gain_c_per_h   = kv["gain_c_per_h"];
    p.offset_c_per_h = kv.count("offset_c_per_h") ? kv["offset_c_per_h"] : 0.0;
    model.restore(p,
                  kv.count("using_defaults") ? kv["using_defaults"] != 0.0 : false,
                  kv.count("low_confidence") ? kv["low_confidence"] != 0.0 : false,
                  kv.count("accuracy_c") ? kv["accuracy_c"] : 0.0,
                  kv.count("observations") ? static_cast<int>(kv["observations"]) : 0);
    return true;
}

// ---------------------------------------------------------------------------
// plan.csv
// ---------------------------------------------------------------------------
void ZoneStore::savePlan(const std::string& zoneId, const ActionPlan& plan) {
    const std::string path = ensureZoneDir_(zoneId) + "/plan.csv";
    auto out = openForWrite(path);
    out << "time,level,energy_kwh,price,predicted_c,min_c,max_c,relaxed_c,window\n";
    for (const auto& a : plan.actions()) {
        out << a.time << ',' << a.level << ',' << a.energyKwh << ',' << a.price << ','
            << a.predictedC << ',' << a.minC << ',' << a.maxC << ','
            << a.relaxedC << ',' << a.window << '\n';
    }
    for (const auto& line : plan.describe()) {
        out << "# " << line << '\n';
    }
    finish(out, path);
}
