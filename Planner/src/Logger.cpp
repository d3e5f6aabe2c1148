// Planner/src/Logger.cpp
#include "Logger.hpp"

#include <iostream>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <system_error>
#include <mutex>
#include <string>
#include <vector>
#include <stdexcept>

namespace {
namespace fs = std::filesystem;

// Resolve the base directory for logs.
//
// Priority:
//   1) env HEATPLAN_LOG_DIR
//   2) <PROJECT_SOURCE_DIR>/data/raw
//   3) ./data/raw
//
// If env RUN_ID is set, it is appended so each run gets its own folder,
// e.g. data/raw/winter_week/living.Controller.csv
fs::path resolve_base_dir() {
    fs::path base;
    if (const char* env = std::getenv("HEATPLAN_LOG_DIR"); env && *env) {
        base = fs::path(env);
    } else {
#ifdef PROJECT_SOURCE_DIR
        base = fs::path(PROJECT_SOURCE_DIR) / "data" / "raw";
#else
        base = fs::current_path() / "data" / "raw";
#endif
    }

    if (const char* run = std::getenv("RUN_ID")) {
        if (*run) base /= run;
    }
    return base;
}

fs::path ensure_dir(const std::string& dir) {
    fs::path p(dir);
    std::error_code ec;
    fs::create_directories(p, ec);
    if (ec) {
        throw std::runtime_error(
            "Logger: failed to create log directory " + p.string() +
            " : " + ec.message()
        );
    }
    return p;
}

} // anonymous namespace

// ---------------- Logger public API ----------------

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (events_.is_open()) events_.close();
    for (auto& kv : per_stream_) {
        if (kv.second.is_open()) kv.second.close();
    }
}

void Logger::setEcho(bool echo) {
    std::lock_guard<std::mutex> lock(mtx_);
    echo_ = echo;
}

std::string Logger::baseDir() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (base_dir_.empty()) base_dir_ = resolve_base_dir().string();
    return base_dir_;
}

// Get or open the CSV for a stream, writing the header the first time.
// Header: tick,time_s,<columns...>
std::ofstream& Logger::streamFor_(const std::string& stream,
                                  const std::vector<std::string>& columns) {
    auto it = per_stream_.find(stream);
    if (it != per_stream_.end()) {
        return it->second;
    }

    if (base_dir_.empty()) base_dir_ = resolve_base_dir().string();
    fs::path csv_path = ensure_dir(base_dir_) / (stream + ".csv");

    std::ofstream out(csv_path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error(
            "Logger: failed to open log file " + csv_path.string()
        );
    }

    out << "tick,time_s";
    for (const auto& c : columns) out << ',' << c;
    out << '\n';
    out.flush();

    auto [new_it, _] = per_stream_.emplace(stream, std::move(out));
    return new_it->second;
}

void Logger::log_wide(const std::string& stream,
                      int tick, long long time,
                      const std::vector<std::string>& cols,
                      const std::vector<double>& vals) {
    std::lock_guard<std::mutex> lock(mtx_);

    std::ofstream& out = streamFor_(stream, cols);

    out << tick << ',' << time;
    for (std::size_t i = 0; i < cols.size(); ++i) {
        double v = (i < vals.size() ? vals[i] : 0.0);
        out << ',' << v;
    }
    out << '\n';
    out.flush();
}

void Logger::event(const std::string& level,
                   const std::string& source,
                   const std::string& message) {
    std::lock_guard<std::mutex> lock(mtx_);

    const std::string line = "[" + level + "] " + source + ": " + message + "\n";
    if (echo_) std::cerr << line;

    if (!events_.is_open()) {
        if (base_dir_.empty()) base_dir_ = resolve_base_dir().string();
        fs::path path = ensure_dir(base_dir_) / "events.log";
        events_.open(path, std::ios::out | std::ios::app);
        if (!events_) {
            // Event log is best effort; CSV streams still report open failures.
            if (echo_) std::cerr << "[warn] Logger: cannot open " << path.string() << "\n";
            return;
        }
    }
    events_ << line;
    events_.flush();
}
