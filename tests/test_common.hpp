#pragma once
#include <cstdlib>
#include <filesystem>
#include <string>
#include "Logger.hpp"
#include "PlanIssues.hpp"

// 2023-11-14 00:00 UTC; day aligned so savings periods line up with it.
constexpr Timestamp T0 = 1699920000;
constexpr int HOUR = 3600;

// Keep test CSVs out of the source tree and the console quiet.
inline void setup_test_logging(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "heatplan_tests" / name;
    setenv("HEATPLAN_LOG_DIR", dir.string().c_str(), 0);
    Logger::instance().setEcho(false);
}

inline std::string scratch_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "heatplan_scratch" / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir.string();
}
