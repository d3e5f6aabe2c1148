#pragma once
#include <mutex>
#include <map>
#include <string>
#include <fstream>
#include <vector>

class Logger {
public:
    static Logger& instance();
    ~Logger();

    // Wide format: one row per call, header written on first use of a stream.
    // The stream name is usually "<zone>.<component>", e.g. "living.Controller".
    void log_wide(const std::string& stream,
                  int tick, long long time,
                  const std::vector<std::string>& columns,
                  const std::vector<double>& values);

    // Tagged event line: "[level] source: message".
    // Appended to events.log next to the CSVs and mirrored to stderr.
    void event(const std::string& level,
               const std::string& source,
               const std::string& message);

    void info(const std::string& source, const std::string& message)  { event("info", source, message); }
    void warn(const std::string& source, const std::string& message)  { event("warn", source, message); }

    // Silence the stderr mirror (tests, or non-leader MPI ranks).
    void setEcho(bool echo);

    // Directory the CSVs go to; resolved once from the environment.
    std::string baseDir();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream& streamFor_(const std::string& stream,
                              const std::vector<std::string>& columns);

    std::mutex mtx_;
    bool echo_ = true;
    std::string base_dir_;
    std::ofstream events_;
    std::map<std::string, std::ofstream> per_stream_;
};
