#pragma once
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>
#include "Subsystem.hpp"
#include "TickContext.hpp"

// One worker thread per zone; runTick() releases all workers on the same
// context and returns once every zone finished its tick. An exception thrown
// by a zone is rethrown from runTick().
class ZoneTickEngine {
public:
    ZoneTickEngine() = default;
    ~ZoneTickEngine();

    void addSubsystem(Subsystem* s);
    void start();
    void stop();
    void runTick(const TickContext& ctx);

    bool running() const { return running_; }
    std::size_t size() const { return subsystems_.size(); }

private:
    std::vector<Subsystem*> subsystems_;
    std::vector<std::thread> threads_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable done_cv_;
    std::atomic<bool> running_{false};

    TickContext currentCtx_;
    long generation_ = 0;
    std::size_t doneCount_ = 0;
    std::exception_ptr error_;
};
