#include "ZoneTickEngine.hpp"

ZoneTickEngine::~ZoneTickEngine() {
    stop();
}

void ZoneTickEngine::addSubsystem(Subsystem* s) {
    subsystems_.push_back(s);
    // Worker threads are spawned in start()
}

void ZoneTickEngine::start() {
    if (running_) return;
    running_ = true;
    // Workers start from the generation current before any of them runs, so
    // a runTick() issued right after start() is never missed.
    long startGen = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        startGen = generation_;
    }
    for (auto* s : subsystems_) {
        threads_.emplace_back([this, s, startGen]() {
            long seen = startGen;
            while (true) {
                std::unique_lock<std::mutex> lock(mtx_);
                cv_.wait(lock, [&]() {
                    return !running_ || generation_ > seen;
                });
                if (!running_) break;

                seen = generation_;
                const TickContext ctx = currentCtx_;
                lock.unlock();

                std::exception_ptr err;
                try {
                    s->tick(ctx);
                } catch (...) {
                    err = std::current_exception();
                }

                lock.lock();
                if (err && !error_) error_ = err;
                ++doneCount_;
                lock.unlock();
                done_cv_.notify_one();
            }
        });
    }
}

void ZoneTickEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void ZoneTickEngine::runTick(const TickContext& ctx) {
    std::unique_lock<std::mutex> lock(mtx_);
    currentCtx_ = ctx;
    doneCount_  = 0;
    error_      = nullptr;
    ++generation_;
    lock.unlock();
    cv_.notify_all();

    lock.lock();
    done_cv_.wait(lock, [&]() { return doneCount_ >= subsystems_.size(); });
    std::exception_ptr err = error_;
    error_ = nullptr;
    lock.unlock();

    if (err) std::rethrow_exception(err);
}
