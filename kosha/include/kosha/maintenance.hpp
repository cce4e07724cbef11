#pragma once
// Maintenance: the engine's background heartbeat
//
// Each tick checkpoints when the WAL is due and compacts when tombstones
// pass the configured ratio. Runs on its own thread next to the daemon's
// poll loop and workers.

#include "engine.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace kosha {

enum class MaintenanceEvent {
    Started,
    Stopped,
    Checkpointed,
    Compacted,
    Failed,
};

using MaintenanceCallback = std::function<void(MaintenanceEvent, const std::string&)>;

class Maintenance {
public:
    Maintenance(Engine& engine, std::chrono::milliseconds tick)
        : engine_(engine), tick_(tick) {}

    ~Maintenance() { stop(); }

    Maintenance(const Maintenance&) = delete;
    Maintenance& operator=(const Maintenance&) = delete;

    void on_event(MaintenanceCallback callback) { callback_ = std::move(callback); }

    void start() {
        if (running_.exchange(true)) return;
        thread_ = std::thread([this]() { run_loop(); });
        emit(MaintenanceEvent::Started, "maintenance started");
    }

    void stop() {
        if (!running_.exchange(false)) return;
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
        emit(MaintenanceEvent::Stopped, "maintenance stopped");
    }

    bool is_running() const { return running_; }

    struct Stats {
        size_t ticks = 0;
        size_t checkpoints = 0;
        size_t compactions = 0;
        size_t failures = 0;
    };

    Stats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    // One pass, also used directly by tests
    void tick() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.ticks++;
        }

        if (engine_.checkpoint_due()) {
            auto report = engine_.checkpoint();
            if (report) {
                count(&Stats::checkpoints);
                emit(MaintenanceEvent::Checkpointed,
                     "checkpoint at seq " + std::to_string(report.value().sequence));
            } else {
                count(&Stats::failures);
                emit(MaintenanceEvent::Failed, "checkpoint: " + report.error().describe());
            }
        }

        auto compacted = engine_.compact_if_needed();
        if (!compacted) {
            count(&Stats::failures);
            emit(MaintenanceEvent::Failed, "compaction: " + compacted.error().describe());
        } else if (compacted.value()) {
            count(&Stats::compactions);
            emit(MaintenanceEvent::Compacted,
                 "compacted to generation " + std::to_string(engine_.index().generation()));
        }
    }

private:
    void run_loop() {
        while (running_) {
            tick();

            // Sleep until the next tick, waking early on stop
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, tick_, [this] { return !running_; });
        }
    }

    void count(size_t Stats::*field) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.*field += 1;
    }

    void emit(MaintenanceEvent event, const std::string& msg) {
        if (callback_) {
            callback_(event, msg);
        } else if (event == MaintenanceEvent::Failed) {
            std::cerr << "[maintenance] " << msg << "\n";
        }
    }

    Engine& engine_;
    std::chrono::milliseconds tick_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    MaintenanceCallback callback_;
    Stats stats_;
};

} // namespace kosha
