#pragma once

#include "logging/logger.h"
#include "monitor/worker_pool.h"
#include "probe/prober.h"
#include "registry/device_registry.h"
#include "schedule/stagger_planner.h"
#include "store/device_store.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace netwatch {

struct PollingSettings {
    std::chrono::seconds interval{3};
    std::chrono::seconds heartbeat_interval{0};  // 0 = transitions only
};

struct CycleReport {
    std::size_t due = 0;
    std::size_t probed = 0;
    std::size_t online = 0;
    std::size_t offline = 0;
    std::size_t transitions = 0;
    std::size_t heartbeats = 0;
    std::size_t probe_failures = 0;
    std::size_t store_failures = 0;
};

// Probes every due device once per cycle, staggered across the polling
// interval and run on the worker pool. A cycle waits for all of its probes,
// so two probes of the same device never overlap.
class PollingLoop {
public:
    // Blocks until the deadline. Returns false if the loop is stopping.
    using Sleeper = std::function<bool(std::chrono::steady_clock::time_point)>;

    PollingLoop(DeviceRegistry& registry, Prober& prober, DeviceStore& store,
                WorkerPool& pool, Logger& logger, PollingSettings settings);
    ~PollingLoop();

    PollingLoop(const PollingLoop&) = delete;
    PollingLoop& operator=(const PollingLoop&) = delete;

    // Non-disabled devices whose own polling interval has elapsed.
    std::vector<ScheduledProbe> due_devices(TimePoint now) const;

    CycleReport run_cycle(TimePoint now);

    // Replaces the stagger wait used inside run_cycle.
    void set_sleeper(Sleeper sleeper);

    void start();
    void stop();
    bool running() const { return running_; }

private:
    struct TaskResult {
        bool probed = false;
        bool online = false;
        bool transitioned = false;
        bool heartbeat = false;
        bool probe_failed = false;
        bool store_failed = false;
    };

    void thread_main();
    bool sleep_until(std::chrono::steady_clock::time_point deadline);
    TaskResult probe_device(const ScheduledProbe& probe);
    bool heartbeat_due(const Device& device, TimePoint now) const;
    bool persist(const Device& device, DeviceStatus status, TimePoint when,
                 double seconds_since_transition);

    DeviceRegistry& registry_;
    Prober& prober_;
    DeviceStore& store_;
    WorkerPool& pool_;
    Logger& logger_;
    PollingSettings settings_;
    StaggerPlanner planner_;
    Sleeper sleeper_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
};

} // namespace netwatch
