#include "monitor/polling_loop.h"

#include <exception>
#include <future>

namespace netwatch {

namespace {

// Cycle wakeups run on the steady clock while last_poll is wall time, so an
// interval can measure a hair short of itself.
constexpr std::chrono::milliseconds kDueSlack{250};

} // namespace

PollingLoop::PollingLoop(DeviceRegistry& registry, Prober& prober,
                         DeviceStore& store, WorkerPool& pool, Logger& logger,
                         PollingSettings settings)
    : registry_(registry), prober_(prober), store_(store), pool_(pool),
      logger_(logger), settings_(settings),
      planner_(std::chrono::duration_cast<std::chrono::milliseconds>(settings.interval)) {
    sleeper_ = [this](std::chrono::steady_clock::time_point deadline) {
        return sleep_until(deadline);
    };
}

PollingLoop::~PollingLoop() {
    stop();
}

void PollingLoop::set_sleeper(Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
}

std::vector<ScheduledProbe> PollingLoop::due_devices(TimePoint now) const {
    std::vector<ScheduledProbe> due;

    for (const auto& device : registry_.snapshot()) {
        const DeviceConfig& config = device.config;
        if (config.disabled || device.ip.empty()) {
            continue;
        }
        if (device.last_poll != TimePoint{} &&
            now - device.last_poll + kDueSlack < config.polling_interval) {
            continue;
        }
        due.push_back({device, config, std::chrono::milliseconds(0)});
    }

    return due;
}

CycleReport PollingLoop::run_cycle(TimePoint now) {
    auto cycle_start = std::chrono::steady_clock::now();
    auto planned = planner_.plan(due_devices(now));

    CycleReport report;
    report.due = planned.size();

    std::vector<TaskResult> results(planned.size());
    std::vector<std::future<void>> pending;
    pending.reserve(planned.size());

    for (std::size_t k = 0; k < planned.size(); ++k) {
        if (!sleeper_(cycle_start + planned[k].offset)) {
            break;
        }

        // Stamped with the cycle time so a device with the global interval
        // is due again on the very next cycle
        registry_.mark_polled(planned[k].device.mac, now);

        try {
            pending.push_back(pool_.submit([this, &planned, &results, k] {
                results[k] = probe_device(planned[k]);
            }));
        } catch (const std::exception& e) {
            logger_.log_error("poll_error", e.what(), planned[k].device.mac);
            break;
        }
    }

    // Every task references planned/results, so all must finish here
    for (auto& f : pending) {
        try {
            f.get();
        } catch (const std::exception& e) {
            logger_.log_error("poll_error", e.what());
        }
    }

    for (const auto& r : results) {
        if (r.probed) {
            ++report.probed;
            ++(r.online ? report.online : report.offline);
        }
        if (r.transitioned) ++report.transitions;
        if (r.heartbeat) ++report.heartbeats;
        if (r.probe_failed) ++report.probe_failures;
        if (r.store_failed) ++report.store_failures;
    }

    return report;
}

PollingLoop::TaskResult PollingLoop::probe_device(const ScheduledProbe& probe) {
    TaskResult r;
    const Device& device = probe.device;

    try {
        ProbeResult result = prober_.check(device.ip, probe.config.ping_count,
                                           probe.config.ping_timeout);
        r.probed = true;
        r.online = result.online;

        DeviceStatus status = result.online ? DeviceStatus::ONLINE : DeviceStatus::OFFLINE;
        TimePoint observed_at = Clock::now();

        auto update = registry_.apply_status(device.mac, status, observed_at);
        if (!update) {
            return r;
        }

        if (update->transition) {
            r.transitioned = true;
            logger_.log_transition(*update->transition);
            r.store_failed = !persist(update->device, status, observed_at,
                                      update->transition->seconds_since_last);
        } else if (heartbeat_due(update->device, observed_at)) {
            double since = 0.0;
            if (update->device.last_transition != TimePoint{}) {
                since = seconds_between(update->device.last_transition, observed_at);
            }
            r.heartbeat = true;
            logger_.log_heartbeat(update->device, since);
            r.store_failed = !persist(update->device, status, observed_at, since);
        }
    } catch (const std::exception& e) {
        r.probe_failed = true;
        logger_.log_error("probe_error", e.what(), device.mac);
    }

    return r;
}

bool PollingLoop::heartbeat_due(const Device& device, TimePoint now) const {
    if (settings_.heartbeat_interval.count() <= 0) {
        return false;
    }
    return device.last_logged == TimePoint{} ||
           now - device.last_logged >= settings_.heartbeat_interval;
}

bool PollingLoop::persist(const Device& device, DeviceStatus status,
                          TimePoint when, double seconds_since_transition) {
    try {
        store_.record(device, status, when, seconds_since_transition);
        registry_.mark_logged(device.mac, when);
        return true;
    } catch (const StoreError& e) {
        // The registry already holds the new status
        logger_.log_error("store_error", e.what(), e.mac());
        return false;
    }
}

void PollingLoop::start() {
    if (running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    running_ = true;
    thread_ = std::thread(&PollingLoop::thread_main, this);
}

void PollingLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

bool PollingLoop::sleep_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this] { return stop_requested_; });
    return !stop_requested_;
}

void PollingLoop::thread_main() {
    logger_.log_info("polling loop started (interval " +
                     std::to_string(settings_.interval.count()) + "s)");

    while (true) {
        auto cycle_start = std::chrono::steady_clock::now();
        try {
            CycleReport report = run_cycle(Clock::now());
            if (report.due > 0) {
                logger_.log_debug("poll cycle: " + std::to_string(report.probed) +
                                  " probed, " + std::to_string(report.online) +
                                  " online, " + std::to_string(report.transitions) +
                                  " transitions");
            }
        } catch (const std::exception& e) {
            logger_.log_error("poll_error", e.what());
        }

        if (!sleep_until(cycle_start + settings_.interval)) {
            break;
        }
    }

    logger_.log_info("polling loop stopped");
}

} // namespace netwatch
