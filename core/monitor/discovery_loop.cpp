#include "monitor/discovery_loop.h"

#include <algorithm>
#include <exception>

namespace netwatch {

DiscoveryLoop::DiscoveryLoop(DeviceRegistry& registry, IScanner& scanner,
                             IVendorResolver& vendors, DiscoveryTrigger& trigger,
                             Logger& logger, DiscoverySettings settings)
    : registry_(registry), scanner_(scanner), vendors_(vendors),
      trigger_(trigger), logger_(logger), settings_(std::move(settings)) {}

DiscoveryLoop::~DiscoveryLoop() {
    stop();
}

DiscoveryReport DiscoveryLoop::run_once() {
    DiscoveryReport report;

    std::vector<DiscoveredHost> hosts;
    try {
        hosts = scanner_.scan(settings_.subnet);
    } catch (const std::exception& e) {
        logger_.log_error("scan_error", scanner_.name() + ": " + e.what());
        report.scan_failed = true;
        return report;
    }

    if (hosts.empty()) {
        logger_.log_warning("scan_empty", scanner_.name() + " found no hosts on " +
                                              settings_.subnet);
    }

    auto now = Clock::now();
    for (const auto& host : hosts) {
        Device observed;
        observed.mac = host.mac;
        observed.ip = host.ip;
        observed.first_seen = now;
        observed.last_seen = now;

        // Vendor lookups can hit the network, so only for unlabelled devices
        auto known = registry_.find(host.mac);
        if (known && known->vendor != "unknown") {
            observed.vendor = known->vendor;
        } else {
            observed.vendor = resolve_vendor(host.mac);
        }

        auto result = registry_.upsert(observed);
        switch (result.outcome) {
            case UpsertOutcome::INSERTED:
                ++report.inserted;
                logger_.log_discovered(result.device);
                break;
            case UpsertOutcome::IP_CHANGED:
                ++report.ip_changed;
                logger_.log_ip_changed(result.device, result.previous_ip);
                break;
            case UpsertOutcome::VENDOR_CHANGED:
            case UpsertOutcome::UNCHANGED:
                ++report.unchanged;
                break;
        }
    }

    report.hosts = hosts.size();
    logger_.log_scan(scanner_.name(), report.hosts, report.inserted);
    return report;
}

std::string DiscoveryLoop::resolve_vendor(const std::string& mac) {
    try {
        std::string vendor = vendors_.resolve(mac);
        return vendor.empty() ? "unknown" : vendor;
    } catch (const std::exception& e) {
        logger_.log_warning("vendor_error", e.what(), mac);
        return "unknown";
    }
}

void DiscoveryLoop::start() {
    if (running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    running_ = true;
    thread_ = std::thread(&DiscoveryLoop::thread_main, this);
}

void DiscoveryLoop::stop() {
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

void DiscoveryLoop::thread_main() {
    logger_.log_info("discovery loop started (interval " +
                     std::to_string(settings_.interval.count()) + "s)");

    // A sentinel left over from before startup is serviced by the first sweep
    bool triggered = trigger_.pending();

    while (true) {
        try {
            run_once();
        } catch (const std::exception& e) {
            logger_.log_error("discovery_error", e.what());
        }

        if (triggered && !trigger_.clear()) {
            logger_.log_warning("trigger_error", "cannot remove " +
                                                     trigger_.path().string());
        }

        Wake wake = wait_for_next_run();
        if (wake == Wake::STOP) {
            break;
        }
        triggered = wake == Wake::TRIGGER;
        if (triggered) {
            logger_.log_info("discovery requested by " + trigger_.path().string());
        }
    }

    logger_.log_info("discovery loop stopped");
}

DiscoveryLoop::Wake DiscoveryLoop::wait_for_next_run() {
    auto deadline = std::chrono::steady_clock::now() + settings_.interval;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (trigger_.pending()) {
            return Wake::TRIGGER;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return Wake::PERIODIC;
        }
        auto next_check = std::min<std::chrono::steady_clock::time_point>(
            deadline, now + settings_.trigger_check_interval);
        cv_.wait_until(lock, next_check, [this] { return stop_requested_; });
    }
    return Wake::STOP;
}

} // namespace netwatch
