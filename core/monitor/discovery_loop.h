#pragma once

#include "logging/logger.h"
#include "monitor/discovery_trigger.h"
#include "registry/device_registry.h"
#include "scan/scanner.h"
#include "vendor/vendor_resolver.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace netwatch {

struct DiscoverySettings {
    std::string subnet;
    std::chrono::seconds interval{300};
    std::chrono::seconds trigger_check_interval{5};
};

struct DiscoveryReport {
    bool scan_failed = false;
    std::size_t hosts = 0;
    std::size_t inserted = 0;
    std::size_t ip_changed = 0;
    std::size_t unchanged = 0;
};

// Periodic subnet sweep merged into the registry. Never changes device
// status and never removes devices that a sweep missed.
class DiscoveryLoop {
public:
    DiscoveryLoop(DeviceRegistry& registry, IScanner& scanner,
                  IVendorResolver& vendors, DiscoveryTrigger& trigger,
                  Logger& logger, DiscoverySettings settings);
    ~DiscoveryLoop();

    DiscoveryLoop(const DiscoveryLoop&) = delete;
    DiscoveryLoop& operator=(const DiscoveryLoop&) = delete;

    // One sweep. Scanner failures are logged and reported, not thrown.
    DiscoveryReport run_once();

    void start();
    void stop();
    bool running() const { return running_; }

private:
    enum class Wake { PERIODIC, TRIGGER, STOP };

    void thread_main();
    Wake wait_for_next_run();
    std::string resolve_vendor(const std::string& mac);

    DeviceRegistry& registry_;
    IScanner& scanner_;
    IVendorResolver& vendors_;
    DiscoveryTrigger& trigger_;
    Logger& logger_;
    DiscoverySettings settings_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
};

} // namespace netwatch
