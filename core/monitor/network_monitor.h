#pragma once

#include "config/monitor_config.h"
#include "logging/logger.h"
#include "monitor/discovery_loop.h"
#include "monitor/discovery_trigger.h"
#include "monitor/polling_loop.h"
#include "monitor/worker_pool.h"
#include "probe/probe_backend.h"
#include "probe/prober.h"
#include "registry/device_registry.h"
#include "scan/scanner.h"
#include "store/device_store.h"
#include "vendor/vendor_resolver.h"

#include <cstddef>
#include <memory>

namespace netwatch {

// The out-of-process pieces the monitor talks to.
struct Collaborators {
    std::unique_ptr<IScanner> scanner;
    std::unique_ptr<IProbeBackend> probe_backend;
    std::unique_ptr<IVendorResolver> vendor_resolver;
};

// Wires the registry, store and both loops together from a MonitorConfig.
class NetworkMonitor {
public:
    // Throws std::runtime_error if the devices directory cannot be created.
    NetworkMonitor(const MonitorConfig& config, Logger& logger,
                   Collaborators collaborators);
    ~NetworkMonitor();

    // arp-scan/nmap scanner, system ping, local + HTTP vendor lookup.
    // Throws std::runtime_error if no scanner tool is installed.
    static Collaborators default_collaborators(const MonitorConfig& config);

    void start();
    void stop();

    DeviceRegistry& registry() { return registry_; }
    DeviceStore& store() { return store_; }
    DiscoveryLoop& discovery() { return discovery_; }
    PollingLoop& polling() { return polling_; }

private:
    std::size_t recover_devices();

    MonitorConfig config_;
    Logger& logger_;
    std::unique_ptr<IScanner> scanner_;
    std::unique_ptr<IVendorResolver> vendors_;
    DeviceRegistry registry_;
    DeviceStore store_;
    Prober prober_;
    DiscoveryTrigger trigger_;
    WorkerPool pool_;
    DiscoveryLoop discovery_;
    PollingLoop polling_;
};

} // namespace netwatch
