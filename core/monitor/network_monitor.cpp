#include "monitor/network_monitor.h"

#include "probe/ping_backend.h"
#include "scan/scanner_factory.h"
#include "vendor/vendor_lookup.h"

#include <stdexcept>

namespace netwatch {

namespace {

template <typename T>
T& required(const std::unique_ptr<T>& ptr, const char* what) {
    if (!ptr) {
        throw std::invalid_argument(std::string("missing ") + what);
    }
    return *ptr;
}

} // namespace

NetworkMonitor::NetworkMonitor(const MonitorConfig& config, Logger& logger,
                               Collaborators collaborators)
    : config_(config),
      logger_(logger),
      scanner_(std::move(collaborators.scanner)),
      vendors_(std::move(collaborators.vendor_resolver)),
      registry_(ConfigOverlay(config.device_defaults(), config.device_overrides)),
      store_(config.devices_dir),
      prober_(std::move(collaborators.probe_backend)),
      trigger_(config.discovery_trigger_file),
      pool_(static_cast<std::size_t>(config.parallel_ping_workers)),
      discovery_(registry_, required(scanner_, "scanner"),
                 required(vendors_, "vendor resolver"), trigger_, logger,
                 {config.subnet, config.discovery_interval, config.trigger_check_interval}),
      polling_(registry_, prober_, store_, pool_, logger,
               {config.polling_interval, config.heartbeat_interval}) {

    for (const auto& pattern : registry_.overlay().rejected_patterns()) {
        logger_.log_warning("config_warning", "ignoring malformed device override pattern '" +
                                                  pattern + "', defaults apply");
    }

    std::size_t recovered = recover_devices();
    if (recovered > 0) {
        logger_.log_info("recovered " + std::to_string(recovered) +
                         " device(s) from " + store_.directory().string());
    }
}

NetworkMonitor::~NetworkMonitor() {
    stop();
}

Collaborators NetworkMonitor::default_collaborators(const MonitorConfig& config) {
    Collaborators c;
    c.scanner = ScannerFactory::create(config.scanner, config.interface);
    c.probe_backend = std::make_unique<PingBackend>();
    c.vendor_resolver = std::make_unique<VendorLookup>(config.common_vendors,
                                                       config.vendor_lookup_url);
    return c;
}

std::size_t NetworkMonitor::recover_devices() {
    RecoveryResult recovered = store_.recover_all();

    for (const auto& failure : recovered.failures) {
        logger_.log_error("store_error", "cannot recover " + failure);
    }

    std::size_t restored = 0;
    for (const auto& rd : recovered.devices) {
        Device d;
        d.mac = rd.last.mac;
        d.ip = rd.last.ip;
        d.status = rd.last.status;
        d.last_transition = rd.last_transition;
        d.last_logged = rd.last.timestamp;
        if (registry_.restore(d)) {
            ++restored;
        }
    }
    return restored;
}

void NetworkMonitor::start() {
    logger_.log_info("network monitor starting on " + config_.subnet + " (" +
                     std::to_string(registry_.size()) + " known devices)");
    discovery_.start();
    polling_.start();
}

void NetworkMonitor::stop() {
    discovery_.stop();
    polling_.stop();
    pool_.stop();
}

} // namespace netwatch
