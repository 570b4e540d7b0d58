#include "registry/device_registry.h"

namespace netwatch {

DeviceRegistry::DeviceRegistry(ConfigOverlay overlay)
    : overlay_(std::move(overlay)) {}

UpsertResult DeviceRegistry::upsert(const Device& observed) {
    // Regex work happens before the lock is taken
    DeviceConfig observed_config = get_config(observed);

    std::lock_guard<std::mutex> lock(mutex_);
    UpsertResult result;

    auto it = devices_.find(observed.mac);
    if (it == devices_.end()) {
        Device d = observed;
        d.config = observed_config;
        d.status = DeviceStatus::UNKNOWN;
        if (d.first_seen == TimePoint{}) {
            d.first_seen = observed.last_seen;
        }
        devices_.emplace(d.mac, d);
        order_.push_back(d.mac);
        result.outcome = UpsertOutcome::INSERTED;
        result.device = d;
        return result;
    }

    Device& existing = it->second;
    if (!observed.ip.empty() && observed.ip != existing.ip) {
        result.outcome = UpsertOutcome::IP_CHANGED;
        result.previous_ip = existing.ip;
        existing.ip = observed.ip;
    }

    bool vendor_known = !observed.vendor.empty() && observed.vendor != "unknown";
    if (vendor_known && observed.vendor != existing.vendor) {
        existing.vendor = observed.vendor;
        existing.config = observed_config;
        if (result.outcome == UpsertOutcome::UNCHANGED) {
            result.outcome = UpsertOutcome::VENDOR_CHANGED;
        }
    }

    if (observed.last_seen > existing.last_seen) {
        existing.last_seen = observed.last_seen;
    }

    result.device = existing;
    return result;
}

bool DeviceRegistry::restore(const Device& device) {
    DeviceConfig config = get_config(device);

    std::lock_guard<std::mutex> lock(mutex_);
    if (devices_.count(device.mac) > 0) {
        return false;
    }
    Device d = device;
    d.config = config;
    devices_.emplace(d.mac, d);
    order_.push_back(d.mac);
    return true;
}

std::vector<Device> DeviceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Device> copy;
    copy.reserve(order_.size());
    for (const auto& mac : order_) {
        copy.push_back(devices_.at(mac));
    }
    return copy;
}

std::optional<Device> DeviceRegistry::find(const std::string& mac) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(mac);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

DeviceConfig DeviceRegistry::get_config(const Device& device) const {
    // The overlay is immutable after construction
    return overlay_.resolve(device.vendor);
}

std::optional<StatusUpdate> DeviceRegistry::apply_status(const std::string& mac,
                                                         DeviceStatus status,
                                                         TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(mac);
    if (it == devices_.end()) {
        return std::nullopt;
    }

    Device& d = it->second;
    StatusUpdate update;

    if (d.status != status) {
        StateTransition t;
        t.mac = d.mac;
        t.ip = d.ip;
        t.vendor = d.vendor;
        t.from = d.status;
        t.to = status;
        t.timestamp = now;
        if (d.last_transition != TimePoint{}) {
            t.seconds_since_last = seconds_between(d.last_transition, now);
        }

        d.status = status;
        d.last_transition = now;
        update.transition = t;
    }

    update.device = d;
    return update;
}

void DeviceRegistry::mark_polled(const std::string& mac, TimePoint when) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(mac);
    if (it != devices_.end()) {
        it->second.last_poll = when;
    }
}

void DeviceRegistry::mark_logged(const std::string& mac, TimePoint when) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(mac);
    if (it != devices_.end()) {
        it->second.last_logged = when;
    }
}

} // namespace netwatch
