#pragma once

#include "registry/config_overlay.h"
#include "registry/device.h"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace netwatch {

enum class UpsertOutcome {
    INSERTED,
    IP_CHANGED,
    VENDOR_CHANGED,
    UNCHANGED
};

struct UpsertResult {
    UpsertOutcome outcome = UpsertOutcome::UNCHANGED;
    std::string previous_ip;
    Device device;  // state after the merge
};

struct StatusUpdate {
    std::optional<StateTransition> transition;
    Device device;  // state after the update
};

// Shared device map for the discovery and polling loops. Every public call
// takes the registry mutex once and never does I/O while holding it.
class DeviceRegistry {
public:
    explicit DeviceRegistry(ConfigOverlay overlay = ConfigOverlay());

    // Inserts a device or merges ip/vendor/last_seen into the existing one.
    // Status and transition timestamps of an existing device are kept.
    UpsertResult upsert(const Device& observed);

    // Seeds a device recovered from persisted logs. No-op if already known.
    bool restore(const Device& device);

    std::vector<Device> snapshot() const;
    std::optional<Device> find(const std::string& mac) const;
    std::size_t size() const;

    DeviceConfig get_config(const Device& device) const;
    const ConfigOverlay& overlay() const { return overlay_; }

    // Applies a probe result. Returns the transition if the status changed.
    std::optional<StatusUpdate> apply_status(const std::string& mac,
                                             DeviceStatus status,
                                             TimePoint now);

    void mark_polled(const std::string& mac, TimePoint when);
    void mark_logged(const std::string& mac, TimePoint when);

private:
    ConfigOverlay overlay_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Device> devices_;
    std::vector<std::string> order_;  // insertion order for snapshots
};

} // namespace netwatch
