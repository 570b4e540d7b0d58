#pragma once

#include "util/time_format.h"

#include <chrono>
#include <string>

namespace netwatch {

enum class DeviceStatus {
    UNKNOWN,
    ONLINE,
    OFFLINE
};

inline const char* to_string(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::UNKNOWN: return "unknown";
        case DeviceStatus::ONLINE:  return "online";
        case DeviceStatus::OFFLINE: return "offline";
    }
    return "unknown";
}

inline bool parse_status(const std::string& s, DeviceStatus& out) {
    if (s == "online")  { out = DeviceStatus::ONLINE;  return true; }
    if (s == "offline") { out = DeviceStatus::OFFLINE; return true; }
    if (s == "unknown") { out = DeviceStatus::UNKNOWN; return true; }
    return false;
}

struct DeviceConfig {
    int ping_count = 1;
    std::chrono::seconds ping_timeout{2};
    std::chrono::seconds polling_interval{3};
    bool disabled = false;
};

// Keyed by MAC. The IP is whatever discovery saw last.
struct Device {
    std::string mac;
    std::string ip;
    std::string vendor = "unknown";
    DeviceStatus status = DeviceStatus::UNKNOWN;
    DeviceConfig config;  // effective config, set by the registry from the vendor

    TimePoint last_transition{};  // epoch = never transitioned
    TimePoint last_poll{};
    TimePoint last_logged{};
    TimePoint first_seen{};
    TimePoint last_seen{};
};

struct StateTransition {
    std::string mac;
    std::string ip;
    std::string vendor;
    DeviceStatus from = DeviceStatus::UNKNOWN;
    DeviceStatus to = DeviceStatus::UNKNOWN;
    TimePoint timestamp{};
    double seconds_since_last = 0.0;
};

} // namespace netwatch
