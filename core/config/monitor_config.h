#pragma once

#include "registry/config_overlay.h"
#include "registry/device.h"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace netwatch {

struct MonitorConfig {
    std::string subnet;
    std::string interface = "eth0";
    std::chrono::seconds discovery_interval{300};
    std::chrono::seconds polling_interval{3};
    std::chrono::seconds ping_timeout{2};
    int ping_count = 1;
    int parallel_ping_workers = 10;
    std::string scanner = "auto";

    std::string devices_dir = "devices";
    std::string log_file = "monitor.log";
    std::string log_level = "INFO";

    std::string discovery_trigger_file = "discover.now";
    std::chrono::seconds trigger_check_interval{5};
    std::chrono::seconds heartbeat_interval{0};  // 0 = off

    std::string vendor_lookup_url;
    std::map<std::string, std::string> common_vendors;  // MAC prefix -> label
    std::vector<DeviceOverride> device_overrides;       // declaration order

    DeviceConfig device_defaults() const;
};

class ConfigLoader {
public:
    // Throws std::runtime_error on unreadable files or invalid values.
    static MonitorConfig load(const std::string& path);
    static MonitorConfig parse(const std::string& json_text);
};

} // namespace netwatch
