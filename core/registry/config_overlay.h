#pragma once

#include "registry/device.h"

#include <chrono>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace netwatch {

// Only the fields present override the defaults.
struct PartialDeviceConfig {
    std::optional<int> ping_count;
    std::optional<std::chrono::seconds> ping_timeout;
    std::optional<std::chrono::seconds> polling_interval;
    std::optional<bool> disabled;

    DeviceConfig apply(DeviceConfig base) const;
};

struct DeviceOverride {
    std::string pattern;  // regex matched against the vendor label
    PartialDeviceConfig overrides;
};

// Ordered vendor-pattern overlays. The first pattern that matches wins.
class ConfigOverlay {
public:
    ConfigOverlay() = default;
    ConfigOverlay(DeviceConfig defaults, const std::vector<DeviceOverride>& overrides);

    DeviceConfig resolve(const std::string& vendor) const;

    const DeviceConfig& defaults() const { return defaults_; }

    // Patterns that failed to compile and are ignored.
    const std::vector<std::string>& rejected_patterns() const { return rejected_; }

private:
    struct CompiledOverride {
        std::string pattern;
        std::regex regex;
        PartialDeviceConfig overrides;
    };

    DeviceConfig defaults_;
    std::vector<CompiledOverride> overlays_;
    std::vector<std::string> rejected_;
};

} // namespace netwatch
