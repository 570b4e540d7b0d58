#include "registry/config_overlay.h"

namespace netwatch {

DeviceConfig PartialDeviceConfig::apply(DeviceConfig base) const {
    if (ping_count)       base.ping_count = *ping_count;
    if (ping_timeout)     base.ping_timeout = *ping_timeout;
    if (polling_interval) base.polling_interval = *polling_interval;
    if (disabled)         base.disabled = *disabled;
    return base;
}

ConfigOverlay::ConfigOverlay(DeviceConfig defaults,
                             const std::vector<DeviceOverride>& overrides)
    : defaults_(defaults) {
    for (const auto& o : overrides) {
        try {
            overlays_.push_back({o.pattern, std::regex(o.pattern), o.overrides});
        } catch (const std::regex_error&) {
            rejected_.push_back(o.pattern);
        }
    }
}

DeviceConfig ConfigOverlay::resolve(const std::string& vendor) const {
    for (const auto& o : overlays_) {
        // Anchored at the start of the label, open at the end.
        if (std::regex_search(vendor, o.regex,
                              std::regex_constants::match_continuous)) {
            return o.overrides.apply(defaults_);
        }
    }
    return defaults_;
}

} // namespace netwatch
