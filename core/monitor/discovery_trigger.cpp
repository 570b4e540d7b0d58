#include "monitor/discovery_trigger.h"

namespace netwatch {

DiscoveryTrigger::DiscoveryTrigger(std::filesystem::path path)
    : path_(std::move(path)) {}

bool DiscoveryTrigger::pending() const {
    if (path_.empty()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

bool DiscoveryTrigger::clear() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    return !ec;
}

} // namespace netwatch
