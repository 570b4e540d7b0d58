#pragma once

#include "registry/device.h"

#include <chrono>
#include <cstddef>
#include <vector>

namespace netwatch {

// Offset k of n is k * interval / n, so all offsets fall inside [0, interval).
std::vector<std::chrono::milliseconds> stagger_offsets(std::size_t n,
                                                       std::chrono::milliseconds interval);

struct ScheduledProbe {
    Device device;
    DeviceConfig config;
    std::chrono::milliseconds offset{0};  // from cycle start
};

class StaggerPlanner {
public:
    explicit StaggerPlanner(std::chrono::milliseconds interval);

    // Assigns offsets in the order given. Recomputed per cycle, so a changed
    // device count reflows the spacing.
    std::vector<ScheduledProbe> plan(const std::vector<ScheduledProbe>& due) const;

    std::chrono::milliseconds interval() const { return interval_; }

private:
    std::chrono::milliseconds interval_;
};

} // namespace netwatch
