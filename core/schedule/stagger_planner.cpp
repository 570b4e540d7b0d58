#include "schedule/stagger_planner.h"

namespace netwatch {

std::vector<std::chrono::milliseconds> stagger_offsets(std::size_t n,
                                                       std::chrono::milliseconds interval) {
    std::vector<std::chrono::milliseconds> offsets;
    offsets.reserve(n);
    for (std::size_t k = 0; k < n; ++k) {
        auto ms = interval.count() * static_cast<long long>(k) /
                  static_cast<long long>(n);
        offsets.emplace_back(ms);
    }
    return offsets;
}

StaggerPlanner::StaggerPlanner(std::chrono::milliseconds interval)
    : interval_(interval) {}

std::vector<ScheduledProbe> StaggerPlanner::plan(const std::vector<ScheduledProbe>& due) const {
    auto offsets = stagger_offsets(due.size(), interval_);
    std::vector<ScheduledProbe> planned = due;
    for (std::size_t k = 0; k < planned.size(); ++k) {
        planned[k].offset = offsets[k];
    }
    return planned;
}

} // namespace netwatch
