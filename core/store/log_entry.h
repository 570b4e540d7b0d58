#pragma once

#include "registry/device.h"

#include <optional>
#include <string>

namespace netwatch {

// One line of a device log:
// timestamp,ip,mac,status,seconds_since_last_transition
struct LogEntry {
    TimePoint timestamp{};
    std::string ip;
    std::string mac;
    DeviceStatus status = DeviceStatus::UNKNOWN;
    double seconds_since_transition = 0.0;
};

std::string format_entry(const LogEntry& entry);

// Returns nullopt for lines that do not have all five well-formed fields.
std::optional<LogEntry> parse_entry(const std::string& line);

} // namespace netwatch
