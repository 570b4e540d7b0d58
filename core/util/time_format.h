#pragma once

#include <chrono>
#include <string>

namespace netwatch {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Formats as YYYY-MM-DDTHH:MM:SSZ (UTC).
std::string format_iso8601(TimePoint tp);

// Parses the format produced by format_iso8601. Returns false on any mismatch.
bool parse_iso8601(const std::string& text, TimePoint& out);

double seconds_between(TimePoint from, TimePoint to);

} // namespace netwatch
