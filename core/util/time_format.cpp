#include "util/time_format.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace netwatch {

std::string format_iso8601(TimePoint tp) {
    auto time_t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

bool parse_iso8601(const std::string& text, TimePoint& out) {
    if (text.size() != 20 || text[19] != 'Z') {
        return false;
    }

    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return false;
    }

    time_t seconds = timegm(&tm);
    if (seconds == static_cast<time_t>(-1)) {
        return false;
    }
    out = Clock::from_time_t(seconds);
    return true;
}

double seconds_between(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace netwatch
