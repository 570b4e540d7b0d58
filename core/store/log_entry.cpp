#include "store/log_entry.h"

#include <iomanip>
#include <sstream>
#include <vector>

namespace netwatch {

std::string format_entry(const LogEntry& entry) {
    std::ostringstream oss;
    oss << format_iso8601(entry.timestamp) << ','
        << entry.ip << ','
        << entry.mac << ','
        << to_string(entry.status) << ','
        << std::fixed << std::setprecision(1) << entry.seconds_since_transition;
    return oss.str();
}

std::optional<LogEntry> parse_entry(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string field;
    while (std::getline(iss, field, ',')) {
        fields.push_back(field);
    }
    if (fields.size() != 5) {
        return std::nullopt;
    }

    LogEntry entry;
    if (!parse_iso8601(fields[0], entry.timestamp)) {
        return std::nullopt;
    }
    entry.ip = fields[1];
    entry.mac = fields[2];
    if (entry.mac.empty() || !parse_status(fields[3], entry.status)) {
        return std::nullopt;
    }

    try {
        std::size_t used = 0;
        entry.seconds_since_transition = std::stod(fields[4], &used);
        if (used != fields[4].size() || entry.seconds_since_transition < 0.0) {
            return std::nullopt;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    return entry;
}

} // namespace netwatch
