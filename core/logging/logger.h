#pragma once

#include "registry/device.h"

#include <fstream>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace netwatch {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

const char* to_string(LogLevel level);

// Throws std::runtime_error for unknown names.
LogLevel parse_log_level(const std::string& name);

// JSON-lines event log, mirrored to stdout. Safe to call from any thread.
class Logger {
public:
    explicit Logger(const std::string& output_path,
                    LogLevel min_level = LogLevel::INFO);
    ~Logger();

    void log_transition(const StateTransition& transition);
    void log_heartbeat(const Device& device, double seconds_since_transition);
    void log_discovered(const Device& device);
    void log_ip_changed(const Device& device, const std::string& previous_ip);
    void log_scan(const std::string& scanner, std::size_t hosts_found,
                  std::size_t new_devices);
    void log_error(const std::string& type, const std::string& message,
                   const std::string& mac = "");
    void log_warning(const std::string& type, const std::string& message,
                     const std::string& mac = "");
    void log_info(const std::string& message);
    void log_debug(const std::string& message);

    LogLevel min_level() const { return min_level_; }

private:
    void write_line(LogLevel level, nlohmann::json j);

    std::ofstream file_;
    std::mutex mutex_;
    LogLevel min_level_;
};

} // namespace netwatch
