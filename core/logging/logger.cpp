#include "logging/logger.h"

#include "util/time_format.h"

#include <iostream>
#include <stdexcept>

namespace netwatch {

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "INFO";
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "DEBUG")   return LogLevel::DEBUG;
    if (name == "INFO")    return LogLevel::INFO;
    if (name == "WARNING") return LogLevel::WARNING;
    if (name == "ERROR")   return LogLevel::ERROR;
    throw std::runtime_error("unknown log level: " + name);
}

Logger::Logger(const std::string& output_path, LogLevel min_level)
    : min_level_(min_level) {
    if (!output_path.empty()) {
        file_.open(output_path, std::ios::app);
    }
}

Logger::~Logger() {
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::log_transition(const StateTransition& transition) {
    nlohmann::json j;
    j["type"] = "transition";
    j["mac"] = transition.mac;
    j["ip"] = transition.ip;
    j["vendor"] = transition.vendor;
    j["from"] = to_string(transition.from);
    j["to"] = to_string(transition.to);
    j["seconds_since_last"] = transition.seconds_since_last;
    write_line(LogLevel::INFO, std::move(j));
}

void Logger::log_heartbeat(const Device& device, double seconds_since_transition) {
    nlohmann::json j;
    j["type"] = "heartbeat";
    j["mac"] = device.mac;
    j["ip"] = device.ip;
    j["status"] = to_string(device.status);
    j["seconds_since_last"] = seconds_since_transition;
    write_line(LogLevel::DEBUG, std::move(j));
}

void Logger::log_discovered(const Device& device) {
    nlohmann::json j;
    j["type"] = "discovered";
    j["mac"] = device.mac;
    j["ip"] = device.ip;
    j["vendor"] = device.vendor;
    write_line(LogLevel::INFO, std::move(j));
}

void Logger::log_ip_changed(const Device& device, const std::string& previous_ip) {
    nlohmann::json j;
    j["type"] = "ip_changed";
    j["mac"] = device.mac;
    j["from"] = previous_ip;
    j["to"] = device.ip;
    write_line(LogLevel::INFO, std::move(j));
}

void Logger::log_scan(const std::string& scanner, std::size_t hosts_found,
                      std::size_t new_devices) {
    nlohmann::json j;
    j["type"] = "scan";
    j["scanner"] = scanner;
    j["hosts"] = hosts_found;
    j["new"] = new_devices;
    write_line(LogLevel::INFO, std::move(j));
}

void Logger::log_error(const std::string& type, const std::string& message,
                       const std::string& mac) {
    nlohmann::json j;
    j["type"] = type;
    j["message"] = message;
    if (!mac.empty()) {
        j["mac"] = mac;
    }
    write_line(LogLevel::ERROR, std::move(j));
}

void Logger::log_warning(const std::string& type, const std::string& message,
                         const std::string& mac) {
    nlohmann::json j;
    j["type"] = type;
    j["message"] = message;
    if (!mac.empty()) {
        j["mac"] = mac;
    }
    write_line(LogLevel::WARNING, std::move(j));
}

void Logger::log_info(const std::string& message) {
    nlohmann::json j;
    j["type"] = "info";
    j["message"] = message;
    write_line(LogLevel::INFO, std::move(j));
}

void Logger::log_debug(const std::string& message) {
    nlohmann::json j;
    j["type"] = "debug";
    j["message"] = message;
    write_line(LogLevel::DEBUG, std::move(j));
}

void Logger::write_line(LogLevel level, nlohmann::json j) {
    if (level < min_level_) {
        return;
    }

    j["ts"] = format_iso8601(Clock::now());
    j["level"] = to_string(level);
    std::string line = j.dump();

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line << "\n";
        file_.flush();
    }
    std::cout << line << std::endl;
}

} // namespace netwatch
