#include "config/monitor_config.h"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace netwatch {

namespace {

// ordered_json keeps object keys in file order, which the override
// mapping depends on.
using json = nlohmann::ordered_json;

std::chrono::seconds positive_seconds(const json& j, const char* key,
                                      std::chrono::seconds fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    int value = j.at(key).get<int>();
    if (value <= 0) {
        throw std::runtime_error(std::string(key) + " must be positive");
    }
    return std::chrono::seconds(value);
}

int positive_int(const json& j, const char* key, int fallback) {
    int value = j.value(key, fallback);
    if (value <= 0) {
        throw std::runtime_error(std::string(key) + " must be positive");
    }
    return value;
}

PartialDeviceConfig parse_partial(const json& entry) {
    PartialDeviceConfig p;
    if (entry.contains("ping_count")) {
        p.ping_count = positive_int(entry, "ping_count", 1);
    }
    if (entry.contains("ping_timeout_seconds")) {
        p.ping_timeout = positive_seconds(entry, "ping_timeout_seconds", {});
    }
    if (entry.contains("polling_interval_seconds")) {
        p.polling_interval = positive_seconds(entry, "polling_interval_seconds", {});
    }
    if (entry.contains("disabled")) {
        p.disabled = entry.at("disabled").get<bool>();
    }
    return p;
}

std::vector<DeviceOverride> parse_overrides(const json& node) {
    std::vector<DeviceOverride> overrides;

    if (node.is_array()) {
        for (const auto& entry : node) {
            DeviceOverride o;
            o.pattern = entry.at("pattern").get<std::string>();
            o.overrides = parse_partial(entry);
            overrides.push_back(o);
        }
    } else if (node.is_object()) {
        for (const auto& [pattern, entry] : node.items()) {
            overrides.push_back({pattern, parse_partial(entry)});
        }
    } else if (!node.is_null()) {
        throw std::runtime_error("device_overrides must be an array or object");
    }

    return overrides;
}

MonitorConfig from_json(const json& j) {
    MonitorConfig c;

    c.subnet = j.at("subnet").get<std::string>();
    if (c.subnet.empty()) {
        throw std::runtime_error("subnet must not be empty");
    }
    c.interface = j.value("interface", c.interface);
    c.discovery_interval = positive_seconds(j, "discovery_interval_seconds", c.discovery_interval);
    c.polling_interval = positive_seconds(j, "polling_interval_seconds", c.polling_interval);
    c.ping_timeout = positive_seconds(j, "ping_timeout_seconds", c.ping_timeout);
    c.ping_count = positive_int(j, "ping_count", c.ping_count);
    c.parallel_ping_workers = positive_int(j, "parallel_ping_workers", c.parallel_ping_workers);
    c.scanner = j.value("scanner", c.scanner);

    c.devices_dir = j.value("devices_dir", c.devices_dir);
    c.log_file = j.value("log_file", c.log_file);
    c.log_level = j.value("log_level", c.log_level);

    c.discovery_trigger_file = j.value("discovery_trigger_file", c.discovery_trigger_file);
    c.trigger_check_interval = positive_seconds(j, "trigger_check_seconds", c.trigger_check_interval);

    int heartbeat = j.value("heartbeat_interval_seconds", 0);
    if (heartbeat < 0) {
        throw std::runtime_error("heartbeat_interval_seconds must not be negative");
    }
    c.heartbeat_interval = std::chrono::seconds(heartbeat);

    c.vendor_lookup_url = j.value("vendor_lookup_url", c.vendor_lookup_url);
    if (j.contains("common_vendors")) {
        for (const auto& [prefix, label] : j.at("common_vendors").items()) {
            c.common_vendors[prefix] = label.get<std::string>();
        }
    }
    if (j.contains("device_overrides")) {
        c.device_overrides = parse_overrides(j.at("device_overrides"));
    }

    return c;
}

} // namespace

DeviceConfig MonitorConfig::device_defaults() const {
    DeviceConfig d;
    d.ping_count = ping_count;
    d.ping_timeout = ping_timeout;
    d.polling_interval = polling_interval;
    d.disabled = false;
    return d;
}

MonitorConfig ConfigLoader::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open config: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

MonitorConfig ConfigLoader::parse(const std::string& json_text) {
    try {
        return from_json(json::parse(json_text));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid config: ") + e.what());
    }
}

} // namespace netwatch
