#include "config/monitor_config.h"
#include "logging/logger.h"
#include "monitor/network_monitor.h"

#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <thread>

using namespace netwatch;
using namespace std::chrono_literals;

static volatile sig_atomic_t running = 1;

static void signal_handler(int) {
    running = 0;
}

static void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [--config PATH] [--devices-dir DIR] [--log PATH]\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = "config.json";
    std::string devices_dir;
    std::string log_path;
    bool log_path_set = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--devices-dir") == 0 && i + 1 < argc) {
            devices_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            log_path = argv[++i];
            log_path_set = true;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    MonitorConfig config;
    LogLevel level = LogLevel::INFO;
    try {
        config = ConfigLoader::load(config_path);
        level = parse_log_level(config.log_level);
    } catch (const std::exception& e) {
        std::cerr << "[netwatch] " << e.what() << "\n";
        return 1;
    }

    if (!devices_dir.empty()) {
        config.devices_dir = devices_dir;
    }
    if (log_path_set) {
        config.log_file = log_path;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger logger(config.log_file, level);

    std::unique_ptr<NetworkMonitor> monitor;
    try {
        monitor = std::make_unique<NetworkMonitor>(
            config, logger, NetworkMonitor::default_collaborators(config));
    } catch (const std::exception& e) {
        logger.log_error("startup_error", e.what());
        std::cerr << "[netwatch] " << e.what() << "\n";
        return 1;
    }

    monitor->start();
    std::cout << "[netwatch] monitoring " << config.subnet
              << " (Ctrl+C to stop)\n";

    while (running) {
        std::this_thread::sleep_for(500ms);
    }

    std::cout << "\n[netwatch] shutting down. known devices: "
              << monitor->registry().size() << "\n";
    monitor->stop();

    return 0;
}
