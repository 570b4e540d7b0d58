#pragma once

#include "registry/device.h"
#include "store/log_entry.h"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace netwatch {

class StoreError : public std::runtime_error {
public:
    StoreError(const std::string& mac, const std::string& what)
        : std::runtime_error(what), mac_(mac) {}

    const std::string& mac() const { return mac_; }

private:
    std::string mac_;
};

// Latest known state re-derived from a device log.
struct RecoveredDevice {
    LogEntry last;
    TimePoint last_transition{};
};

struct RecoveryResult {
    std::vector<RecoveredDevice> devices;
    std::vector<std::string> failures;  // "<file>: <reason>"
};

// Append-only state logs, one file per device under a single directory.
// Each file has its own lock, so a broken file only affects its device.
class DeviceStore {
public:
    // Creates the directory. Throws std::runtime_error if that fails.
    explicit DeviceStore(std::filesystem::path directory);

    // Appends one line and fsyncs it before returning. Throws StoreError.
    void record(const Device& device, DeviceStatus status, TimePoint timestamp,
                double seconds_since_transition);

    // Last well-formed line of the device's log, or nullopt if the log is
    // missing or holds no valid line. Throws StoreError if unreadable.
    std::optional<RecoveredDevice> recover(const std::string& mac);

    // Recovers every log in the directory.
    RecoveryResult recover_all();

    std::filesystem::path path_for(const std::string& mac) const;
    const std::filesystem::path& directory() const { return directory_; }

private:
    std::shared_ptr<std::mutex> lock_for(const std::string& filename);
    std::optional<RecoveredDevice> read_log(const std::filesystem::path& path,
                                            const std::string& mac);

    std::filesystem::path directory_;
    std::mutex locks_mutex_;  // guards locks_ only
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace netwatch
