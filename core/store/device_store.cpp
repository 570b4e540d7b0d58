#include "store/device_store.h"

#include "store/filename.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace netwatch {

namespace {

std::string errno_message(const std::string& action, const std::filesystem::path& path) {
    return action + " " + path.string() + ": " + std::strerror(errno);
}

} // namespace

DeviceStore::DeviceStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec || !std::filesystem::is_directory(directory_)) {
        throw std::runtime_error("cannot create devices directory " +
                                 directory_.string() +
                                 (ec ? ": " + ec.message() : ""));
    }
}

std::filesystem::path DeviceStore::path_for(const std::string& mac) const {
    return directory_ / safe_filename(mac);
}

std::shared_ptr<std::mutex> DeviceStore::lock_for(const std::string& filename) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& entry = locks_[filename];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

void DeviceStore::record(const Device& device, DeviceStatus status,
                         TimePoint timestamp, double seconds_since_transition) {
    LogEntry entry;
    entry.timestamp = timestamp;
    entry.ip = device.ip;
    entry.mac = device.mac;
    entry.status = status;
    entry.seconds_since_transition = seconds_since_transition;
    std::string line = format_entry(entry) + "\n";

    auto path = path_for(device.mac);
    auto file_lock = lock_for(path.filename().string());
    std::lock_guard<std::mutex> lock(*file_lock);

    // The directory may have been removed by hand since startup
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw StoreError(device.mac, "cannot create " + directory_.string() +
                                         ": " + ec.message());
    }

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw StoreError(device.mac, errno_message("cannot open", path));
    }

    // A crash mid-append leaves a torn last line; start on a fresh one
    struct stat st;
    if (::fstat(fd, &st) != 0) {
        std::string msg = errno_message("cannot stat", path);
        ::close(fd);
        throw StoreError(device.mac, msg);
    }
    if (st.st_size > 0) {
        char last = '\n';
        if (::pread(fd, &last, 1, st.st_size - 1) != 1) {
            std::string msg = errno_message("cannot read", path);
            ::close(fd);
            throw StoreError(device.mac, msg);
        }
        if (last != '\n') {
            line.insert(line.begin(), '\n');
        }
    }

    const char* data = line.data();
    std::size_t remaining = line.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string msg = errno_message("write failed on", path);
            ::close(fd);
            throw StoreError(device.mac, msg);
        }
        data += n;
        remaining -= static_cast<std::size_t>(n);
    }

    if (::fsync(fd) != 0) {
        std::string msg = errno_message("fsync failed on", path);
        ::close(fd);
        throw StoreError(device.mac, msg);
    }

    if (::close(fd) != 0) {
        throw StoreError(device.mac, errno_message("close failed on", path));
    }
}

std::optional<RecoveredDevice> DeviceStore::recover(const std::string& mac) {
    auto path = path_for(mac);
    auto file_lock = lock_for(path.filename().string());
    std::lock_guard<std::mutex> lock(*file_lock);
    return read_log(path, mac);
}

std::optional<RecoveredDevice> DeviceStore::read_log(const std::filesystem::path& path,
                                                     const std::string& mac) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw StoreError(mac, path.string() + " is not a regular file");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw StoreError(mac, "cannot read " + path.string());
    }

    std::optional<RecoveredDevice> result;
    std::string line;
    while (std::getline(file, line)) {
        auto entry = parse_entry(line);
        if (!entry) {
            continue;
        }

        // A run of identical statuses started at the last transition
        if (!result || result->last.status != entry->status) {
            RecoveredDevice rd;
            rd.last = *entry;
            rd.last_transition = entry->timestamp;
            result = rd;
        } else {
            result->last = *entry;
        }
    }

    if (file.bad()) {
        throw StoreError(mac, "read error on " + path.string());
    }
    return result;
}

RecoveryResult DeviceStore::recover_all() {
    RecoveryResult result;

    std::error_code ec;
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        result.failures.push_back(directory_.string() + ": " + ec.message());
        return result;
    }

    for (const auto& dirent : it) {
        std::string filename = dirent.path().filename().string();
        try {
            auto file_lock = lock_for(filename);
            std::lock_guard<std::mutex> lock(*file_lock);
            auto recovered = read_log(dirent.path(), filename);
            if (recovered) {
                result.devices.push_back(*recovered);
            }
        } catch (const StoreError& e) {
            result.failures.push_back(filename + ": " + e.what());
        }
    }

    return result;
}

} // namespace netwatch
