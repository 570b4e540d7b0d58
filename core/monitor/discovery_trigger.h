#pragma once

#include <filesystem>

namespace netwatch {

// A sentinel file whose presence asks for an immediate discovery sweep.
class DiscoveryTrigger {
public:
    explicit DiscoveryTrigger(std::filesystem::path path);

    bool pending() const;

    // Removes the sentinel. Returns false if it could not be removed.
    bool clear();

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace netwatch
