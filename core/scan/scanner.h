#pragma once

#include <string>
#include <vector>

namespace netwatch {

struct DiscoveredHost {
    std::string ip;
    std::string mac;  // lower case, colon separated
};

// Full-subnet sweep. Throws std::runtime_error when the tool fails.
class IScanner {
public:
    virtual ~IScanner() = default;
    virtual std::vector<DiscoveredHost> scan(const std::string& subnet) = 0;
    virtual std::string name() const = 0;
};

// Lower-cases and validates "aa:bb:cc:dd:ee:ff". Returns "" if malformed.
std::string normalize_mac(const std::string& text);

} // namespace netwatch
