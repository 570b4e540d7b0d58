#pragma once

#include <chrono>
#include <string>

namespace netwatch {

// One liveness attempt. Implementations must be safe to call from several
// worker threads at once.
class IProbeBackend {
public:
    virtual ~IProbeBackend() = default;
    virtual bool probe(const std::string& ip, std::chrono::seconds timeout) = 0;
    virtual std::string name() const = 0;
};

} // namespace netwatch
