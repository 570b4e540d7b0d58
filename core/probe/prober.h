#pragma once

#include "probe/probe_backend.h"

#include <chrono>
#include <memory>
#include <string>

namespace netwatch {

struct ProbeResult {
    bool online = false;
    int attempts = 0;
};

// Online as soon as one attempt succeeds, offline only after every attempt
// has failed.
class Prober {
public:
    explicit Prober(std::unique_ptr<IProbeBackend> backend);

    ProbeResult check(const std::string& ip, int ping_count,
                      std::chrono::seconds timeout);

    IProbeBackend& backend() { return *backend_; }

private:
    std::unique_ptr<IProbeBackend> backend_;
};

} // namespace netwatch
