#pragma once

#include "probe/probe_backend.h"

namespace netwatch {

// Runs the system ping for a single echo request.
class PingBackend : public IProbeBackend {
public:
    bool probe(const std::string& ip, std::chrono::seconds timeout) override;
    std::string name() const override { return "ping"; }

    static bool is_valid_ipv4(const std::string& ip);
};

} // namespace netwatch
