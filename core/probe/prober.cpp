#include "probe/prober.h"

#include <stdexcept>

namespace netwatch {

Prober::Prober(std::unique_ptr<IProbeBackend> backend)
    : backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("prober needs a probe backend");
    }
}

ProbeResult Prober::check(const std::string& ip, int ping_count,
                          std::chrono::seconds timeout) {
    ProbeResult result;
    int count = ping_count < 1 ? 1 : ping_count;

    for (int i = 0; i < count; ++i) {
        ++result.attempts;
        if (backend_->probe(ip, timeout)) {
            result.online = true;
            return result;
        }
    }
    return result;
}

} // namespace netwatch
