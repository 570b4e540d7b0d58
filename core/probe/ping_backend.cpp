#include "probe/ping_backend.h"

#include "util/command.h"

#include <arpa/inet.h>
#include <stdexcept>

namespace netwatch {

bool PingBackend::is_valid_ipv4(const std::string& ip) {
    in_addr addr{};
    return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

bool PingBackend::probe(const std::string& ip, std::chrono::seconds timeout) {
    if (!is_valid_ipv4(ip)) {
        throw std::invalid_argument("not an IPv4 address: '" + ip + "'");
    }

    long wait_s = timeout.count() < 1 ? 1 : static_cast<long>(timeout.count());
    std::string cmd = "ping -c 1 -W " + std::to_string(wait_s) + " " +
                      shell_quote(ip) + " >/dev/null 2>&1";

    return run_command(cmd).exit_code == 0;
}

} // namespace netwatch
