#include "scan/arp_scan_scanner.h"

#include "probe/ping_backend.h"
#include "util/command.h"

#include <set>
#include <sstream>
#include <stdexcept>

namespace netwatch {

ArpScanScanner::ArpScanScanner(std::string interface)
    : interface_(std::move(interface)) {}

std::vector<DiscoveredHost> ArpScanScanner::scan(const std::string& subnet) {
    std::string cmd = "arp-scan --interface=" + shell_quote(interface_) + " " +
                      shell_quote(subnet) + " 2>/dev/null";
    auto result = run_command(cmd);
    if (result.exit_code != 0) {
        throw std::runtime_error("arp-scan exited with status " +
                                 std::to_string(result.exit_code));
    }
    return parse_output(result.output);
}

std::vector<DiscoveredHost> ArpScanScanner::parse_output(const std::string& output) {
    std::vector<DiscoveredHost> hosts;
    std::set<std::string> seen;

    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string ip, mac_text;
        if (!(fields >> ip >> mac_text)) {
            continue;
        }
        if (!PingBackend::is_valid_ipv4(ip)) {
            continue;
        }
        std::string mac = normalize_mac(mac_text);
        // arp-scan reports duplicate responders; keep the first
        if (mac.empty() || !seen.insert(mac).second) {
            continue;
        }
        hosts.push_back({ip, mac});
    }
    return hosts;
}

} // namespace netwatch
