#include "scan/nmap_scanner.h"

#include "probe/ping_backend.h"
#include "util/command.h"

#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace netwatch {

namespace {

const std::string kReportPrefix = "Nmap scan report for ";
const std::string kMacPrefix = "MAC Address: ";

// "host.lan (192.168.1.5)" or "192.168.1.5"
std::string report_ip(const std::string& rest) {
    auto open = rest.rfind('(');
    auto close = rest.rfind(')');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        return rest.substr(open + 1, close - open - 1);
    }
    return rest;
}

} // namespace

NmapScanner::NmapScanner(std::string arp_table_path)
    : arp_table_path_(std::move(arp_table_path)) {}

std::vector<DiscoveredHost> NmapScanner::scan(const std::string& subnet) {
    auto result = run_command("nmap -sn " + shell_quote(subnet) + " 2>/dev/null");
    if (result.exit_code != 0) {
        throw std::runtime_error("nmap exited with status " +
                                 std::to_string(result.exit_code));
    }
    // The sweep itself fills the ARP cache, so read it afterwards
    return parse_output(result.output, read_arp_table(arp_table_path_));
}

std::vector<DiscoveredHost> NmapScanner::parse_output(
    const std::string& output,
    const std::unordered_map<std::string, std::string>& arp_table) {

    std::vector<DiscoveredHost> hosts;
    std::set<std::string> seen;
    std::string pending_ip;

    auto flush = [&](const std::string& mac) {
        if (pending_ip.empty()) {
            return;
        }
        std::string resolved = mac;
        if (resolved.empty()) {
            auto it = arp_table.find(pending_ip);
            if (it != arp_table.end()) {
                resolved = it->second;
            }
        }
        if (!resolved.empty() && seen.insert(resolved).second) {
            hosts.push_back({pending_ip, resolved});
        }
        pending_ip.clear();
    };

    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.compare(0, kReportPrefix.size(), kReportPrefix) == 0) {
            flush("");
            std::string ip = report_ip(line.substr(kReportPrefix.size()));
            if (PingBackend::is_valid_ipv4(ip)) {
                pending_ip = ip;
            }
        } else if (line.compare(0, kMacPrefix.size(), kMacPrefix) == 0) {
            std::istringstream fields(line.substr(kMacPrefix.size()));
            std::string mac_text;
            fields >> mac_text;
            std::string mac = normalize_mac(mac_text);
            if (!mac.empty()) {
                flush(mac);
            }
        }
    }
    flush("");

    return hosts;
}

std::unordered_map<std::string, std::string> NmapScanner::read_arp_table(
    const std::string& path) {
    std::unordered_map<std::string, std::string> table;
    std::ifstream file(path);
    if (!file.is_open()) {
        return table;
    }

    std::string line;
    std::getline(file, line);  // header
    while (std::getline(file, line)) {
        std::istringstream ss(line);
        std::string ip, hw_type, flags, mac;
        if (!(ss >> ip >> hw_type >> flags >> mac)) {
            continue;
        }
        std::string normalized = normalize_mac(mac);
        if (!normalized.empty()) {
            table[ip] = normalized;
        }
    }
    return table;
}

} // namespace netwatch
