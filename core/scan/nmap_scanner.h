#pragma once

#include "scan/scanner.h"

#include <string>
#include <unordered_map>

namespace netwatch {

// nmap -sn <subnet>. Hosts whose MAC nmap does not print (when not run as
// root) are looked up in the kernel ARP table.
class NmapScanner : public IScanner {
public:
    explicit NmapScanner(std::string arp_table_path = "/proc/net/arp");

    std::vector<DiscoveredHost> scan(const std::string& subnet) override;
    std::string name() const override { return "nmap"; }

    static std::vector<DiscoveredHost> parse_output(
        const std::string& output,
        const std::unordered_map<std::string, std::string>& arp_table);

    // ip -> mac from a /proc/net/arp formatted file
    static std::unordered_map<std::string, std::string> read_arp_table(
        const std::string& path);

private:
    std::string arp_table_path_;
};

} // namespace netwatch
