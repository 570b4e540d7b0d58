#pragma once

#include "scan/scanner.h"

namespace netwatch {

// arp-scan --interface=<iface> <subnet>
class ArpScanScanner : public IScanner {
public:
    explicit ArpScanScanner(std::string interface);

    std::vector<DiscoveredHost> scan(const std::string& subnet) override;
    std::string name() const override { return "arp-scan"; }

    static std::vector<DiscoveredHost> parse_output(const std::string& output);

private:
    std::string interface_;
};

} // namespace netwatch
