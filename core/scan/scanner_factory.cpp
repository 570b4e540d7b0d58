#include "scan/scanner_factory.h"

#include "scan/arp_scan_scanner.h"
#include "scan/nmap_scanner.h"
#include "util/command.h"

#include <stdexcept>

namespace netwatch {

std::unique_ptr<IScanner> ScannerFactory::create(const std::string& preference,
                                                 const std::string& interface,
                                                 const ToolProbe& available) {
    if (preference != "auto" && preference != "arp-scan" && preference != "nmap") {
        throw std::runtime_error("unknown scanner: " + preference);
    }

    bool want_arp = preference == "auto" || preference == "arp-scan";
    bool want_nmap = preference == "auto" || preference == "nmap";

    if (want_arp && available("arp-scan")) {
        return std::make_unique<ArpScanScanner>(interface);
    }
    if (want_nmap && available("nmap")) {
        return std::make_unique<NmapScanner>();
    }

    throw std::runtime_error("no scanner available for '" + preference +
                             "' (install arp-scan or nmap)");
}

std::unique_ptr<IScanner> ScannerFactory::create(const std::string& preference,
                                                 const std::string& interface) {
    return create(preference, interface, command_exists);
}

} // namespace netwatch
