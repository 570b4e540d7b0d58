#pragma once

#include "scan/scanner.h"

#include <functional>
#include <memory>
#include <string>

namespace netwatch {

class ScannerFactory {
public:
    using ToolProbe = std::function<bool(const std::string& tool)>;

    // preference is "auto", "arp-scan" or "nmap". "auto" takes the first
    // tool available, arp-scan before nmap. Throws std::runtime_error if
    // no usable scanner is installed.
    static std::unique_ptr<IScanner> create(const std::string& preference,
                                            const std::string& interface,
                                            const ToolProbe& available);

    static std::unique_ptr<IScanner> create(const std::string& preference,
                                            const std::string& interface);
};

} // namespace netwatch
