#include "scan/scanner.h"

#include <cctype>

namespace netwatch {

std::string normalize_mac(const std::string& text) {
    if (text.size() != 17) {
        return "";
    }

    std::string mac;
    mac.reserve(17);
    for (std::size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (i % 3 == 2) {
            if (c != ':' && c != '-') {
                return "";
            }
            mac += ':';
        } else {
            if (!std::isxdigit(c)) {
                return "";
            }
            mac += static_cast<char>(std::tolower(c));
        }
    }

    if (mac == "00:00:00:00:00:00") {
        return "";
    }
    return mac;
}

} // namespace netwatch
