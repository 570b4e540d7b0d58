#include "store/filename.h"

#include <cctype>

namespace netwatch {

std::string safe_filename(const std::string& identifier) {
    std::string name;
    name.reserve(identifier.size());
    for (unsigned char c : identifier) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == ':' || c == '-') {
            name += static_cast<char>(c);
        }
    }

    auto start = name.find_first_not_of("-_");
    if (start == std::string::npos) {
        return "unknown-device";
    }
    name.erase(0, start);

    if (name.find_first_not_of('.') == std::string::npos) {
        return "unknown-device";
    }
    return name;
}

} // namespace netwatch
