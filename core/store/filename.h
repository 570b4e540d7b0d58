#pragma once

#include <string>

namespace netwatch {

// Maps a device identifier to a file name that is safe to pass as a bare
// shell argument: only [A-Za-z0-9._:-] survive, and leading '-' or '_'
// are stripped so the name can never look like an option.
// Empty (or dots-only) results become "unknown-device".
std::string safe_filename(const std::string& identifier);

} // namespace netwatch
