#pragma once

#include <string>

namespace netwatch {

struct CommandResult {
    int exit_code = -1;
    std::string output;
};

// Runs a shell command through popen and captures stdout.
// exit_code is -1 when the command could not be started or was killed.
CommandResult run_command(const std::string& command);

// True if an executable with this name is found on PATH.
bool command_exists(const std::string& name);

// Wraps a value in single quotes for /bin/sh.
std::string shell_quote(const std::string& value);

} // namespace netwatch
