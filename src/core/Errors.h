#pragma once
#include <stdexcept>
#include <string>

namespace open_ports {

// Invalid user input (bad regex, bad sort key, out-of-range value). Raised before any scan.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// The OS connection tables could not be read at all.
class EnumerationError : public std::runtime_error {
public:
    explicit EnumerationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Process exit codes
enum ExitCode : int {
    kExitOk = 0,
    kExitUsage = 2,
    kExitEnumeration = 3,
    kExitSeccomp = 4,
};

}
