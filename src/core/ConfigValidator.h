#pragma once
#include "Config.h"
#include <string>

namespace open_ports {

class ConfigValidator {
public:
    // Normalizes cfg (sort key, output mode, proto case) and rejects invalid input
    // with ConfigError. Compiles the regex, so a bad pattern fails before any scan.
    static void validate(Config& cfg);

private:
    static void validate_sort(Config& cfg);
    static void validate_output(Config& cfg);
    static void validate_filters(Config& cfg);
    static void validate_ranges(const Config& cfg);
    static void validate_hardening(Config& cfg);
};

}
