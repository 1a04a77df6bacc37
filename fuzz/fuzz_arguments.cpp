#include "core/Config.h"
#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include <cstdint>
#include <string>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    open_ports::Logger::instance().set_level(open_ports::LogLevel::Error);
    std::string input(reinterpret_cast<const char*>(data), size);

    // NUL-separated arguments
    std::vector<std::string> args{"open-ports"};
    size_t pos = 0;
    while (pos <= input.size()) {
        size_t next = input.find('\0', pos);
        if (next == std::string::npos) { args.push_back(input.substr(pos)); break; }
        args.push_back(input.substr(pos, next - pos));
        pos = next + 1;
    }

    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));

    open_ports::ArgumentParser parser;
    open_ports::Config cfg;
    if (!parser.parse(static_cast<int>(argv.size()), argv.data(), cfg)) return 0;
    try {
        open_ports::ConfigValidator::validate(cfg);
    } catch (const open_ports::ConfigError&) {
        return 0;
    }
    return 0;
}
