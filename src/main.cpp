#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include "core/Privilege.h"
#include "core/StopSignal.h"
#include "pipeline/Pipeline.h"
#include "pipeline/Resolver.h"
#include "pipeline/Scheduler.h"
#include "scanners/ProcfsSource.h"
#include <iostream>
#include <memory>

using namespace open_ports;

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Warn);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) {
        if(parser.exit_code() != kExitOk) {
            parser.print_help(std::cerr);
            std::cerr << "\nError: " << parser.error() << "\n";
        }
        return parser.exit_code();
    }

    // Everything the user typed is checked here, before the first enumeration.
    try {
        ConfigValidator::validate(cfg);
    } catch(const ConfigError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return kExitUsage;
    }

    LogLevel level = cfg.verbose ? LogLevel::Debug : LogLevel::Warn;
    if(!cfg.log_level.empty()) Logger::parse_level(cfg.log_level, level);
    Logger::instance().set_level(level);

    if(cfg.drop_priv) drop_capabilities(cfg.keep_cap_dac);
    if(cfg.seccomp) {
        if(!apply_seccomp_profile(cfg.dns)) {
            std::cerr << "Failed to apply seccomp profile";
            if(cfg.seccomp_strict) { std::cerr << "\n"; return kExitSeccomp; }
            std::cerr << " (continuing)\n";
        }
    }

    StopSignal stop;
    stop.install_handlers();

    HostResolverPtr resolver;
    if(cfg.dns) resolver = std::make_shared<SystemHostResolver>();
    Pipeline pipeline(std::make_shared<ProcfsSource>(cfg.proc_root), resolver);
    Scheduler scheduler(pipeline, stop, std::cout);

    try {
        scheduler.run(cfg);
    } catch(const EnumerationError& ex) {
        Logger::instance().error(ex.what());
        return kExitEnumeration;
    }

    if(stop.requested()) std::cerr << "\nMonitoring stopped.\n";
    return kExitOk;
}
