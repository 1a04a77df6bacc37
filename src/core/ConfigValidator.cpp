#include "ConfigValidator.h"
#include "Errors.h"
#include "Logging.h"
#include "../pipeline/FilterEngine.h"
#include <algorithm>
#include <cctype>

namespace open_ports {

void ConfigValidator::validate(Config& cfg) {
    validate_sort(cfg);
    validate_output(cfg);
    validate_filters(cfg);
    validate_ranges(cfg);
    validate_hardening(cfg);
}

void ConfigValidator::validate_sort(Config& cfg) {
    if(!cfg.sort_name.empty() && !parse_sort_key(cfg.sort_name, cfg.sort_key)) {
        throw ConfigError("Invalid --sort value: '" + cfg.sort_name + "' (choose from PID, Port, Program)");
    }
    // Shorthand flags win over --sort; --pid wins over --port.
    if(cfg.sort_by_pid) cfg.sort_key = SortKey::Pid;
    else if(cfg.sort_by_port) cfg.sort_key = SortKey::Port;
}

void ConfigValidator::validate_output(Config& cfg) {
    if(cfg.bare && cfg.json) throw ConfigError("--bare and --json are mutually exclusive");
    cfg.output = cfg.json ? OutputMode::Json : cfg.bare ? OutputMode::Bare : OutputMode::Full;
}

void ConfigValidator::validate_filters(Config& cfg) {
    std::transform(cfg.proto.begin(), cfg.proto.end(), cfg.proto.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if(!cfg.proto.empty() && cfg.proto != "tcp" && cfg.proto != "udp") {
        throw ConfigError("Invalid --proto value: '" + cfg.proto + "' (choose from tcp, udp)");
    }
    if(cfg.regex) FilterEngine::compile(*cfg.regex);
}

void ConfigValidator::validate_ranges(const Config& cfg) {
    if(cfg.continuous_seconds && *cfg.continuous_seconds <= 0) {
        throw ConfigError("--continuous interval must be a positive number of seconds");
    }
    if(cfg.dns_timeout_ms <= 0 || cfg.dns_timeout_ms > 60000) {
        throw ConfigError("--dns-timeout must be between 1 and 60000 ms");
    }
    if(cfg.dns_parallel <= 0 || cfg.dns_parallel > 64) {
        throw ConfigError("--dns-parallel must be between 1 and 64");
    }
    if(cfg.proc_root.empty()) throw ConfigError("--proc-root must not be empty");
    LogLevel lvl;
    if(!cfg.log_level.empty() && !Logger::parse_level(cfg.log_level, lvl)) {
        throw ConfigError("Invalid --log-level value: '" + cfg.log_level + "'");
    }
}

void ConfigValidator::validate_hardening(Config& cfg) {
    if(cfg.keep_cap_dac && !cfg.drop_priv) throw ConfigError("--keep-cap-dac requires --drop-priv");
    if(cfg.seccomp_strict) cfg.seccomp = true;
}

}
