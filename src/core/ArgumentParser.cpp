#include "ArgumentParser.h"
#include "Errors.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <cctype>
#include <iostream>

namespace open_ports {

static int need_int(const std::string& v, const char* flag){
    size_t used = 0; int n = 0;
    try { n = std::stoi(v, &used); } catch(const std::exception&) { used = 0; }
    if(v.empty() || used != v.size()) throw ConfigError(std::string("Invalid integer for ") + flag + ": '" + v + "'");
    return n;
}

static bool all_digits(const std::string& s){
    if(s.empty()) return false;
    for(char c : s) if(!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

ArgumentParser::ArgumentParser() {
    specs_ = {
        {"--pid", 'i', ArgKind::None, "", "Sort by PID", [](Config& c, const std::string&){ c.sort_by_pid = true; }},
        {"--port", 'p', ArgKind::None, "", "Sort by local port", [](Config& c, const std::string&){ c.sort_by_port = true; }},
        {"--sort", 's', ArgKind::String, "KEY", "Sort by PID, Port or Program (default: Program)", [](Config& c, const std::string& v){ c.sort_name = v; }},
        {"--bare", 'b', ArgKind::None, "", "Bare tab-separated output, suitable for scripts", [](Config& c, const std::string&){ c.bare = true; }},
        {"--json", 'j', ArgKind::None, "", "JSON output", [](Config& c, const std::string&){ c.json = true; }},
        {"--listening", 'l', ArgKind::None, "", "Show only listening sockets", [](Config& c, const std::string&){ c.listening_only = true; }},
        {"--proto", 0, ArgKind::String, "tcp|udp", "Only show one protocol family", [](Config& c, const std::string& v){ c.proto = v; }},
        {"--dns", 'd', ArgKind::None, "", "Resolve remote addresses to host names", [](Config& c, const std::string&){ c.dns = true; }},
        {"--dns-timeout", 0, ArgKind::Int, "MS", "Upper bound per batch of DNS lookups (default: 1000)", [](Config& c, const std::string& v){ c.dns_timeout_ms = need_int(v, "--dns-timeout"); }},
        {"--dns-parallel", 0, ArgKind::Int, "N", "Concurrent DNS lookups (default: 8)", [](Config& c, const std::string& v){ c.dns_parallel = need_int(v, "--dns-parallel"); }},
        {"--regex", 'r', ArgKind::String, "PATTERN", "Keep rows whose program name or local port matches", [](Config& c, const std::string& v){ c.regex = v; }},
        {"--continuous", 'c', ArgKind::OptionalInt, "[SECONDS]", "Refresh every SECONDS (default: 10) until interrupted", [](Config& c, const std::string& v){ c.continuous_seconds = v.empty() ? 10 : need_int(v, "--continuous"); }},
        {"--proc-root", 0, ArgKind::String, "DIR", "Read connection and process tables from DIR (default: /proc)", [](Config& c, const std::string& v){ c.proc_root = v; }},
        {"--verbose", 'v', ArgKind::None, "", "Debug logging on stderr", [](Config& c, const std::string&){ c.verbose = true; }},
        {"--log-level", 0, ArgKind::String, "LEVEL", "error, warn, info, debug or trace", [](Config& c, const std::string& v){ c.log_level = v; }},
        {"--drop-priv", 0, ArgKind::None, "", "Drop Linux capabilities before scanning", [](Config& c, const std::string&){ c.drop_priv = true; }},
        {"--keep-cap-dac", 0, ArgKind::None, "", "Retain CAP_DAC_READ_SEARCH when dropping", [](Config& c, const std::string&){ c.keep_cap_dac = true; }},
        {"--seccomp", 0, ArgKind::None, "", "Apply seccomp profile", [](Config& c, const std::string&){ c.seccomp = true; }},
        {"--seccomp-strict", 0, ArgKind::None, "", "Fail if seccomp apply fails", [](Config& c, const std::string&){ c.seccomp_strict = true; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_long(const std::string& name) const {
    for(const auto& s : specs_) if(name == s.name) return &s;
    return nullptr;
}

const ArgumentParser::FlagSpec* ArgumentParser::find_short(char c) const {
    for(const auto& s : specs_) if(s.short_name && s.short_name == c) return &s;
    return nullptr;
}

bool ArgumentParser::fail(const std::string& msg) {
    error_ = msg;
    exit_code_ = kExitUsage;
    return false;
}

bool ArgumentParser::apply(const FlagSpec& spec, const std::string& value, Config& cfg) {
    try {
        spec.apply(cfg, value);
    } catch(const ConfigError& ex) {
        return fail(ex.what());
    }
    return true;
}

// -pd, -rPATTERN, -r PATTERN, -c5, -c 5
bool ArgumentParser::parse_short_bundle(const std::string& arg, int argc, char** argv, int& i, Config& cfg) {
    for(size_t k = 1; k < arg.size(); ++k) {
        const FlagSpec* spec = find_short(arg[k]);
        if(!spec) return fail(std::string("Unknown option: -") + arg[k]);
        std::string rest = arg.substr(k + 1);
        switch(spec->kind) {
            case ArgKind::None:
                if(!apply(*spec, "", cfg)) return false;
                continue;
            case ArgKind::String:
            case ArgKind::Int: {
                std::string val = rest;
                if(val.empty()) {
                    if(i + 1 >= argc) return fail(std::string("Missing value for ") + spec->name);
                    val = argv[++i];
                }
                return apply(*spec, val, cfg);
            }
            case ArgKind::OptionalInt: {
                std::string val;
                if(!rest.empty()) {
                    if(!all_digits(rest)) return fail(std::string("Invalid integer for ") + spec->name + ": '" + rest + "'");
                    val = rest;
                } else if(i + 1 < argc && all_digits(argv[i + 1])) {
                    val = argv[++i];
                }
                return apply(*spec, val, cfg);
            }
        }
    }
    return true;
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    exit_code_ = kExitOk;
    error_.clear();
    for(int i = 1; i < argc; ++i) {
        if(!argv[i]) continue;
        std::string a = argv[i];
        if(a == "--help" || a == "-h") { print_help(std::cout); return false; }
        if(a == "--version") { print_version(std::cout); return false; }
        if(a.size() > 1 && a[0] == '-' && a[1] != '-') {
            if(!parse_short_bundle(a, argc, argv, i, cfg)) return false;
            continue;
        }
        std::string inline_val; bool has_inline = false;
        auto eq = a.find('=');
        if(a.rfind("--", 0) == 0 && eq != std::string::npos) { inline_val = a.substr(eq + 1); a = a.substr(0, eq); has_inline = true; }
        const FlagSpec* spec = find_long(a);
        if(!spec) return fail("Unknown arg: " + a);
        std::string val;
        switch(spec->kind) {
            case ArgKind::None:
                if(has_inline) return fail(std::string(spec->name) + " does not take a value");
                break;
            case ArgKind::String:
            case ArgKind::Int:
                if(has_inline) { val = inline_val; break; }
                if(i + 1 >= argc) return fail("Missing value for " + a);
                val = argv[++i];
                break;
            case ArgKind::OptionalInt:
                if(has_inline) { val = inline_val; break; }
                if(i + 1 < argc && argv[i + 1] && argv[i + 1][0] != '-') val = argv[++i];
                break;
        }
        if(!apply(*spec, val, cfg)) return false;
    }
    return true;
}

void ArgumentParser::print_help(std::ostream& os) const {
    os << "usage: open-ports [options]\n\n"
          "List open ports and the programs that own them. Optionally filter by\n"
          "program name or port, and refresh continuously.\n\n"
          "options:\n";
    for(const auto& s : specs_) {
        std::string name = s.short_name ? std::string("-") + s.short_name + ", " : std::string("    ");
        name += s.name;
        if(*s.value_hint) { name += ' '; name += s.value_hint; }
        os << "  " << name;
        if(name.size() < 32) for(size_t k = name.size(); k < 32; ++k) os << ' '; else os << ' ';
        os << s.help << "\n";
    }
    os << "  -h, --help                        Show this help\n"
          "      --version                     Print version & exit\n\n"
          "examples:\n"
          "  open-ports -pd -r \"(chrome|firefox)\" -c 5\n"
          "    sort by local port, resolve remote hosts, only programs matching the\n"
          "    pattern, refresh every 5 seconds.\n\n"
          "note: -r does not match against resolved host names.\n";
}

void ArgumentParser::print_version(std::ostream& os) {
    os << "open-ports " << buildinfo::APP_VERSION
       << " (git=" << buildinfo::GIT_COMMIT
       << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
       << ", cxx_std=" << buildinfo::CXX_STANDARD
       << ", bare_format=" << buildinfo::BARE_FORMAT_VERSION << ")\n";
}

}
