#pragma once
#include <string>
#include <optional>

namespace open_ports {

enum class SortKey { Pid, Port, Program };
enum class OutputMode { Full, Bare, Json };

struct Config {
    SortKey sort_key = SortKey::Program;
    std::string sort_name; // raw --sort value, validated into sort_key
    bool sort_by_pid = false; // -i/--pid, overrides --sort
    bool sort_by_port = false; // -p/--port, overrides --sort
    bool bare = false;
    bool json = false;
    OutputMode output = OutputMode::Full; // derived from bare/json by the validator
    bool listening_only = false;
    std::string proto; // "tcp" | "udp" | empty=both
    std::optional<std::string> regex; // process-name-or-port pattern
    bool dns = false;
    int dns_timeout_ms = 1000; // bound per batch of lookups
    int dns_parallel = 8; // concurrent lookups per batch
    std::optional<int> continuous_seconds; // unset = single shot
    std::string proc_root = "/proc";
    std::string log_level; // empty = CLI default
    bool verbose = false;
    bool drop_priv = false;
    bool keep_cap_dac = false;
    bool seccomp = false;
    bool seccomp_strict = false;
};

const char* sort_key_name(SortKey key);
// Case-insensitive: "pid", "port", "program".
bool parse_sort_key(const std::string& name, SortKey& out);

}
