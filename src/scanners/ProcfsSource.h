#pragma once
#include "SnapshotSource.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace open_ports {

class ProcfsSource : public SnapshotSource {
public:
    explicit ProcfsSource(std::string proc_root = "/proc") : root_(std::move(proc_root)) {}

    std::string name() const override { return "procfs"; }
    Snapshot snapshot() override;

    const std::string& root() const { return root_; }

    // Parses one data row of /proc/net/{tcp,tcp6,udp,udp6}. Returns nullopt for headers and malformed rows.
    static std::optional<Connection> parse_net_line(const std::string& line, Protocol proto);
    // "0100007F:1F90" -> {127.0.0.1, 8080}; IPv6 rows carry 32 hex digits.
    static std::optional<Endpoint> parse_hex_endpoint(const std::string& field, bool ipv6);
    // Picks the display name from comm and the first cmdline argument (comm is cut at 15 chars).
    static std::string choose_process_name(const std::string& comm, const std::string& argv0);

private:
    // socket inode -> lowest pid holding it
    std::unordered_map<unsigned long, pid_t> build_inode_map(std::vector<pid_t>& pids, Snapshot& snap) const;
    std::optional<std::string> read_process_name(pid_t pid) const;
    bool read_net_table(const char* file, Protocol proto, Snapshot& snap) const;

    std::string root_;
};

}
