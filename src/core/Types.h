#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace open_ports {

enum class Protocol { Tcp, Tcp6, Udp, Udp6 };

enum class ConnState {
    Established, SynSent, SynRecv, FinWait1, FinWait2, TimeWait,
    Close, CloseWait, LastAck, Listen, Closing,
    None,    // connectionless UDP
    Unknown
};

const char* protocol_name(Protocol p);
const char* state_name(ConnState s);
bool is_udp(Protocol p);

// Maps the two-digit hex `st` column of /proc/net/tcp to a state.
ConnState tcp_state_from_hex(const std::string& hex);

struct Endpoint {
    std::string address; // numeric form
    uint16_t port = 0;
};

struct Connection {
    Protocol protocol = Protocol::Tcp;
    Endpoint local;
    std::optional<Endpoint> remote; // absent for listening / unconnected sockets
    ConnState state = ConnState::Unknown;
    unsigned long inode = 0;
    std::optional<pid_t> pid; // absent when the owning fd table was unreadable
};

struct Process {
    pid_t pid = 0;
    std::optional<std::string> name; // absent on permission denial or exit mid-scan
};

// One enumeration pass: raw connections and processes plus non-fatal collection issues.
struct Snapshot {
    std::vector<Connection> connections;
    std::vector<Process> processes;
    std::vector<std::string> warnings;
};

struct UnifiedRecord {
    Protocol protocol = Protocol::Tcp;
    Endpoint local;
    std::optional<Endpoint> remote;
    ConnState state = ConnState::Unknown;
    std::optional<pid_t> pid;
    std::optional<std::string> program;
    std::optional<std::string> remote_host; // reverse DNS, only when resolved
};

}
