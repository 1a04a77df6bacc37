#include "Types.h"
#include <cstring>
#include <strings.h>

namespace open_ports {

const char* protocol_name(Protocol p) {
    switch(p) {
        case Protocol::Tcp: return "tcp";
        case Protocol::Tcp6: return "tcp6";
        case Protocol::Udp: return "udp";
        case Protocol::Udp6: return "udp6";
    }
    return "?";
}

const char* state_name(ConnState s) {
    switch(s) {
        case ConnState::Established: return "ESTABLISHED";
        case ConnState::SynSent: return "SYN_SENT";
        case ConnState::SynRecv: return "SYN_RECV";
        case ConnState::FinWait1: return "FIN_WAIT1";
        case ConnState::FinWait2: return "FIN_WAIT2";
        case ConnState::TimeWait: return "TIME_WAIT";
        case ConnState::Close: return "CLOSE";
        case ConnState::CloseWait: return "CLOSE_WAIT";
        case ConnState::LastAck: return "LAST_ACK";
        case ConnState::Listen: return "LISTEN";
        case ConnState::Closing: return "CLOSING";
        case ConnState::None: return "NONE";
        case ConnState::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

bool is_udp(Protocol p) { return p == Protocol::Udp || p == Protocol::Udp6; }

ConnState tcp_state_from_hex(const std::string& hex) {
    static const struct { const char* hex; ConnState state; } states[] = {
        {"01", ConnState::Established}, {"02", ConnState::SynSent}, {"03", ConnState::SynRecv},
        {"04", ConnState::FinWait1}, {"05", ConnState::FinWait2}, {"06", ConnState::TimeWait},
        {"07", ConnState::Close}, {"08", ConnState::CloseWait}, {"09", ConnState::LastAck},
        {"0A", ConnState::Listen}, {"0B", ConnState::Closing}
    };
    for(const auto& s : states) {
        if(strcasecmp(hex.c_str(), s.hex) == 0) return s.state;
    }
    return ConnState::Unknown;
}

}
