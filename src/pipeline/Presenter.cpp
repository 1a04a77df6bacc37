#include "Presenter.h"
#include "../core/JsonUtil.h"
#include <netdb.h>
#include <netinet/in.h>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace open_ports {
namespace {

const char* kMissing = "-";
const char* kUnknownProgram = "<unknown>";
const size_t kMinProgramWidth = 16;

// TAB, newlines and other control bytes become '?' so one record stays one line
// and bare output keeps its field count.
std::string printable(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7f) c = '?';
    }
    return out;
}

std::string service_name(uint16_t port, Protocol proto) {
    struct servent* se = getservbyport(htons(port), is_udp(proto) ? "udp" : "tcp");
    return se && se->s_name ? std::string(se->s_name) : std::string();
}

std::string center(const std::string& text, size_t width, char fill) {
    if (text.size() >= width) return text;
    size_t left = (width - text.size()) / 2;
    return std::string(left, fill) + text + std::string(width - text.size() - left, fill);
}

struct Row {
    std::string pid, program, proto, local, remote, state, service;
};

Row make_row(const UnifiedRecord& r) {
    Row row;
    row.pid = r.pid ? std::to_string(*r.pid) : kMissing;
    row.program = r.program ? printable(*r.program) : kUnknownProgram;
    row.proto = protocol_name(r.protocol);
    row.local = Presenter::endpoint_text(r.local);
    row.remote = r.remote ? Presenter::endpoint_text(*r.remote, r.remote_host) : "";
    row.state = state_name(r.state);
    row.service = service_name(r.local.port, r.protocol);
    return row;
}

} // namespace

std::string Presenter::endpoint_text(const Endpoint& ep, const std::optional<std::string>& host) {
    std::string s = ep.address.find(':') != std::string::npos ? "[" + ep.address + "]" : ep.address;
    s += ":" + std::to_string(ep.port);
    if (host) s += " (" + printable(*host) + ")";
    return s;
}

std::string Presenter::banner_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm lt{};
    localtime_r(&t, &lt);
    char stamp[32], zone[8];
    strftime(stamp, sizeof(stamp), "%y.%m.%d %H:%M:%S", &lt);
    strftime(zone, sizeof(zone), "%z", &lt); // +hhmm
    std::string z = zone;
    if (z.size() == 5) z = z.substr(0, 3) + ":" + z.substr(3);
    return std::string(stamp) + " (" + z + ")";
}

std::string Presenter::bare_line(const UnifiedRecord& r) {
    std::ostringstream os;
    os << (r.pid ? std::to_string(*r.pid) : kMissing) << '\t'
       << (r.program ? printable(*r.program) : kMissing) << '\t'
       << protocol_name(r.protocol) << '\t'
       << r.local.address << '\t'
       << r.local.port << '\t';
    if (r.remote) {
        os << (r.remote_host ? printable(*r.remote_host) : r.remote->address) << '\t' << r.remote->port << '\t';
    } else {
        os << kMissing << '\t' << kMissing << '\t';
    }
    os << state_name(r.state);
    return os.str();
}

void Presenter::render(const std::vector<UnifiedRecord>& records, std::ostream& os,
                       std::chrono::system_clock::time_point now) const {
    switch (mode_) {
        case OutputMode::Bare:
            for (const auto& r : records) os << bare_line(r) << '\n';
            break;
        case OutputMode::Json:
            render_json(records, os, now);
            break;
        case OutputMode::Full:
            render_full(records, os, now);
            break;
    }
}

void Presenter::render_full(const std::vector<UnifiedRecord>& records, std::ostream& os,
                            std::chrono::system_clock::time_point now) const {
    std::vector<Row> listening, other;
    for (const auto& r : records) (r.state == ConnState::Listen ? listening : other).push_back(make_row(r));
    if (listening_only_) other.clear();
    if (listening.empty() && other.empty()) { os << "No matching connections.\n"; return; }

    Row header{"PID", "Program", "Proto", "Local Address:Port", "Remote Address:Port", "State", "Service"};
    size_t w_pid = header.pid.size(), w_prog = kMinProgramWidth, w_proto = header.proto.size();
    size_t w_local = header.local.size(), w_remote = header.remote.size(), w_state = header.state.size();
    for (const auto* rows : {&listening, &other}) {
        for (const auto& row : *rows) {
            w_pid = std::max(w_pid, row.pid.size());
            w_prog = std::max(w_prog, row.program.size());
            w_proto = std::max(w_proto, row.proto.size());
            w_local = std::max(w_local, row.local.size());
            w_remote = std::max(w_remote, row.remote.size());
            w_state = std::max(w_state, row.state.size());
        }
    }

    auto line = [&](const Row& row) {
        std::ostringstream ls;
        ls << std::left
           << std::setw(static_cast<int>(w_pid)) << row.pid << "  "
           << std::setw(static_cast<int>(w_prog)) << row.program << "  "
           << std::setw(static_cast<int>(w_proto)) << row.proto << "  "
           << std::setw(static_cast<int>(w_local)) << row.local << "  "
           << std::setw(static_cast<int>(w_remote)) << row.remote << "  "
           << std::setw(static_cast<int>(w_state)) << row.state << "  "
           << row.service;
        std::string s = ls.str();
        while (!s.empty() && s.back() == ' ') s.pop_back();
        return s;
    };

    std::string header_line = line(header);
    size_t width = header_line.size();
    for (const auto* rows : {&listening, &other})
        for (const auto& row : *rows) width = std::max(width, line(row).size());

    bool header_done = false;
    auto section = [&](const char* title, const std::vector<Row>& rows) {
        if (rows.empty()) return;
        if (header_done) os << '\n';
        os << center(std::string(title) + " (" + banner_time(now) + ")", width, '-') << '\n';
        if (!header_done) {
            os << header_line << '\n' << std::string(width, '-') << '\n';
            header_done = true;
        }
        for (const auto& row : rows) os << line(row) << '\n';
    };
    section("LISTENING", listening);
    section("NON-LISTENING", other);
}

void Presenter::render_json(const std::vector<UnifiedRecord>& records, std::ostream& os,
                            std::chrono::system_clock::time_point now) const {
    using jsonutil::escape;
    auto str_or_null = [](const std::optional<std::string>& v){ return v ? "\"" + escape(*v) + "\"" : std::string("null"); };

    os << "{\"generated_at\":\"" << jsonutil::time_to_iso(now) << "\",\"count\":" << records.size() << ",\"connections\":[";
    bool first = true;
    for (const auto& r : records) {
        if (!first) os << ',';
        first = false;
        os << "{\"pid\":" << (r.pid ? std::to_string(*r.pid) : "null")
           << ",\"program\":" << str_or_null(r.program)
           << ",\"proto\":\"" << protocol_name(r.protocol) << "\""
           << ",\"local_address\":\"" << escape(r.local.address) << "\""
           << ",\"local_port\":" << r.local.port
           << ",\"remote_address\":" << (r.remote ? "\"" + escape(r.remote->address) + "\"" : std::string("null"))
           << ",\"remote_port\":" << (r.remote ? std::to_string(r.remote->port) : std::string("null"))
           << ",\"remote_host\":" << str_or_null(r.remote_host)
           << ",\"state\":\"" << state_name(r.state) << "\"}";
    }
    os << "]}\n";
}

}
