#include "ProcfsSource.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <dirent.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <vector>

namespace open_ports {

// Fast PID validation
static inline bool is_valid_pid(const char* str, pid_t* pid_out = nullptr) {
    if (!str || !*str) return false;
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*endptr != '\0' || val <= 0 || val > INT_MAX) return false;
    if (pid_out) *pid_out = static_cast<pid_t>(val);
    return true;
}

// Fast file reading with fixed buffer (EINTR-safe)
static ssize_t read_file_to_buffer(const std::string& path, char* buffer, size_t buffer_size) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) return -1;

    ssize_t total_read = 0;
    while (total_read < static_cast<ssize_t>(buffer_size)) {
        ssize_t bytes_read;
        do {
            bytes_read = read(fd, buffer + total_read, buffer_size - total_read);
        } while (bytes_read == -1 && errno == EINTR);

        if (bytes_read <= 0) break;
        total_read += bytes_read;
    }
    close(fd);
    return total_read;
}

static bool parse_hex_u32(const std::string& s, uint32_t& out) {
    if (s.size() != 8) return false;
    char* end = nullptr;
    unsigned long v = strtoul(s.c_str(), &end, 16);
    if (!end || *end != '\0') return false;
    out = static_cast<uint32_t>(v);
    return true;
}

std::optional<Endpoint> ProcfsSource::parse_hex_endpoint(const std::string& field, bool ipv6) {
    auto colon = field.find(':');
    if (colon == std::string::npos) return std::nullopt;
    std::string addr_hex = field.substr(0, colon);
    std::string port_hex = field.substr(colon + 1);
    if (port_hex.empty() || port_hex.size() > 4) return std::nullopt;

    char* end = nullptr;
    unsigned long port = strtoul(port_hex.c_str(), &end, 16);
    if (!end || *end != '\0' || port > 0xFFFF) return std::nullopt;

    // The kernel prints each 32-bit word of the address in host byte order.
    char buf[INET6_ADDRSTRLEN] = "";
    if (ipv6) {
        if (addr_hex.size() != 32) return std::nullopt;
        struct in6_addr a6{};
        for (int i = 0; i < 4; ++i) {
            uint32_t word;
            if (!parse_hex_u32(addr_hex.substr(i * 8, 8), word)) return std::nullopt;
            memcpy(&a6.s6_addr[i * 4], &word, sizeof(word));
        }
        if (!inet_ntop(AF_INET6, &a6, buf, sizeof(buf))) return std::nullopt;
    } else {
        struct in_addr a4{};
        uint32_t word;
        if (!parse_hex_u32(addr_hex, word)) return std::nullopt;
        memcpy(&a4.s_addr, &word, sizeof(word));
        if (!inet_ntop(AF_INET, &a4, buf, sizeof(buf))) return std::nullopt;
    }

    Endpoint ep;
    ep.address = buf;
    ep.port = static_cast<uint16_t>(port);
    return ep;
}

static bool is_unspecified(const Endpoint& ep) {
    return ep.port == 0 && (ep.address == "0.0.0.0" || ep.address == "::");
}

std::optional<Connection> ProcfsSource::parse_net_line(const std::string& line, Protocol proto) {
    // sl local_address rem_address st tx:rx tr:tm retrnsmt uid timeout inode ...
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok && tokens.size() < 10) tokens.push_back(tok);
    if (tokens.size() < 10) return std::nullopt;
    if (tokens[0].empty() || tokens[0].back() != ':') return std::nullopt; // header row

    bool ipv6 = proto == Protocol::Tcp6 || proto == Protocol::Udp6;
    auto local = parse_hex_endpoint(tokens[1], ipv6);
    auto remote = parse_hex_endpoint(tokens[2], ipv6);
    if (!local || !remote) return std::nullopt;

    char* end = nullptr;
    unsigned long inode = strtoul(tokens[9].c_str(), &end, 10);
    if (!end || *end != '\0') return std::nullopt;

    Connection c;
    c.protocol = proto;
    c.local = *local;
    if (!is_unspecified(*remote)) c.remote = *remote;
    c.inode = inode;
    ConnState st = tcp_state_from_hex(tokens[3]);
    if (is_udp(proto)) {
        c.state = st == ConnState::Established ? ConnState::Established : ConnState::None;
    } else {
        c.state = st;
    }
    return c;
}

std::string ProcfsSource::choose_process_name(const std::string& comm, const std::string& argv0) {
    if (comm.size() < 15 || argv0.empty()) return comm;
    std::string base = argv0;
    auto slash = base.rfind('/');
    if (slash != std::string::npos) base = base.substr(slash + 1);
    if (base.size() > comm.size() && base.compare(0, comm.size(), comm) == 0) return base;
    return comm;
}

std::optional<std::string> ProcfsSource::read_process_name(pid_t pid) const {
    std::string base = root_ + "/" + std::to_string(pid);
    char buf[256];
    ssize_t n = read_file_to_buffer(base + "/comm", buf, sizeof(buf) - 1);
    if (n <= 0) return std::nullopt; // exited or hidden
    buf[n] = '\0';
    std::string comm(buf);
    while (!comm.empty() && (comm.back() == '\n' || comm.back() == '\r')) comm.pop_back();
    if (comm.empty()) return std::nullopt;

    std::string argv0;
    if (comm.size() >= 15) {
        char cmd[4096];
        ssize_t m = read_file_to_buffer(base + "/cmdline", cmd, sizeof(cmd) - 1);
        if (m > 0) { cmd[m] = '\0'; argv0 = cmd; } // first NUL ends argv[0]
    }
    return choose_process_name(comm, argv0);
}

std::unordered_map<unsigned long, pid_t> ProcfsSource::build_inode_map(std::vector<pid_t>& pids, Snapshot& snap) const {
    std::unordered_map<unsigned long, pid_t> inodes;
    DIR* dir = opendir(root_.c_str());
    if (!dir) {
        snap.warnings.push_back("cannot list " + root_ + ": " + strerror(errno));
        return inodes;
    }

    static const char socket_prefix[] = "socket:[";
    struct dirent* entry;
    size_t unreadable = 0;
    while ((entry = readdir(dir)) != nullptr) {
        pid_t pid;
        if (!is_valid_pid(entry->d_name, &pid)) continue;
        pids.push_back(pid);

        std::string fd_path = root_ + "/" + entry->d_name + "/fd";
        DIR* fd_dir = opendir(fd_path.c_str());
        if (!fd_dir) { ++unreadable; continue; } // EACCES or the process already exited

        struct dirent* fd_entry;
        while ((fd_entry = readdir(fd_dir)) != nullptr) {
            if (fd_entry->d_name[0] == '.') continue;
            std::string link = fd_path + "/" + fd_entry->d_name;
            char target[128];
            ssize_t len = readlink(link.c_str(), target, sizeof(target) - 1);
            if (len <= 0) continue;
            target[len] = '\0';
            if (strncmp(target, socket_prefix, sizeof(socket_prefix) - 1) != 0) continue;

            char* end = nullptr;
            unsigned long inode = strtoul(target + sizeof(socket_prefix) - 1, &end, 10);
            if (!end || *end != ']') continue;
            auto it = inodes.find(inode);
            if (it == inodes.end() || pid < it->second) inodes[inode] = pid;
        }
        closedir(fd_dir);
    }
    closedir(dir);

    if (unreadable) Logger::instance().debug("fd tables unreadable for " + std::to_string(unreadable) + " processes");
    return inodes;
}

bool ProcfsSource::read_net_table(const char* file, Protocol proto, Snapshot& snap) const {
    std::string path = root_ + "/net/" + file;
    FILE* fp = fopen(path.c_str(), "re");
    if (!fp) {
        snap.warnings.push_back("cannot read " + path + ": " + strerror(errno));
        return false;
    }

    char line[512];
    bool header_skipped = false;
    size_t malformed = 0;
    while (fgets(line, sizeof(line), fp)) {
        if (!header_skipped) { header_skipped = true; continue; }
        auto conn = parse_net_line(line, proto);
        if (!conn) { ++malformed; continue; }
        snap.connections.push_back(std::move(*conn));
    }
    fclose(fp);

    if (malformed) snap.warnings.push_back(path + ": skipped " + std::to_string(malformed) + " malformed rows");
    return true;
}

Snapshot ProcfsSource::snapshot() {
    Snapshot snap;
    static const struct { const char* file; Protocol proto; } tables[] = {
        {"tcp", Protocol::Tcp}, {"tcp6", Protocol::Tcp6}, {"udp", Protocol::Udp}, {"udp6", Protocol::Udp6}
    };

    size_t readable = 0;
    for (const auto& t : tables) {
        if (read_net_table(t.file, t.proto, snap)) ++readable;
    }
    if (readable == 0) throw EnumerationError("cannot read any connection table under " + root_ + "/net");

    std::vector<pid_t> pids;
    auto inodes = build_inode_map(pids, snap);
    for (auto& c : snap.connections) {
        auto it = inodes.find(c.inode);
        if (it != inodes.end()) c.pid = it->second;
    }

    snap.processes.reserve(pids.size());
    for (pid_t pid : pids) {
        Process p;
        p.pid = pid;
        p.name = read_process_name(pid);
        snap.processes.push_back(std::move(p));
    }

    for (const auto& w : snap.warnings) Logger::instance().debug(name() + ": " + w);
    return snap;
}

}
