#pragma once
#include "../core/Config.h"
#include "../core/Types.h"
#include <chrono>
#include <iosfwd>
#include <string>
#include <vector>

namespace open_ports {

class Presenter {
public:
    Presenter(OutputMode mode, bool listening_only) : mode_(mode), listening_only_(listening_only) {}

    void render(const std::vector<UnifiedRecord>& records, std::ostream& os,
                std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    // pid, program, proto, local_addr, local_port, remote_addr, remote_port, state; TAB separated.
    static std::string bare_line(const UnifiedRecord& r);
    static constexpr size_t kBareFieldCount = 8;

    // "addr:port", IPv6 in brackets; "addr:port (host)" when resolved.
    static std::string endpoint_text(const Endpoint& ep, const std::optional<std::string>& host = std::nullopt);
    // "19.10.26 14:03:00 (+02:00)" in local time.
    static std::string banner_time(std::chrono::system_clock::time_point tp);

private:
    void render_full(const std::vector<UnifiedRecord>& records, std::ostream& os,
                     std::chrono::system_clock::time_point now) const;
    void render_json(const std::vector<UnifiedRecord>& records, std::ostream& os,
                     std::chrono::system_clock::time_point now) const;

    OutputMode mode_;
    bool listening_only_;
};

}
