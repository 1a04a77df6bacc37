#include "Correlator.h"
#include <unordered_map>

namespace open_ports {

std::vector<UnifiedRecord> correlate(const Snapshot& snapshot) {
    std::unordered_map<pid_t, const std::optional<std::string>*> names;
    names.reserve(snapshot.processes.size());
    for (const auto& p : snapshot.processes) names.emplace(p.pid, &p.name);

    std::vector<UnifiedRecord> out;
    out.reserve(snapshot.connections.size());
    for (const auto& c : snapshot.connections) {
        UnifiedRecord r;
        r.protocol = c.protocol;
        r.local = c.local;
        r.remote = c.remote;
        r.state = c.state;
        r.pid = c.pid;
        if (c.pid) {
            auto it = names.find(*c.pid);
            if (it != names.end()) r.program = *it->second;
        }
        out.push_back(std::move(r));
    }
    return out;
}

}
