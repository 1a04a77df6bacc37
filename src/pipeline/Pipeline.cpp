#include "Pipeline.h"
#include "Correlator.h"
#include "FilterEngine.h"
#include "Sorter.h"
#include "../core/Logging.h"

namespace open_ports {

std::vector<UnifiedRecord> Pipeline::run(const Config& cfg, const StopSignal* stop) const {
    FilterOptions fo;
    fo.listening_only = cfg.listening_only;
    fo.proto = cfg.proto;
    fo.pattern = cfg.regex;
    FilterEngine filter(fo);

    Snapshot snap = source_->snapshot();
    Logger::instance().debug(source_->name() + ": " + std::to_string(snap.connections.size()) + " sockets, "
                             + std::to_string(snap.processes.size()) + " processes");

    auto records = filter.apply(correlate(snap));

    if (cfg.dns && resolver_) {
        ResolveOptions ro;
        ro.timeout = std::chrono::milliseconds(cfg.dns_timeout_ms);
        ro.max_parallel = static_cast<size_t>(cfg.dns_parallel);
        ro.in_flight = dns_in_flight_;
        size_t n = resolve_hosts(records, resolver_, ro, stop);
        Logger::instance().debug("dns: resolved " + std::to_string(n) + " addresses");
    }

    sort_records(records, cfg.sort_key);
    return records;
}

}
