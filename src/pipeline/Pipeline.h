#pragma once
#include "../core/Config.h"
#include "../core/Types.h"
#include "../scanners/SnapshotSource.h"
#include "Resolver.h"
#include <atomic>
#include <memory>
#include <vector>

namespace open_ports {

class StopSignal;

// One scan cycle: enumerate -> correlate -> filter -> resolve -> sort.
// Holds no state between cycles.
class Pipeline {
public:
    explicit Pipeline(SnapshotSourcePtr source, HostResolverPtr resolver = nullptr)
        : source_(std::move(source)), resolver_(std::move(resolver)),
          dns_in_flight_(std::make_shared<std::atomic<size_t>>(0)) {}

    // Throws EnumerationError when the source cannot enumerate at all.
    std::vector<UnifiedRecord> run(const Config& cfg, const StopSignal* stop = nullptr) const;

private:
    SnapshotSourcePtr source_;
    HostResolverPtr resolver_;
    LookupCounter dns_in_flight_; // outlives cycles; lookups abandoned by one cycle still count in the next
};

}
