#pragma once
#include "../core/Types.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace open_ports {

class StopSignal;

class HostResolver {
public:
    virtual ~HostResolver() = default;
    // Reverse lookup of a numeric address. nullopt when no name is known.
    virtual std::optional<std::string> reverse_lookup(const std::string& address) = 0;
};

using HostResolverPtr = std::shared_ptr<HostResolver>;

// getnameinfo(3) with NI_NAMEREQD through the host's resolver configuration.
class SystemHostResolver : public HostResolver {
public:
    std::optional<std::string> reverse_lookup(const std::string& address) override;
};

// Lookups still running, including ones an earlier call stopped waiting for.
using LookupCounter = std::shared_ptr<std::atomic<size_t>>;

struct ResolveOptions {
    std::chrono::milliseconds timeout{1000}; // per batch
    size_t max_parallel = 8;
    // Shared across calls so abandoned lookups keep counting against max_parallel.
    // Null means a counter private to the call.
    LookupCounter in_flight;
};

// Fills remote_host for records with a remote endpoint. Each unique address is
// looked up once; a batch waits at most timeout, late answers are dropped.
// No more than max_parallel lookups run at once; addresses that find no free
// slot stay numeric. Returns the number of addresses resolved.
size_t resolve_hosts(std::vector<UnifiedRecord>& records, const HostResolverPtr& resolver,
                     const ResolveOptions& opts, const StopSignal* stop = nullptr);

}
