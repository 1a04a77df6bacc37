#include "Resolver.h"
#include "../core/Logging.h"
#include "../core/StopSignal.h"
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace open_ports {

std::optional<std::string> SystemHostResolver::reverse_lookup(const std::string& address) {
    struct sockaddr_storage ss{};
    socklen_t len = 0;
    auto* v4 = reinterpret_cast<struct sockaddr_in*>(&ss);
    auto* v6 = reinterpret_cast<struct sockaddr_in6*>(&ss);
    if (inet_pton(AF_INET, address.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        len = sizeof(*v4);
    } else if (inet_pton(AF_INET6, address.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        len = sizeof(*v6);
    } else {
        return std::nullopt;
    }

    char host[NI_MAXHOST];
    int rc = getnameinfo(reinterpret_cast<struct sockaddr*>(&ss), len, host, sizeof(host), nullptr, 0, NI_NAMEREQD);
    if (rc != 0) return std::nullopt;
    return std::string(host);
}

namespace {

// Result cell shared between the waiting caller and a lookup thread that may outlive it.
struct LookupSlot {
    std::string address;
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    std::optional<std::string> host;
};

bool reserve(std::atomic<size_t>& in_flight, size_t cap) {
    size_t cur = in_flight.load();
    while (cur < cap) {
        if (in_flight.compare_exchange_weak(cur, cur + 1)) return true;
    }
    return false;
}

// The caller has already reserved a slot in in_flight; the lookup releases it.
std::shared_ptr<LookupSlot> start_lookup(const HostResolverPtr& resolver, const std::string& address,
                                         const LookupCounter& in_flight) {
    auto slot = std::make_shared<LookupSlot>();
    slot->address = address;
    try {
        std::thread([resolver, slot, in_flight]() {
            std::optional<std::string> host;
            try {
                host = resolver->reverse_lookup(slot->address);
            } catch (const std::exception&) {
                host.reset(); // treated as unresolved
            }
            std::lock_guard<std::mutex> lock(slot->mutex);
            slot->host = std::move(host);
            --*in_flight;
            slot->done = true;
            slot->cv.notify_all();
        }).detach();
    } catch (const std::system_error& ex) {
        Logger::instance().warn(std::string("dns: cannot start lookup thread: ") + ex.what());
        std::lock_guard<std::mutex> lock(slot->mutex);
        --*in_flight;
        slot->done = true;
    }
    return slot;
}

// Waits for the slot until deadline, checking stop every 100ms.
bool wait_for(LookupSlot& slot, std::chrono::steady_clock::time_point deadline, const StopSignal* stop) {
    static const std::chrono::milliseconds slice(100);
    std::unique_lock<std::mutex> lock(slot.mutex);
    while (!slot.done) {
        if (stop && stop->requested()) return false;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        std::chrono::steady_clock::time_point until = now + slice;
        if (deadline < until) until = deadline;
        slot.cv.wait_until(lock, until, [&]{ return slot.done; });
    }
    return true;
}

bool stopped(const StopSignal* stop) { return stop && stop->requested(); }

}

size_t resolve_hosts(std::vector<UnifiedRecord>& records, const HostResolverPtr& resolver,
                     const ResolveOptions& opts, const StopSignal* stop) {
    if (!resolver) return 0;

    std::vector<std::string> pending;
    std::unordered_set<std::string> seen;
    for (const auto& r : records) {
        if (r.remote && seen.insert(r.remote->address).second) pending.push_back(r.remote->address);
    }

    size_t cap = opts.max_parallel ? opts.max_parallel : 1;
    LookupCounter in_flight = opts.in_flight ? opts.in_flight : std::make_shared<std::atomic<size_t>>(0);
    std::unordered_map<std::string, std::string> names;
    size_t timed_out = 0;
    size_t next = 0;
    while (next < pending.size() && !stopped(stop)) {
        std::vector<std::shared_ptr<LookupSlot>> batch;
        while (next < pending.size() && reserve(*in_flight, cap)) {
            batch.push_back(start_lookup(resolver, pending[next++], in_flight));
        }
        if (batch.empty()) break; // every slot held by lookups from earlier batches

        auto deadline = std::chrono::steady_clock::now() + opts.timeout;
        for (auto& slot : batch) {
            if (!wait_for(*slot, deadline, stop)) {
                if (stopped(stop)) break;
                ++timed_out;
                continue;
            }
            if (slot->host && !slot->host->empty() && *slot->host != slot->address) names[slot->address] = *slot->host;
        }
    }

    if (timed_out) Logger::instance().debug("dns: " + std::to_string(timed_out) + " lookups timed out");
    if (next < pending.size()) {
        Logger::instance().debug("dns: " + std::to_string(pending.size() - next) + " addresses left numeric");
    }
    for (auto& r : records) {
        if (!r.remote) continue;
        auto it = names.find(r.remote->address);
        if (it != names.end()) r.remote_host = it->second;
    }
    return names.size();
}

}
