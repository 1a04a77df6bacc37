#pragma once
#include <atomic>
#include <chrono>

namespace open_ports {

// Cooperative cancellation flag, settable from a signal handler.
class StopSignal {
public:
    void request() noexcept { flag_.store(true); }
    bool requested() const noexcept { return flag_.load(); }
    void reset() noexcept { flag_.store(false); }

    // Sleeps up to d in short slices. Returns false if a stop was requested.
    bool sleep_for(std::chrono::milliseconds d) const;

    // Routes SIGINT and SIGTERM to this instance.
    void install_handlers();

private:
    std::atomic<bool> flag_{false};
};

}
