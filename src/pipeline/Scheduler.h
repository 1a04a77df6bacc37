#pragma once
#include "../core/Config.h"
#include <chrono>
#include <cstddef>
#include <iosfwd>

namespace open_ports {

class Pipeline;
class StopSignal;

// Runs the pipeline once, or every cfg.continuous_seconds until stop is requested.
// Each cycle is rendered to a buffer and written whole; a cycle interrupted
// before rendering is discarded.
class Scheduler {
public:
    Scheduler(const Pipeline& pipeline, StopSignal& stop, std::ostream& out)
        : pipeline_(pipeline), stop_(stop), out_(out) {}

    // Returns the number of cycles written. Propagates EnumerationError.
    size_t run(Config cfg);

    static std::chrono::milliseconds interval(const Config& cfg);

private:
    bool run_cycle(const Config& cfg, size_t index);

    const Pipeline& pipeline_;
    StopSignal& stop_;
    std::ostream& out_;
};

}
