#include "Scheduler.h"
#include "Pipeline.h"
#include "Presenter.h"
#include "../core/Logging.h"
#include "../core/StopSignal.h"
#include <ostream>
#include <sstream>

namespace open_ports {

std::chrono::milliseconds Scheduler::interval(const Config& cfg) {
    return std::chrono::milliseconds(1000LL * cfg.continuous_seconds.value_or(0));
}

bool Scheduler::run_cycle(const Config& cfg, size_t index) {
    auto records = pipeline_.run(cfg, &stop_);
    if (stop_.requested()) return false;

    std::ostringstream buf;
    if (index > 0 && cfg.output == OutputMode::Full) buf << '\n';
    Presenter(cfg.output, cfg.listening_only).render(records, buf);
    out_ << buf.str() << std::flush;
    return true;
}

size_t Scheduler::run(Config cfg) {
    size_t cycles = 0;
    if (!cfg.continuous_seconds) {
        if (run_cycle(cfg, 0)) ++cycles;
        return cycles;
    }

    auto period = interval(cfg);
    Logger::instance().debug("continuous mode, interval " + std::to_string(period.count()) + "ms");
    while (!stop_.requested()) {
        if (!run_cycle(cfg, cycles)) break;
        ++cycles;
        if (!stop_.sleep_for(period)) break;
    }
    return cycles;
}

}
