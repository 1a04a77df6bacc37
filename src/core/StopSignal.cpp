#include "StopSignal.h"
#include "Logging.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

namespace open_ports {

static std::atomic<StopSignal*> g_stop_target{nullptr};

extern "C" void open_ports_on_signal(int) {
    StopSignal* t = g_stop_target.load();
    if(t) t->request();
}

bool StopSignal::sleep_for(std::chrono::milliseconds d) const {
    static const std::chrono::milliseconds slice(100);
    auto deadline = std::chrono::steady_clock::now() + d;
    while(!requested()) {
        auto now = std::chrono::steady_clock::now();
        if(now >= deadline) return true;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(left < slice ? left : slice);
    }
    return false;
}

void StopSignal::install_handlers() {
    g_stop_target.store(this);
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = open_ports_on_signal;
    sigemptyset(&sa.sa_mask);
    for(int sig : {SIGINT, SIGTERM}) {
        if(sigaction(sig, &sa, nullptr) != 0) Logger::instance().warn(std::string("sigaction failed: ") + strerror(errno));
    }
}

}
