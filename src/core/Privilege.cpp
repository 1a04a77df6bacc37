#include "Privilege.h"
#include "Logging.h"
#include <string>
#include <vector>
#include <unistd.h>
#ifdef OPEN_PORTS_HAVE_LIBCAP
#include <sys/capability.h>
#endif
#ifdef OPEN_PORTS_HAVE_SECCOMP
#include <seccomp.h>
#endif

namespace open_ports {

#ifdef OPEN_PORTS_HAVE_LIBCAP
static void log_capabilities(const std::string& context) {
    if(!Logger::instance().enabled(LogLevel::Debug)) return;
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }
    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    }
    cap_free(caps);
}
#endif

bool is_privilege_available(){
#ifdef OPEN_PORTS_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

bool is_seccomp_available(){
#ifdef OPEN_PORTS_HAVE_SECCOMP
    return true;
#else
    return false;
#endif
}

// Without CAP_DAC_READ_SEARCH (or root) other users' /proc/<pid>/fd become unreadable
// and their sockets lose the owning pid.
void drop_capabilities(bool keep_cap_dac){
#ifdef OPEN_PORTS_HAVE_LIBCAP
    Logger::instance().debug("Dropping capabilities (keep_cap_dac=" + std::string(keep_cap_dac ? "true" : "false") + ")");
    log_capabilities("before drop");
    cap_t caps = cap_get_proc();
    if(!caps){ Logger::instance().warn("cap_get_proc failed; capabilities unchanged"); return; }
    cap_clear(caps);
    if(keep_cap_dac){
        cap_value_t v = CAP_DAC_READ_SEARCH;
        cap_set_flag(caps, CAP_PERMITTED, 1, &v, CAP_SET);
        cap_set_flag(caps, CAP_EFFECTIVE, 1, &v, CAP_SET);
    }
    if(cap_set_proc(caps)!=0) Logger::instance().error("cap_set_proc failed");
    else log_capabilities("after drop");
    cap_free(caps);
#else
    (void)keep_cap_dac;
    Logger::instance().info("Capability dropping not available (libcap not compiled in)");
#endif
}

bool apply_seccomp_profile(bool allow_network){
#ifdef OPEN_PORTS_HAVE_SECCOMP
    static bool seccomp_applied = false;
    if (seccomp_applied) return true;

    Logger::instance().debug(std::string("Applying seccomp profile") + (allow_network ? " (dns)" : ""));
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_KILL);
    if(!ctx) {
        Logger::instance().error("Failed to initialize seccomp context");
        return false;
    }
    auto allow=[&](int call){ return seccomp_rule_add(ctx, SCMP_ACT_ALLOW, call, 0)==0; };
    std::vector<int> calls = {
        SCMP_SYS(read), SCMP_SYS(write), SCMP_SYS(writev), SCMP_SYS(open), SCMP_SYS(openat), SCMP_SYS(close),
        SCMP_SYS(fstat), SCMP_SYS(newfstatat), SCMP_SYS(statx), SCMP_SYS(lseek), SCMP_SYS(fcntl),
        SCMP_SYS(mmap), SCMP_SYS(mprotect), SCMP_SYS(munmap), SCMP_SYS(brk), SCMP_SYS(madvise),
        SCMP_SYS(rt_sigaction), SCMP_SYS(rt_sigprocmask), SCMP_SYS(rt_sigreturn),
        SCMP_SYS(getpid), SCMP_SYS(gettid), SCMP_SYS(clock_gettime), SCMP_SYS(nanosleep), SCMP_SYS(clock_nanosleep),
        SCMP_SYS(getrandom), SCMP_SYS(ioctl), SCMP_SYS(getdents64), SCMP_SYS(access), SCMP_SYS(faccessat),
        SCMP_SYS(readlink), SCMP_SYS(readlinkat), SCMP_SYS(getuid), SCMP_SYS(geteuid), SCMP_SYS(getgid), SCMP_SYS(getegid),
        SCMP_SYS(futex), SCMP_SYS(exit), SCMP_SYS(exit_group)
    };
    if(allow_network){
        // getnameinfo on its own threads
        std::vector<int> net = {
            SCMP_SYS(socket), SCMP_SYS(connect), SCMP_SYS(sendto), SCMP_SYS(sendmmsg), SCMP_SYS(recvfrom), SCMP_SYS(recvmsg),
            SCMP_SYS(poll), SCMP_SYS(ppoll), SCMP_SYS(bind), SCMP_SYS(getsockname), SCMP_SYS(setsockopt),
            SCMP_SYS(clone), SCMP_SYS(clone3), SCMP_SYS(set_robust_list), SCMP_SYS(rseq), SCMP_SYS(uname)
        };
        calls.insert(calls.end(), net.begin(), net.end());
    }
    for(int c: calls){
        if(!allow(c)){
            Logger::instance().error("Failed to allow syscall " + std::to_string(c) + " in seccomp");
            seccomp_release(ctx);
            return false;
        }
    }
    if(seccomp_load(ctx)!=0){
        Logger::instance().error("Failed to load seccomp profile");
        seccomp_release(ctx);
        return false;
    }
    seccomp_release(ctx);
    seccomp_applied = true;
    return true;
#else
    (void)allow_network;
    Logger::instance().info("Seccomp not available (not compiled in)");
    return true;
#endif
}
}
