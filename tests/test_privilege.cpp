#include <gtest/gtest.h>
#include "../src/core/Privilege.h"
#include "../src/core/Logging.h"
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/syscall.h>
#include <fcntl.h>

namespace open_ports {

// Privilege changes are process-wide; anything that applies them runs in a forked child
// that exits through the raw syscall so a loaded filter cannot trip on libc teardown.
class PrivilegeTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::instance().set_level(LogLevel::Error); }

    template <typename Fn>
    static int run_in_child(Fn fn) {
        pid_t pid = fork();
        if (pid == 0) syscall(SYS_exit, fn() ? 0 : 1);
        int status = 0;
        waitpid(pid, &status, 0);
        return status;
    }
};

TEST_F(PrivilegeTest, AvailabilityMatchesBuild) {
#ifdef OPEN_PORTS_HAVE_LIBCAP
    EXPECT_TRUE(is_privilege_available());
#else
    EXPECT_FALSE(is_privilege_available());
#endif
#ifdef OPEN_PORTS_HAVE_SECCOMP
    EXPECT_TRUE(is_seccomp_available());
#else
    EXPECT_FALSE(is_seccomp_available());
#endif
}

#ifndef OPEN_PORTS_HAVE_LIBCAP
TEST_F(PrivilegeTest, DropCapabilitiesIsNoOpWithoutLibcap) {
    EXPECT_NO_THROW(drop_capabilities(false));
    EXPECT_NO_THROW(drop_capabilities(true));
}
#endif

#ifndef OPEN_PORTS_HAVE_SECCOMP
TEST_F(PrivilegeTest, SeccompSucceedsWithoutLibseccomp) {
    EXPECT_TRUE(apply_seccomp_profile(false));
    EXPECT_TRUE(apply_seccomp_profile(true));
}
#endif

#ifdef OPEN_PORTS_HAVE_LIBCAP
TEST_F(PrivilegeTest, DropCapabilitiesInChild) {
    int status = run_in_child([] {
        drop_capabilities(true);
        drop_capabilities(false);
        return true;
    });
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
#endif

#ifdef OPEN_PORTS_HAVE_SECCOMP
TEST_F(PrivilegeTest, SeccompProfileLoadsInChild) {
    int status = run_in_child([] { return apply_seccomp_profile(false); });
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST_F(PrivilegeTest, SeccompProfileAllowsProcfsReads) {
    int status = run_in_child([] {
        if (!apply_seccomp_profile(false)) return false;
        char buf[64];
        long fd = syscall(SYS_openat, AT_FDCWD, "/proc/self/comm", O_RDONLY);
        if (fd < 0) return false;
        long n = syscall(SYS_read, fd, buf, sizeof(buf));
        syscall(SYS_close, fd);
        return n > 0;
    });
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST_F(PrivilegeTest, SeccompProfileIsAppliedOnce) {
    int status = run_in_child([] {
        bool first = apply_seccomp_profile(true);
        bool second = apply_seccomp_profile(false);
        return first && second;
    });
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
#endif

} // namespace open_ports
