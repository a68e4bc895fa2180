#include <gtest/gtest.h>
#include <platform/process.hpp>
#include <platform/platform.hpp>
#include <cerrno>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

using platform::ProcessHandle;
using platform::spawn;

TEST(Process, ExitCodeIsReported) {
    auto p = spawn("/bin/sh", {"-c", "exit 3"});
    ASSERT_TRUE(p.valid());
    auto code = p.wait(5000);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 3);
    EXPECT_FALSE(p.running());
}

TEST(Process, StdinPayloadReachesChild) {
    auto p = spawn("/bin/sh", {"-c", "read line; test \"$line\" = hello"}, "", "hello\n");
    ASSERT_TRUE(p.valid());
    EXPECT_EQ(p.wait(5000), 0);
}

TEST(Process, ParentDescriptorsAreNotInherited) {
    int fd = open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);
    ASSERT_EQ(dup2(fd, 200), 200);
    close(fd);

    auto p = spawn("/bin/sh", {"-c", "test -e /proc/self/fd/200 && exit 1; exit 0"});
    ASSERT_TRUE(p.valid());
    EXPECT_EQ(p.wait(5000), 0);
    close(200);
}

TEST(Process, MoveAssignmentReapsTheReplacedChild) {
    auto first = spawn("sleep", {"30"});
    ASSERT_TRUE(first.valid());
    int old_pid = first.native_handle();

    first = spawn("/bin/sh", {"-c", "exit 0"});
    ASSERT_TRUE(first.valid());
    EXPECT_NE(first.native_handle(), old_pid);

    // Gone and reaped: not even a zombie remains
    errno = 0;
    EXPECT_EQ(kill(old_pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
    EXPECT_EQ(first.wait(5000), 0);
}

TEST(Process, TerminateStopsARunningChild) {
    auto p = spawn("sleep", {"30"});
    ASSERT_TRUE(p.valid());
    EXPECT_TRUE(p.running());
    p.terminate(1000);
    EXPECT_FALSE(p.running());
    EXPECT_EQ(p.poll_exit(), 128 + SIGTERM);
}
