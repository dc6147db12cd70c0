/**
 * @file test_process_launcher.cpp
 * @brief Unit tests for the posix_spawn-based engine launcher.
 */

#include "executor/process_launcher.hpp"

#include <gtest/gtest.h>
#include <pthread.h>
#include <signal.h>

#include <filesystem>
#include <initializer_list>
#include <string>

using namespace tracie;

TEST(PosixProcessLauncherTest, SuccessfulCommand) {
    PosixProcessLauncher launcher;
    auto result = launcher.run(EngineCommand{"/bin/sh", {"-c", "echo ignored; exit 0"}});
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_TRUE(result->succeeded());
    // stdout goes to /dev/null, never into the diagnostics
    EXPECT_TRUE(result->stderr_output.empty());
}

TEST(PosixProcessLauncherTest, NonZeroExitCapturesStderr) {
    PosixProcessLauncher launcher;
    auto result = launcher.run(EngineCommand{"/bin/sh", {"-c", "echo 'input missing' >&2; exit 3"}});
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_FALSE(result->succeeded());
    EXPECT_EQ(result->exit_code, 3);
    EXPECT_EQ(result->stderr_output, "input missing\n");
}

TEST(PosixProcessLauncherTest, ResolvesExecutableFromPath) {
    PosixProcessLauncher launcher;
    auto result = launcher.run(EngineCommand{"sh", {"-c", "exit 0"}});
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_TRUE(result->succeeded());
}

TEST(PosixProcessLauncherTest, SignalledChildReportsSignal) {
    PosixProcessLauncher launcher;
    auto result = launcher.run(EngineCommand{"/bin/sh", {"-c", "kill -TERM $$"}});
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->exit_code, 128 + 15);
}

TEST(PosixProcessLauncherTest, MissingExecutableIsEngineNotFound) {
    PosixProcessLauncher launcher;
    auto result = launcher.run(EngineCommand{"tracie-no-such-engine", {"jar", "x.jar", "pi"}});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::EngineNotFound);
}

TEST(PosixProcessLauncherTest, LargeStderrDoesNotDeadlock) {
    PosixProcessLauncher launcher;
    // Well beyond a pipe buffer.
    auto result = launcher.run(EngineCommand{
        "/bin/sh", {"-c", "i=0; while [ $i -lt 5000 ]; do echo line-$i >&2; i=$((i+1)); done; exit 1"}});
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->exit_code, 1);
    EXPECT_GT(result->stderr_output.size(), 30000u);
}

namespace {

/// Blocks the given signals in the calling thread for the scope's lifetime.
class ScopedSignalBlock {
public:
    explicit ScopedSignalBlock(std::initializer_list<int> signals) {
        sigset_t set;
        sigemptyset(&set);
        for (int sig : signals) sigaddset(&set, sig);
        pthread_sigmask(SIG_BLOCK, &set, &previous_);
    }
    ~ScopedSignalBlock() { pthread_sigmask(SIG_SETMASK, &previous_, nullptr); }

private:
    sigset_t previous_;
};

}  // namespace

TEST(PosixProcessLauncherTest, ChildStartsWithEmptySignalMask) {
    if (!std::filesystem::exists("/proc/self/status")) GTEST_SKIP() << "no procfs";

    ScopedSignalBlock block({SIGINT, SIGTERM});
    PosixProcessLauncher launcher;
    // awk is exec'd directly (no shell in between) and reports its own mask.
    auto result = launcher.run(EngineCommand{
        "awk", {"/^SigBlk:/ { print $2 > \"/dev/stderr\" }", "/proc/self/status"}});
    if (!result && result.error().code == ErrorCode::EngineNotFound) GTEST_SKIP() << "no awk";
    ASSERT_TRUE(result) << result.error().message;
    ASSERT_TRUE(result->succeeded()) << result->stderr_output;

    ASSERT_FALSE(result->stderr_output.empty());
    EXPECT_EQ(std::stoull(result->stderr_output, nullptr, 16), 0u) << result->stderr_output;
}
