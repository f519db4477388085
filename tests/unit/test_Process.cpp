#include <gtest/gtest.h>
#include "util/process.hpp"
#include "transfer/Context.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace pt::util;
using namespace std::chrono;
using pt::transfer::Context;

TEST(ProcessTest, CapturesExitCodeAndStderr) {
    const auto r = runProcess({"sh", "-c", "echo oops >&2; exit 3"}, Context{});
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.stderr_text, "oops\n");
    EXPECT_FALSE(r.ok());
}

TEST(ProcessTest, PassesExtraEnvironment) {
    ProcessOptions opts;
    opts.extraEnv["PORTER_FILES"] = "[[\"a\",\"b\"]]";
    opts.captureStdout = true;
    const auto r = runProcess({"sh", "-c", "printf '%s' \"$PORTER_FILES\""}, Context{}, opts);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.stdout_text, "[[\"a\",\"b\"]]");
}

TEST(ProcessTest, MissingProgramExits127) {
    const auto r = runProcess({"porter-definitely-not-a-program"}, Context{});
    EXPECT_EQ(r.exit_code, 127);
    EXPECT_FALSE(findInPath("porter-definitely-not-a-program"));
    EXPECT_TRUE(findInPath("sh"));
}

TEST(ProcessTest, DeadlineKillsChild) {
    const auto start = steady_clock::now();
    const auto r = runProcess({"sleep", "10"}, Context::withTimeout(nullptr, milliseconds(200)));
    EXPECT_TRUE(r.timed_out);
    EXPECT_FALSE(r.ok());
    EXPECT_LT(steady_clock::now() - start, seconds(5));
}

TEST(ProcessTest, InterruptKillsChild) {
    const auto flag = std::make_shared<std::atomic<bool>>(false);
    std::thread trigger([flag] {
        std::this_thread::sleep_for(milliseconds(150));
        flag->store(true);
    });
    const auto r = runProcess({"sleep", "10"}, Context{flag, std::nullopt});
    trigger.join();
    EXPECT_TRUE(r.cancelled);
}

TEST(ProcessTest, EmptyArgvThrows) {
    EXPECT_THROW(runProcess({}, Context{}), std::invalid_argument);
}
