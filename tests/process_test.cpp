#include <gtest/gtest.h>

#include "minhypr/process.hpp"

TEST(Process, CollectsStdoutAndExitCode) {
    const auto result = minhypr::run_process({"/bin/sh", "-c", "printf hello; exit 3"});

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->exit_code, 3);
    EXPECT_EQ(result->output, "hello");
}

TEST(Process, FeedsStdin) {
    const auto result = minhypr::run_process({"/bin/sh", "-c", "cat"}, "row one\nrow two\n");

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->exit_code, 0);
    EXPECT_EQ(result->output, "row one\nrow two\n");
}

TEST(Process, UnknownProgramExits127) {
    const auto result = minhypr::run_process({"minhypr-test-no-such-binary"});

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->exit_code, 127);
}

TEST(Process, RunCheckedDescribesFailures) {
    const auto runner = minhypr::default_process_runner();

    EXPECT_EQ(minhypr::run_checked(runner, {"/bin/sh", "-c", "echo ok"}).value_or(""), "ok\n");
    EXPECT_EQ(minhypr::run_checked(runner, {"/bin/sh", "-c", "exit 2"}).error(), "/bin/sh exited with code 2");
    EXPECT_EQ(minhypr::run_checked(runner, {"minhypr-test-no-such-binary"}).error(), "minhypr-test-no-such-binary not found");
}
