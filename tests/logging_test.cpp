#include <source_location>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "minhypr/logging.hpp"

namespace {

    std::vector<std::string> g_lines;

    void                     capture_line(std::string_view line) {
        g_lines.emplace_back(line);
    }

    struct LoggingFixture : public ::testing::Test {
        void SetUp() override {
            g_lines.clear();
        }
        void TearDown() override {
            minhypr::set_log_sink(minhypr::LogLevel::kDebug, nullptr);
            minhypr::set_log_sink(minhypr::LogLevel::kError, nullptr);
        }
    };

}

TEST(LoggingFormat, PrefixesLevelAndContext) {
    EXPECT_EQ(minhypr::format_log_line(minhypr::LogLevel::kError, "store", "lock held by pid 12"), "[minhypr] store: lock held by pid 12");
    EXPECT_EQ(minhypr::format_log_line(minhypr::LogLevel::kError, "", "ready"), "[minhypr] ready");
    EXPECT_EQ(minhypr::format_log_line(minhypr::LogLevel::kDebug, "engine", "reaped 2"), "[minhypr][debug] engine: reaped 2");
}

TEST(LoggingFormat, LocationNamesTheCallingFile) {
    const auto text = minhypr::format_log_line(minhypr::LogLevel::kError, "capture", "grim not found", std::source_location::current());

    EXPECT_TRUE(text.starts_with("[minhypr] capture: grim not found @logging_test.cpp:"));
}

TEST_F(LoggingFixture, DebugLogOnlyWhenEnabled) {
    minhypr::set_log_sink(minhypr::LogLevel::kDebug, capture_line);

    minhypr::debug_log(false, "engine", "skipped");
    minhypr::debug_log(true, "engine", "minimized 0x1");

    ASSERT_EQ(g_lines.size(), 1u);
    EXPECT_TRUE(g_lines[0].starts_with("[minhypr][debug] engine: minimized 0x1 @logging_test.cpp:"));
}

TEST_F(LoggingFixture, LevelsHaveSeparateSinks) {
    minhypr::set_log_sink(minhypr::LogLevel::kError, capture_line);

    minhypr::debug_log(true, "engine", "not routed");
    minhypr::error_log("hyprland", "connect failed");

    ASSERT_EQ(g_lines.size(), 1u);
    EXPECT_TRUE(g_lines[0].starts_with("[minhypr] hyprland: connect failed"));
}

TEST_F(LoggingFixture, ClearedSinkDropsMessages) {
    minhypr::set_log_sink(minhypr::LogLevel::kError, capture_line);
    minhypr::set_log_sink(minhypr::LogLevel::kError, nullptr);

    minhypr::error_log("hyprland", "dropped");

    EXPECT_TRUE(g_lines.empty());
}
