#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "minhypr/waybar.hpp"

TEST(WaybarStatus, EmptySetIsNeutral) {
    const auto payload = minhypr::build_status_payload(minhypr::MinimizedSet{});

    EXPECT_EQ(payload.count, 0u);
    EXPECT_EQ(payload.css_class, "empty");
    EXPECT_EQ(payload.tooltip, "No minimized windows");
    EXPECT_EQ(payload.text, minhypr::neutral_status_payload().text);
}

TEST(WaybarStatus, CountsAndListsWindows) {
    minhypr::MinimizedSet set;
    set.add({.address = "0xaaaa", .title = "one", .class_name = "kitty", .icon = "K"});
    set.add({.address = "0xbbbb", .title = "two", .class_name = "kitty", .icon = "K"});

    const auto payload = minhypr::build_status_payload(set);

    EXPECT_EQ(payload.count, 2u);
    EXPECT_TRUE(payload.text.ends_with(" 2"));
    EXPECT_EQ(payload.tooltip, "2 minimized windows\nK kitty - one [aaaa]\nK kitty - two [bbbb]");
    EXPECT_EQ(payload.css_class, "has-windows");
}

TEST(WaybarStatus, RendersSingleJsonLine) {
    const auto line = minhypr::render_waybar_json({.count = 1, .text = "x 1", .tooltip = "a\"b\nc", .css_class = "has-windows"});

    EXPECT_TRUE(line.ends_with("}\n"));
    EXPECT_EQ(line.find('\n'), line.size() - 1);
    const auto parsed = nlohmann::json::parse(line);
    EXPECT_EQ(parsed["text"], "x 1");
    EXPECT_EQ(parsed["tooltip"], "a\"b\nc");
    EXPECT_EQ(parsed["class"], "has-windows");
    EXPECT_EQ(parsed["count"], 1);
}

TEST(WaybarSignal, SendsRealtimeSignal) {
    std::vector<std::string> argv;
    int                      exit_code = 1;
    minhypr::ProcessRunner   runner    = [&](const std::vector<std::string>& args, std::string_view) -> std::expected<minhypr::ProcessResult, std::string> {
        argv = args;
        return minhypr::ProcessResult{.exit_code = exit_code, .output = ""};
    };

    EXPECT_FALSE(minhypr::signal_waybar(8, runner).has_value());
    EXPECT_EQ(argv, (std::vector<std::string>{"pkill", "-RTMIN+8", "waybar"}));

    exit_code = 3;
    EXPECT_EQ(minhypr::signal_waybar(8, runner).value_or(""), "pkill exited with code 3");

    argv.clear();
    EXPECT_FALSE(minhypr::signal_waybar(0, runner).has_value());
    EXPECT_TRUE(argv.empty());
}
