#include <filesystem>

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "minhypr/picker.hpp"

namespace {

    struct ScriptedRofi {
        int                      exit_code = 0;
        std::string              output;
        std::vector<std::string> argv;
        std::string              input;

        minhypr::ProcessRunner   runner() {
            return [this](const std::vector<std::string>& args, std::string_view stdin_text) -> std::expected<minhypr::ProcessResult, std::string> {
                argv  = args;
                input = std::string(stdin_text);
                return minhypr::ProcessResult{.exit_code = exit_code, .output = output};
            };
        }
    };

    minhypr::MinimizedSet two_windows() {
        minhypr::MinimizedSet set;
        set.add({.address = "0xaaaa", .title = "one", .class_name = "kitty", .icon = "*"});
        set.add({.address = "0xbbbb", .title = "two", .class_name = "kitty", .icon = "*"});
        return set;
    }

}

TEST(RofiPicker, ReturnsIdOfSelectedRow) {
    ScriptedRofi        rofi;
    rofi.output = "1\n";
    minhypr::RofiPicker picker("rofi", std::nullopt, rofi.runner());

    const auto          chosen = picker.choose(two_windows());

    ASSERT_TRUE(chosen.has_value());
    EXPECT_EQ(chosen->value_or(0), 2u);
    EXPECT_EQ(rofi.argv.front(), "rofi");
    EXPECT_NE(rofi.input.find("kitty - one"), std::string::npos);
}

TEST(RofiPicker, EscapeIsCancellation) {
    ScriptedRofi        rofi;
    rofi.exit_code = 1;
    minhypr::RofiPicker picker("rofi", std::nullopt, rofi.runner());

    const auto          chosen = picker.choose(two_windows());

    ASSERT_TRUE(chosen.has_value());
    EXPECT_FALSE(chosen->has_value());
}

TEST(RofiPicker, MissingBinaryIsAdapterFailure) {
    ScriptedRofi        rofi;
    rofi.exit_code = 127;
    minhypr::RofiPicker picker("rofi", std::nullopt, rofi.runner());

    const auto          chosen = picker.choose(two_windows());

    ASSERT_FALSE(chosen.has_value());
    EXPECT_EQ(chosen.error().kind, minhypr::ErrorKind::kAdapterFailure);
    EXPECT_EQ(chosen.error().message, "rofi not found");
}

TEST(RofiPicker, ThemeIsPassedOnlyWhenInstalled) {
    const auto          dir = minhypr_test::make_temp_dir("picker");
    const auto          theme = dir / "minhypr.rasi";
    ScriptedRofi        rofi;
    minhypr::RofiPicker picker("rofi", theme, rofi.runner());

    EXPECT_EQ(picker.arguments().size(), 9u);

    minhypr_test::write_file(theme, "* {}");
    const auto args = picker.arguments();
    ASSERT_EQ(args.size(), 11u);
    EXPECT_EQ(args[9], "-theme");
    EXPECT_EQ(args[10], theme.string());
    std::filesystem::remove_all(dir);
}
