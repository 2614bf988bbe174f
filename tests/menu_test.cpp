#include <filesystem>
#include <vector>

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "minhypr/menu.hpp"

namespace {

    minhypr::MinimizedWindow window(std::string address, std::string class_name, std::string title) {
        return minhypr::MinimizedWindow{.address = std::move(address), .title = std::move(title), .class_name = std::move(class_name), .icon = "*"};
    }

}

TEST(Menu, DisplayLabelEndsWithAddressTail) {
    EXPECT_EQ(minhypr::display_label(window("0x55d1a2b0", "kitty", "zsh")), "* kitty - zsh [a2b0]");
    EXPECT_EQ(minhypr::display_label(window("0x1", "kitty", "zsh")), "* kitty - zsh [0x1]");
}

TEST(Menu, EntriesFollowInsertionOrder) {
    minhypr::MinimizedSet set;
    set.add(window("0xaaaa", "kitty", "one"));
    set.add(window("0xbbbb", "firefox", "two"));

    std::vector<minhypr::WindowId> ids;
    for (const auto& entry : minhypr::menu_entries(set)) {
        ids.push_back(entry.id);
    }

    EXPECT_EQ(ids, (std::vector<minhypr::WindowId>{1, 2}));
}

TEST(Menu, RofiRowsCarryIconMetadata) {
    const auto dir = minhypr_test::make_temp_dir("menu");
    const auto thumb = dir / "0xbbbb.thumb.png";
    minhypr_test::write_file(thumb, "png");
    minhypr_test::write_file(dir / "0xbbbb.icon.png", "png");

    minhypr::MinimizedSet set;
    set.add(window("0xaaaa", "kitty", "line\nbreak"));
    auto second      = window("0xbbbb", "firefox", "docs");
    second.thumbnail = thumb;
    set.add(second);

    const auto  rows     = minhypr::render_rofi_rows(set);
    std::string expected = "* kitty - line break [aaaa]";
    expected.push_back('\0');
    expected += "icon\x1f" "kitty\n";
    expected += "* firefox - docs [bbbb]";
    expected.push_back('\0');
    expected += "icon\x1f" + (dir / "0xbbbb.icon.png").string() + "\n";
    EXPECT_EQ(rows, expected);
    std::filesystem::remove_all(dir);
}

TEST(Menu, ScriptRowsCarryId) {
    minhypr::MinimizedSet set;
    set.add(window("0xaaaa", "kitty", "zsh"));

    const auto rows = minhypr::render_script_rows(set);

    EXPECT_TRUE(rows.ends_with("\x1finfo\x1f" "1\n"));
}

TEST(Menu, RowIndexMapsBackToId) {
    minhypr::MinimizedSet set;
    set.add(window("0xaaaa", "kitty", "one"));
    set.add(window("0xbbbb", "kitty", "two"));

    EXPECT_EQ(minhypr::id_for_row(set, "1\n").value_or(0), 2u);
    EXPECT_EQ(minhypr::id_for_row(set, "0").value_or(0), 1u);
    EXPECT_FALSE(minhypr::id_for_row(set, "2").has_value());
    EXPECT_FALSE(minhypr::id_for_row(set, "").has_value());
    EXPECT_FALSE(minhypr::id_for_row(set, "x").has_value());
}
