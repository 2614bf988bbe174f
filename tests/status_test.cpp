#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "minhypr/status.hpp"

namespace {

    minhypr::MinimizedSet sample_set() {
        minhypr::MinimizedSet set;
        set.add({.address = "0x55d1", .title = "Docs", .class_name = "firefox", .icon = "F", .minimized_at = 100,
                 .source_workspace = minhypr::WorkspaceRef{.id = 3, .name = "3"}});
        set.add({.address = "0x77e2", .title = "zsh", .class_name = "kitty", .icon = "K", .thumbnail = std::filesystem::path("/c/0x77e2.thumb.png"),
                 .minimized_at = 200});
        return set;
    }

}

TEST(WindowList, EmptySetSaysSo) {
    EXPECT_EQ(minhypr::render_window_list(minhypr::MinimizedSet{}), "No minimized windows\n");
    EXPECT_EQ(minhypr::render_window_list_json(minhypr::MinimizedSet{}), "[]\n");
}

TEST(WindowList, OneRowPerEntry) {
    EXPECT_EQ(minhypr::render_window_list(sample_set()), "1\tF firefox - Docs [55d1]\t3\n"
                                                         "2\tK kitty - zsh [77e2]\t-\n");
}

TEST(WindowList, JsonCarriesEveryField) {
    const auto parsed = nlohmann::json::parse(minhypr::render_window_list_json(sample_set()));

    ASSERT_TRUE(parsed.is_array());
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0]["id"], 1);
    EXPECT_EQ(parsed[0]["address"], "0x55d1");
    EXPECT_EQ(parsed[0]["workspace"], "3");
    EXPECT_TRUE(parsed[0]["thumbnail"].is_null());
    EXPECT_EQ(parsed[1]["class"], "kitty");
    EXPECT_EQ(parsed[1]["minimized_at"], 200);
    EXPECT_EQ(parsed[1]["thumbnail"], "/c/0x77e2.thumb.png");
    EXPECT_TRUE(parsed[1]["workspace"].is_null());
}
