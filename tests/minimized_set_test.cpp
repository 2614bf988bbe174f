#include <gtest/gtest.h>

#include "minhypr/minimized_set.hpp"

namespace {

    minhypr::MinimizedWindow window(const std::string& address, std::int64_t minimized_at) {
        return minhypr::MinimizedWindow{.address = address, .title = address, .class_name = "kitty", .minimized_at = minimized_at};
    }

} // namespace

TEST(MinimizedSet, AddAssignsIncreasingIds) {
    minhypr::MinimizedSet set;

    const auto            first  = set.add(window("0x1", 1));
    const auto            second = set.add(window("0x2", 2));

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, 1u);
    EXPECT_EQ(*second, 2u);
    EXPECT_EQ(set.next_id(), 3u);
    EXPECT_EQ(set.entries()[0].address, "0x1");
}

TEST(MinimizedSet, RejectsDuplicateAddress) {
    minhypr::MinimizedSet set;
    ASSERT_TRUE(set.add(window("0x1", 1)).has_value());
    const auto revision = set.revision();

    EXPECT_FALSE(set.add(window("0x1", 2)).has_value());
    EXPECT_EQ(set.size(), 1u);
    EXPECT_EQ(set.revision(), revision);
}

TEST(MinimizedSet, IdsAreNotReusedAfterRemoval) {
    minhypr::MinimizedSet set;
    ASSERT_TRUE(set.add(window("0x1", 1)).has_value());
    ASSERT_TRUE(set.remove(1).has_value());

    const auto id = set.add(window("0x1", 2));

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, 2u);
}

TEST(MinimizedSet, RemoveMissingIdLeavesSetUnchanged) {
    minhypr::MinimizedSet set;
    ASSERT_TRUE(set.add(window("0x1", 1)).has_value());
    const auto revision = set.revision();

    EXPECT_FALSE(set.remove(7).has_value());
    EXPECT_EQ(set.revision(), revision);
}

TEST(MinimizedSet, InsertExistingKeepsIdAndAdvancesCounter) {
    minhypr::MinimizedSet set(2);
    auto                  entry = window("0x9", 1);
    entry.id                    = 9;

    EXPECT_TRUE(set.insert_existing(entry));
    EXPECT_EQ(set.next_id(), 10u);
    EXPECT_FALSE(set.insert_existing(entry));

    auto zero = window("0xa", 1);
    EXPECT_FALSE(set.insert_existing(zero));
}

TEST(MinimizedSet, LatestPrefersNewestThenHighestId) {
    minhypr::MinimizedSet set;
    EXPECT_FALSE(set.latest().has_value());
    ASSERT_TRUE(set.add(window("0x1", 10)).has_value());
    ASSERT_TRUE(set.add(window("0x2", 30)).has_value());
    ASSERT_TRUE(set.add(window("0x3", 30)).has_value());
    ASSERT_TRUE(set.add(window("0x4", 20)).has_value());

    EXPECT_EQ(set.latest().value_or(0), 3u);
}

TEST(MinimizedSet, OldestFirstOrdersByTimestamp) {
    minhypr::MinimizedSet set;
    ASSERT_TRUE(set.add(window("0x1", 30)).has_value());
    ASSERT_TRUE(set.add(window("0x2", 10)).has_value());
    ASSERT_TRUE(set.add(window("0x3", 20)).has_value());

    const auto ids = set.ids_oldest_first();

    EXPECT_EQ(ids, (std::vector<minhypr::WindowId>{2, 3, 1}));
}

TEST(MinimizedSet, FindsByIdAndAddress) {
    minhypr::MinimizedSet set;
    ASSERT_TRUE(set.add(window("0x1", 1)).has_value());

    ASSERT_NE(set.find(1), nullptr);
    EXPECT_EQ(set.find(1)->address, "0x1");
    ASSERT_NE(set.find_by_address("0x1"), nullptr);
    EXPECT_EQ(set.find_by_address("0x1")->id, 1u);
    EXPECT_EQ(set.find(2), nullptr);
    EXPECT_FALSE(set.contains_address("0x2"));
}
