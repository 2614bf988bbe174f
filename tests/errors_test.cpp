#include <gtest/gtest.h>

#include "minhypr/errors.hpp"

TEST(Errors, FormatsKindAndMessage) {
    EXPECT_EQ(minhypr::format_error({.kind = minhypr::ErrorKind::kNotFound, .message = "id 7"}), "not found: id 7");
    EXPECT_EQ(minhypr::format_error({.kind = minhypr::ErrorKind::kEmptySet, .message = ""}), "no minimized windows");
}

TEST(Errors, MakeErrorBuildsUnexpected) {
    const minhypr::Result<int> result = minhypr::make_error(minhypr::ErrorKind::kLockTimeout, "held");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, minhypr::ErrorKind::kLockTimeout);
    EXPECT_EQ(result.error().message, "held");
}

TEST(Errors, OnlyAlreadyMinimizedIsBenign) {
    EXPECT_TRUE(minhypr::is_benign(minhypr::ErrorKind::kAlreadyMinimized));
    EXPECT_FALSE(minhypr::is_benign(minhypr::ErrorKind::kNoActiveWindow));
    EXPECT_FALSE(minhypr::is_benign(minhypr::ErrorKind::kCorruptState));
}
