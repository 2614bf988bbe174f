#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "minhypr/json_utils.hpp"

TEST(JsonUtils, OptionalStringSkipsNullEmptyAndNonString) {
    EXPECT_EQ(minhypr::optional_string(nlohmann::json("kitty")).value_or(""), "kitty");
    EXPECT_FALSE(minhypr::optional_string(nlohmann::json(nullptr)).has_value());
    EXPECT_FALSE(minhypr::optional_string(nlohmann::json("")).has_value());
    EXPECT_FALSE(minhypr::optional_string(nlohmann::json(5)).has_value());
}

TEST(JsonUtils, FieldsRequireObjectAndType) {
    const auto obj = nlohmann::json::parse(R"({"title":"zsh","pid":42,"minimized_at":1700000000000,"bad":"7"})");

    EXPECT_EQ(minhypr::optional_string_field(obj, "title").value_or(""), "zsh");
    EXPECT_EQ(minhypr::optional_int_field(obj, "pid").value_or(0), 42);
    EXPECT_EQ(minhypr::optional_int64_field(obj, "minimized_at").value_or(0), 1700000000000);
    EXPECT_FALSE(minhypr::optional_int_field(obj, "bad").has_value());
    EXPECT_FALSE(minhypr::optional_string_field(obj, "missing").has_value());
    EXPECT_FALSE(minhypr::optional_int_field(nlohmann::json::array(), "pid").has_value());
}
