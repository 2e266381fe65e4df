#include <gtest/gtest.h>

#include <stdexcept>

#include "SentNeuron/Override.hpp"
#include "test_helpers.hpp"

using namespace sentneuron;

TEST(OverrideTest, ParsesIntegerKeysAndNumericValues) {
    auto map = parse_override(R"({"12": 2.5, "3": -1, "-4": 0})");
    ASSERT_EQ(map.size(), 3u);
    EXPECT_FLOAT_EQ(map.at(12), 2.5f);
    EXPECT_FLOAT_EQ(map.at(3), -1.0f);
    EXPECT_FLOAT_EQ(map.at(-4), 0.0f);

    EXPECT_TRUE(parse_override("{}").empty());
}

TEST(OverrideTest, RejectsMalformedDocuments) {
    EXPECT_THROW(parse_override("{\"1\": 2"), std::runtime_error);
    EXPECT_THROW(parse_override("[1, 2]"), std::runtime_error);
    EXPECT_THROW(parse_override(R"({"abc": 1})"), std::runtime_error);
    EXPECT_THROW(parse_override(R"({"1.5": 1})"), std::runtime_error);
    EXPECT_THROW(parse_override(R"({"7x": 1})"), std::runtime_error);
    EXPECT_THROW(parse_override(R"({"": 1})"), std::runtime_error);
    EXPECT_THROW(parse_override(R"({"1": "high"})"), std::runtime_error);
}

TEST(OverrideTest, FileRoundTrip) {
    test_utils::TempDir dir("override");
    OverrideMap map{{5, 1.25f}, {0, -3.0f}};
    save_override(dir.path() / "o.json", map);
    EXPECT_EQ(load_override(dir.path() / "o.json"), map);

    EXPECT_THROW(load_override(dir.path() / "missing.json"), std::runtime_error);
}
