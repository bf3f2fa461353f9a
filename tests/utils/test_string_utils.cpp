/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string utility functions
 */

#include <gtest/gtest.h>
#include <certmon/utils/string_utils.h>

using namespace certmon::utils;

class StringUtilsTest : public ::testing::Test {
protected:
    // Test setup if needed
};

// trim tests
TEST_F(StringUtilsTest, Trim_BothSides) {
    EXPECT_EQ(trim("  example.com \t"), "example.com");
}

TEST_F(StringUtilsTest, Trim_OnlyWhitespace) {
    EXPECT_EQ(trim(" \t\r "), "");
}

// split tests
TEST_F(StringUtilsTest, Split_Basic) {
    auto result = split("a.b.c", '.');
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[2], "c");
}

TEST_F(StringUtilsTest, Split_KeepsEmptyFields) {
    auto result = split("a..b", '.');
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[1], "");
}

TEST_F(StringUtilsTest, Split_TrailingDelimiter) {
    auto result = split("a.", '.');
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[1], "");
}

TEST_F(StringUtilsTest, Split_Empty) {
    auto result = split("", '.');
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], "");
}

// splitLines tests
TEST_F(StringUtilsTest, SplitLines_MixedEndings) {
    auto result = splitLines("a\nb\r\nc\rd");
    ASSERT_EQ(result.size(), 4u);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "b");
    EXPECT_EQ(result[2], "c");
    EXPECT_EQ(result[3], "d");
}

TEST_F(StringUtilsTest, SplitLines_TrailingTerminator) {
    auto result = splitLines("a\r\nb\r\n");
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[1], "b");
}

TEST_F(StringUtilsTest, SplitLines_BlankLinesKept) {
    auto result = splitLines("a\n\nb\n");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[1], "");
}

TEST_F(StringUtilsTest, SplitLines_Empty) {
    EXPECT_TRUE(splitLines("").empty());
}

// splitWhitespace tests
TEST_F(StringUtilsTest, SplitWhitespace_Runs) {
    auto result = splitWhitespace("  host:443 \t 30d  ");
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], "host:443");
    EXPECT_EQ(result[1], "30d");
}

// isDigits tests
TEST_F(StringUtilsTest, IsDigits) {
    EXPECT_TRUE(isDigits("443"));
    EXPECT_FALSE(isDigits(""));
    EXPECT_FALSE(isDigits("44a"));
    EXPECT_FALSE(isDigits("-1"));
}
