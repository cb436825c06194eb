#include <gtest/gtest.h>

#include "utils.hpp"

TEST(Utf8Test, AcceptsValidText)
{
    EXPECT_TRUE(utils::is_valid_utf8(""));
    EXPECT_TRUE(utils::is_valid_utf8("M-SEARCH * HTTP/1.1\r\n"));
    EXPECT_TRUE(utils::is_valid_utf8("K\xC3\xBC" "che"));
    EXPECT_TRUE(utils::is_valid_utf8("\xE2\x82\xAC"));
    EXPECT_TRUE(utils::is_valid_utf8("\xF0\x9F\x93\xBA"));
}

TEST(Utf8Test, RejectsInvalidSequences)
{
    EXPECT_FALSE(utils::is_valid_utf8("\xFF"));
    EXPECT_FALSE(utils::is_valid_utf8("\x80"));
    EXPECT_FALSE(utils::is_valid_utf8("\xC3"));
    EXPECT_FALSE(utils::is_valid_utf8("\xC0\xAF"));
    EXPECT_FALSE(utils::is_valid_utf8("\xED\xA0\x80"));
    EXPECT_FALSE(utils::is_valid_utf8("\xF4\x90\x80\x80"));
    EXPECT_FALSE(utils::is_valid_utf8("\xE2\x28\xA1"));
}

TEST(StringUtilsTest, IEquals)
{
    EXPECT_TRUE(utils::iequals("ST", "st"));
    EXPECT_TRUE(utils::iequals("Cache-Control", "cache-control"));
    EXPECT_FALSE(utils::iequals("ST", "STX"));
    EXPECT_FALSE(utils::iequals("ST", "SR"));
}

TEST(StringUtilsTest, Trim)
{
    EXPECT_EQ(utils::trim("  value \t"), "value");
    EXPECT_EQ(utils::trim(""), "");
    EXPECT_EQ(utils::trim(" \t "), "");
}
