// =============================================================================
// Flamingo - String Utility Tests
// =============================================================================

#include "flamingo/string_util.h"

#include <gtest/gtest.h>

namespace flamingo {
namespace {

TEST(StringUtilTest, Trim) {
    EXPECT_EQ(trim("  threads \t\n"), "threads");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(StringUtilTest, SplitTrimmed) {
    auto parts = splitTrimmed(" 16, 32 ,64 ", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "16");
    EXPECT_EQ(parts[1], "32");
    EXPECT_EQ(parts[2], "64");

    auto single = splitTrimmed("only", ',');
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0], "only");

    auto empties = splitTrimmed("a,,b", ',');
    ASSERT_EQ(empties.size(), 3u);
    EXPECT_EQ(empties[1], "");
}

TEST(StringUtilTest, ParseDouble) {
    EXPECT_DOUBLE_EQ(*parseDouble("1.5"), 1.5);
    EXPECT_DOUBLE_EQ(*parseDouble("  -2e3 \n"), -2000.0);
    EXPECT_DOUBLE_EQ(*parseDouble("42"), 42.0);

    EXPECT_FALSE(parseDouble(""));
    EXPECT_FALSE(parseDouble("fast"));
    EXPECT_FALSE(parseDouble("1.5s"));
    EXPECT_FALSE(parseDouble("nan"));
    EXPECT_FALSE(parseDouble("inf"));
}

TEST(StringUtilTest, ParseUnsigned) {
    EXPECT_EQ(*parseUnsigned("3"), 3u);
    EXPECT_EQ(*parseUnsigned(" 17 "), 17u);

    EXPECT_FALSE(parseUnsigned(""));
    EXPECT_FALSE(parseUnsigned("-1"));
    EXPECT_FALSE(parseUnsigned("2.0"));
    EXPECT_FALSE(parseUnsigned("99999999999999999999999"));
}

TEST(StringUtilTest, ToLower) {
    EXPECT_EQ(toLower("MIN_Time"), "min_time");
}

TEST(StringUtilTest, FormatDuration) {
    EXPECT_EQ(formatDuration(0.0), "0m0.00s");
    EXPECT_EQ(formatDuration(75.5), "1m15.50s");
    EXPECT_EQ(formatDuration(-3.0), "0m0.00s");
}

}  // namespace
}  // namespace flamingo
