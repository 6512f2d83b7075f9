#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "spockscan/common/string_utils.hpp"

namespace spockscan::common {
namespace {

using Lines = std::vector<std::string>;

TEST(StringUtilsTest, SplitLinesNormalizesLineEndings) {
  EXPECT_EQ(SplitLines("a\r\nb\rc\n"), (Lines{"a", "b", "c"}));
  EXPECT_EQ(SplitLines("a\n\nb"), (Lines{"a", "", "b"}));
  EXPECT_TRUE(SplitLines("").empty());
  EXPECT_EQ(SplitLines("\n"), (Lines{""}));
}

TEST(StringUtilsTest, Trim) {
  EXPECT_EQ(Trim("  where:\t\r"), "where:");
  EXPECT_EQ(Trim("   "), "");
  EXPECT_EQ(Trim("x"), "x");
}

TEST(StringUtilsTest, CountOccurrencesIsNonOverlapping) {
  EXPECT_EQ(CountOccurrences("a || b || c", "||"), 2u);
  EXPECT_EQ(CountOccurrences("|||", "||"), 1u);
  EXPECT_EQ(CountOccurrences("a | b || c", "|"), 3u);
  EXPECT_EQ(CountOccurrences("abc", ""), 0u);
}

TEST(StringUtilsTest, CountBraceDelta) {
  EXPECT_EQ(CountBraceDelta("class A {"), 1);
  EXPECT_EQ(CountBraceDelta("} else {"), 0);
  EXPECT_EQ(CountBraceDelta("}}"), -2);
}

TEST(StringUtilsTest, IsCommentLine) {
  EXPECT_TRUE(IsCommentLine("// note"));
  EXPECT_TRUE(IsCommentLine("/* start"));
  EXPECT_TRUE(IsCommentLine("* middle"));
  EXPECT_FALSE(IsCommentLine("a | b"));
}

TEST(StringUtilsTest, SplitTopLevelRespectsQuotesAndBrackets) {
  EXPECT_EQ(
      SplitTopLevel("a, 'b, c', [1, 2], f(x, y)", ','),
      (Lines{"a", "'b, c'", "[1, 2]", "f(x, y)"}));
  EXPECT_EQ(SplitTopLevel("a,,b", ','), (Lines{"a", "", "b"}));
  EXPECT_EQ(SplitTopLevel("key: 'x:y'", ':'), (Lines{"key", "'x:y'"}));
}

}  // namespace
}  // namespace spockscan::common
