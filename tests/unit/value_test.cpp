#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <variant>

#include "spockscan/common/value.hpp"

namespace spockscan {
namespace {

class ValueTest : public ::testing::Test {};

// =============================================================================
// Data table coercion
// =============================================================================

TEST_F(ValueTest, CoerceIntegers) {
  EXPECT_EQ(CoerceToken("42"), Value(int64_t{42}));
  EXPECT_EQ(CoerceToken("-7"), Value(int64_t{-7}));
  EXPECT_EQ(CoerceToken("  5 "), Value(int64_t{5}));
}

TEST_F(ValueTest, CoerceDecimals) {
  EXPECT_EQ(CoerceToken("3.25"), Value(3.25));
  EXPECT_EQ(CoerceToken("-0.5"), Value(-0.5));
}

TEST_F(ValueTest, IntegerOutOfRangeBecomesDouble) {
  auto value = CoerceToken("99999999999999999999");
  ASSERT_TRUE(std::holds_alternative<double>(value));
  EXPECT_DOUBLE_EQ(std::get<double>(value), 1e20);
}

TEST_F(ValueTest, CoerceBooleansAndNull) {
  EXPECT_EQ(CoerceToken("true"), Value(true));
  EXPECT_EQ(CoerceToken("false"), Value(false));
  EXPECT_EQ(CoerceToken("null"), Value(std::monostate{}));
}

TEST_F(ValueTest, CoerceQuotedStrings) {
  EXPECT_EQ(CoerceToken("'abc'"), Value(std::string("abc")));
  EXPECT_EQ(CoerceToken("\"x y\""), Value(std::string("x y")));
  EXPECT_EQ(CoerceToken("''"), Value(std::string()));
}

TEST_F(ValueTest, UnrecognizedTokensStayRaw) {
  EXPECT_EQ(CoerceToken("foo.bar()"), Value(std::string("foo.bar()")));
  EXPECT_EQ(CoerceToken("1e5"), Value(std::string("1e5")));
  EXPECT_EQ(CoerceToken("'unbalanced"), Value(std::string("'unbalanced")));
}

// =============================================================================
// Result line coercion
// =============================================================================

TEST_F(ValueTest, ResultNullStaysString) {
  EXPECT_EQ(CoerceResultToken("null"), Value(std::string("null")));
}

TEST_F(ValueTest, ResultNumbers) {
  EXPECT_EQ(CoerceResultToken("-3"), Value(int64_t{-3}));
  EXPECT_EQ(CoerceResultToken("+4"), Value(int64_t{4}));
  EXPECT_EQ(CoerceResultToken("12345.6789"), Value(12345.6789));
  EXPECT_EQ(CoerceResultToken("1e5"), Value(100000.0));
}

TEST_F(ValueTest, ResultBooleansAndStrings) {
  EXPECT_EQ(CoerceResultToken(" false "), Value(false));
  EXPECT_EQ(CoerceResultToken("'q'"), Value(std::string("q")));
  EXPECT_EQ(
      CoerceResultToken("hello world"), Value(std::string("hello world")));
}

// =============================================================================
// Formatting and lookup
// =============================================================================

TEST_F(ValueTest, FormatValueLikeGroovy) {
  EXPECT_EQ(FormatValue(Value(std::monostate{})), "null");
  EXPECT_EQ(FormatValue(Value(true)), "true");
  EXPECT_EQ(FormatValue(Value(int64_t{3})), "3");
  EXPECT_EQ(FormatValue(Value(2.5)), "2.5");
  EXPECT_EQ(FormatValue(Value(3.0)), "3.0");
  EXPECT_EQ(FormatValue(Value(std::string("abc"))), "abc");
}

TEST_F(ValueTest, FormatValueListKeepsOrder) {
  ValueList values = {
      {.name = "b", .value = int64_t{1}},
      {.name = "a", .value = std::string("x")},
  };
  EXPECT_EQ(FormatValueList(values), "b: 1, a: x");
  EXPECT_EQ(FormatValueList({}), "");
}

TEST_F(ValueTest, FindValueByName) {
  ValueList values = {{.name = "a", .value = int64_t{1}}};
  ASSERT_NE(FindValue(values, "a"), nullptr);
  EXPECT_EQ(*FindValue(values, "a"), Value(int64_t{1}));
  EXPECT_EQ(FindValue(values, "missing"), nullptr);
}

TEST_F(ValueTest, ParseNumbersRejectTrailingText) {
  EXPECT_EQ(ParseInteger("12"), 12);
  EXPECT_FALSE(ParseInteger("12x").has_value());
  EXPECT_FALSE(ParseInteger("").has_value());
  EXPECT_EQ(ParseDouble("0.25"), 0.25);
  EXPECT_FALSE(ParseDouble("0.25s").has_value());
}

}  // namespace
}  // namespace spockscan
