#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "spockscan/common/event_sink.hpp"
#include "spockscan/common/value.hpp"
#include "spockscan/results/console_parser.hpp"
#include "spockscan/results/iteration_result.hpp"

namespace spockscan::results {
namespace {

class ConsoleParserTest : public ::testing::Test {};

TEST_F(ConsoleParserTest, PassedIteration) {
  auto results = ParseConsoleOutput(
      "com.example.Foo > bar [x: 1, y: 2, #0] PASSED\n", "bar");

  ASSERT_EQ(results.size(), 1u);
  const auto& result = results[0];
  EXPECT_EQ(result.index, 0u);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.status, IterationStatus::kPassed);
  EXPECT_EQ(
      result.parameters,
      (ValueList{
          {.name = "x", .value = int64_t{1}},
          {.name = "y", .value = int64_t{2}}}));
  EXPECT_EQ(result.display_name, "bar [x: 1, y: 2, #0]");
  EXPECT_EQ(result.output, "com.example.Foo > bar [x: 1, y: 2, #0] PASSED");
  EXPECT_EQ(result.duration, 0.0);
  EXPECT_FALSE(result.error_info.has_value());
}

TEST_F(ConsoleParserTest, FailedAndSkippedIterations) {
  auto results = ParseConsoleOutput(
      "    Spec > bar [x: 1, #3] FAILED\n"
      "    Spec > bar [x: 2, #4] SKIPPED\n",
      "bar");

  ASSERT_EQ(results.size(), 2u);
  EXPECT_FALSE(results[0].success);
  EXPECT_EQ(results[0].status, IterationStatus::kFailed);
  EXPECT_EQ(results[0].error_info, "Iteration 3 FAILED");
  EXPECT_EQ(results[0].output, "Spec > bar [x: 1, #3] FAILED");
  EXPECT_FALSE(results[1].success);
  EXPECT_EQ(results[1].status, IterationStatus::kSkipped);
  EXPECT_EQ(results[1].error_info, "Iteration 4 SKIPPED");
}

TEST_F(ConsoleParserTest, NullParameterStaysString) {
  auto results =
      ParseConsoleOutput("Spec > bar [value: null, #0] PASSED", "bar");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].parameters[0].value, Value(std::string("null")));
}

TEST_F(ConsoleParserTest, NumericAndQuotedParameters) {
  auto results = ParseConsoleOutput(
      "Spec > bar [amount: 12345.6789, label: 'a, b', ok: true, #0] PASSED",
      "bar");

  ASSERT_EQ(results.size(), 1u);
  const auto& params = results[0].parameters;
  ASSERT_EQ(params.size(), 3u);
  EXPECT_EQ(params[0].value, Value(12345.6789));
  EXPECT_EQ(params[1].value, Value(std::string("a, b")));
  EXPECT_EQ(params[2].value, Value(true));
}

TEST_F(ConsoleParserTest, MethodNameIsMatchedLiterally) {
  auto results = ParseConsoleOutput(
      "Spec > sum (a + b) [a: 1, b: 2, #0] PASSED\n"
      "Spec > sum Xa + bX [a: 1, b: 2, #1] PASSED\n",
      "sum (a + b)");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].index, 0u);
}

TEST_F(ConsoleParserTest, IgnoresOtherMethodsAndMalformedLines) {
  auto results = ParseConsoleOutput(
      "Spec > other [x: 1, #0] PASSED\n"
      "Spec > bar [x: 1] PASSED\n"
      "Spec > bar PASSED\n"
      "> Task :test\n",
      "bar");

  EXPECT_TRUE(results.empty());
}

TEST_F(ConsoleParserTest, LongParameterValueStillMatches) {
  std::string long_value(2100, 'a');
  auto results = ParseConsoleOutput(
      "com.example.Foo > bar [s: " + long_value + ", #0] PASSED", "bar");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].index, 0u);
  EXPECT_TRUE(results[0].success);
  EXPECT_EQ(
      results[0].parameters,
      (ValueList{{.name = "s", .value = long_value}}));
}

TEST_F(ConsoleParserTest, VeryLongLineIsScanned) {
  std::string digits(200000, '1');
  CollectingEventSink sink;

  auto results = ParseConsoleOutput(
      "Spec > bar [x: 'v', #7] FAILED " + digits, "bar", sink);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].index, 7u);
  EXPECT_EQ(results[0].status, IterationStatus::kFailed);
  ASSERT_FALSE(sink.Entries().empty());
  EXPECT_EQ(sink.Entries().back().message, "1 console result(s) for 'bar'");
}

TEST_F(ConsoleParserTest, HashInsideParameterValue) {
  auto results =
      ParseConsoleOutput("Spec > bar [tag: '#x', #3] PASSED", "bar");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].index, 3u);
  EXPECT_EQ(results[0].display_name, "bar [tag: '#x', #3]");
}

TEST_F(ConsoleParserTest, ExtractIterationInfo) {
  auto info = ExtractIterationInfo("maximum [a: 1, b: 3, #2]");
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->index, 2u);
  EXPECT_EQ(
      info->parameters,
      (ValueList{
          {.name = "a", .value = int64_t{1}},
          {.name = "b", .value = int64_t{3}}}));

  EXPECT_FALSE(ExtractIterationInfo("plain name").has_value());
  EXPECT_FALSE(ExtractIterationInfo("name [a: 1]").has_value());
}

TEST_F(ConsoleParserTest, ParameterListDropsPiecesWithoutColon) {
  EXPECT_EQ(
      ParseParameterList("a: 1, junk, s: 'x:y'"),
      (ValueList{
          {.name = "a", .value = int64_t{1}},
          {.name = "s", .value = std::string("x:y")}}));
}

}  // namespace
}  // namespace spockscan::results
