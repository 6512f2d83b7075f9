#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "spockscan/common/event_sink.hpp"
#include "spockscan/common/value.hpp"
#include "spockscan/results/iteration_result.hpp"
#include "spockscan/results/xml_report.hpp"

namespace spockscan::results {
namespace {

// ============================================================================
// Report content
// ============================================================================

TEST(XmlReportTest, PassedIterationWithAttributesInAnyOrder) {
  auto results = ParseXmlReportContent(
      R"(<?xml version="1.0" encoding="UTF-8"?>
<testsuite name="MathSpec" tests="1">
  <testcase time="0.012" classname="MathSpec" name="maximum [a: 1, b: 3, #0]"/>
</testsuite>)",
      "MathSpec");

  ASSERT_EQ(results.size(), 1u);
  const auto& result = results[0];
  EXPECT_EQ(result.index, 0u);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.status, IterationStatus::kPassed);
  EXPECT_DOUBLE_EQ(result.duration, 0.012);
  EXPECT_EQ(result.display_name, "maximum [a: 1, b: 3, #0]");
  EXPECT_EQ(result.output, "maximum [a: 1, b: 3, #0]");
  EXPECT_EQ(
      result.parameters,
      (ValueList{
          {.name = "a", .value = int64_t{1}},
          {.name = "b", .value = int64_t{3}}}));
  EXPECT_FALSE(result.error_info.has_value());
}

TEST(XmlReportTest, EntitiesInNamesAreDecoded) {
  auto results = ParseXmlReportContent(
      R"(<testcase name="compare [a: &quot;x&lt;y&quot;, #2]" classname="S"></testcase>)",
      "S");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].index, 2u);
  EXPECT_EQ(results[0].display_name, R"(compare [a: "x<y", #2])");
  EXPECT_EQ(results[0].parameters[0].value, Value(std::string("x<y")));
}

TEST(XmlReportTest, NonIterationTestcasesAreIgnored) {
  auto results = ParseXmlReportContent(
      R"(<testsuite>
  <testcase name="plain feature" classname="S" time="0.1"/>
  <testcase name="data [x: 1, #0]" classname="S" time="0.1"/>
</testsuite>)",
      "S");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].display_name, "data [x: 1, #0]");
}

TEST(XmlReportTest, TestcaseWithoutClassnameIsSkipped) {
  auto results =
      ParseXmlReportContent(R"(<testcase name="data [x: 1, #0]"/>)", "S");
  EXPECT_TRUE(results.empty());
}

TEST(XmlReportTest, MissingOrBadTimeIsZero) {
  auto results = ParseXmlReportContent(
      R"(<testcase name="d [x: 1, #0]" classname="S"/>
<testcase name="d [x: 2, #1]" classname="S" time="soon"/>)",
      "S");

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].duration, 0.0);
  EXPECT_EQ(results[1].duration, 0.0);
}

// ============================================================================
// Failures and skips
// ============================================================================

TEST(XmlReportTest, FailureBodyIsTheErrorInfo) {
  auto results = ParseXmlReportContent(
      R"(<testcase name="d [x: 1, #0]" classname="S" time="0.2">
  <failure message="short" type="org.spockframework.runtime.ConditionNotSatisfiedError">Condition not satisfied:

x == 2
|
1
	at S.d(S.groovy:12)</failure>
</testcase>)",
      "S");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_FALSE(results[0].success);
  EXPECT_EQ(results[0].status, IterationStatus::kFailed);
  ASSERT_TRUE(results[0].error_info.has_value());
  EXPECT_TRUE(results[0].error_info->starts_with("Condition not satisfied:"));
  EXPECT_NE(results[0].error_info->find("S.groovy:12"), std::string::npos);
}

TEST(XmlReportTest, EmptyFailureFallsBackToMessageAttribute) {
  auto results = ParseXmlReportContent(
      R"(<testcase name="d [x: 1, #0]" classname="S"><failure message="boom &amp; bust"/></testcase>)",
      "S");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].error_info, "boom & bust");
}

TEST(XmlReportTest, ErrorElementCountsAsFailure) {
  auto results = ParseXmlReportContent(
      R"(<testcase name="d [x: 1, #0]" classname="S"><error message="npe">java.lang.NullPointerException</error></testcase>)",
      "S");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].status, IterationStatus::kFailed);
  EXPECT_EQ(results[0].error_info, "java.lang.NullPointerException");
}

TEST(XmlReportTest, CdataBodyIsKeptVerbatim) {
  auto results = ParseXmlReportContent(
      R"(<testcase name="d [x: 1, #0]" classname="S"><failure><![CDATA[a < b && c]]></failure></testcase>)",
      "S");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].error_info, "a < b && c");
}

TEST(XmlReportTest, SingleAndDoubleQuotedAttributes) {
  auto results = ParseXmlReportContent(
      R"(<testcase name='d [s: "q", #4]' classname="S" time='0.25'/>)", "S");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].index, 4u);
  EXPECT_EQ(results[0].display_name, R"(d [s: "q", #4])");
  EXPECT_DOUBLE_EQ(results[0].duration, 0.25);
}

TEST(XmlReportTest, SkippedIteration) {
  auto results = ParseXmlReportContent(
      R"(<testcase name="d [x: 1, #0]" classname="S" time="0.1"><skipped/></testcase>)",
      "S");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].success);
  EXPECT_EQ(results[0].status, IterationStatus::kSkipped);
  EXPECT_FALSE(results[0].error_info.has_value());
}

TEST(XmlReportTest, SimilarTagNamesAreNotTestcases) {
  auto results = ParseXmlReportContent(
      R"(<testcases><testcase-extra name="d [x: 1, #0]" classname="S"/></testcases>)",
      "S");
  EXPECT_TRUE(results.empty());
}

// ============================================================================
// Report files
// ============================================================================

class XmlReportFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = std::filesystem::temp_directory_path() /
        (std::string("spockscan_xml_report_test_") + info->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override {
    std::filesystem::remove_all(dir_);
  }

  std::filesystem::path dir_;
};

TEST_F(XmlReportFileTest, MissingFileIsEmpty) {
  CollectingEventSink sink;
  auto results = ParseXmlReport(dir_ / "TEST-S.xml", "S", sink);

  EXPECT_TRUE(results.empty());
  ASSERT_EQ(sink.Entries().size(), 1u);
  EXPECT_EQ(sink.Entries()[0].level, EventLevel::kDebug);
  EXPECT_EQ(sink.Entries()[0].component, "xml-report");
}

TEST_F(XmlReportFileTest, UnreadablePathIsEmptyWithWarning) {
  auto path = dir_ / "TEST-S.xml";
  std::filesystem::create_directories(path);
  CollectingEventSink sink;

  std::vector<TestIterationResult> results;
  EXPECT_NO_THROW(results = ParseXmlReport(path, "S", sink));

  EXPECT_TRUE(results.empty());
  ASSERT_EQ(sink.Entries().size(), 1u);
  EXPECT_EQ(sink.Entries()[0].level, EventLevel::kWarning);
  EXPECT_EQ(sink.Entries()[0].component, "xml-report");
  EXPECT_NE(
      sink.Entries()[0].message.find("not a regular file"), std::string::npos);
}

TEST_F(XmlReportFileTest, ReadsReportFile) {
  auto path = dir_ / "TEST-S.xml";
  {
    std::ofstream out(path);
    out << R"(<testsuite><testcase name="d [x: 1, #0]" classname="S"/>)"
        << R"(<testcase name="d [x: 2, #1]" classname="S"/></testsuite>)";
  }

  auto results = ParseXmlReport(path, "S");

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[1].index, 1u);
}

// ============================================================================
// Entities
// ============================================================================

TEST(DecodeXmlEntitiesTest, NamedAndNumericReferences) {
  EXPECT_EQ(DecodeXmlEntities("&lt;&gt;&amp;&quot;&apos;"), "<>&\"'");
  EXPECT_EQ(DecodeXmlEntities("&#65;&#x42;"), "AB");
}

TEST(DecodeXmlEntitiesTest, UnknownReferencesAreKept) {
  EXPECT_EQ(DecodeXmlEntities("a &nbsp; b"), "a &nbsp; b");
  EXPECT_EQ(DecodeXmlEntities("fish & chips"), "fish & chips");
}

}  // namespace
}  // namespace spockscan::results
