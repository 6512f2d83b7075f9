#include "spockscan/results/reconciler.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include "spockscan/results/console_parser.hpp"
#include "spockscan/results/xml_report.hpp"

namespace spockscan::results {

namespace {

constexpr std::string_view kComponent = "reconciler";

auto LayoutDirectory(ReportLayout layout) -> std::filesystem::path {
  switch (layout) {
    case ReportLayout::kGradle:
      return std::filesystem::path("build") / "test-results" / "test";
    case ReportLayout::kMavenSurefire:
      return std::filesystem::path("target") / "surefire-reports";
  }
  return std::filesystem::path("build") / "test-results" / "test";
}

// The class name of a report file is the file stem after "TEST-".
auto ClassNameOf(const std::filesystem::path& report_path) -> std::string {
  auto stem = report_path.stem().string();
  constexpr std::string_view kPrefix = "TEST-";
  if (stem.starts_with(kPrefix)) {
    stem.erase(0, kPrefix.size());
  }
  return stem;
}

}  // namespace

auto ReportPathFor(
    const std::filesystem::path& workspace, std::string_view class_name,
    ReportLayout layout) -> std::filesystem::path {
  return workspace / LayoutDirectory(layout) /
         fmt::format("TEST-{}.xml", class_name);
}

auto ReconcileResults(
    const std::filesystem::path& report_path, std::string_view console_text,
    std::string_view test_name, EventSink& sink)
    -> std::vector<TestIterationResult> {
  auto report_results =
      ParseXmlReport(report_path, ClassNameOf(report_path), sink);
  if (!report_results.empty()) {
    sink.Record(
        ParseEvent{
            .component = kComponent,
            .level = EventLevel::kInfo,
            .message = fmt::format(
                "using {} result(s) from {}", report_results.size(),
                report_path.string()),
        });
    return report_results;
  }

  auto console_results = ParseConsoleOutput(console_text, test_name, sink);
  sink.Record(
      ParseEvent{
          .component = kComponent,
          .level = EventLevel::kInfo,
          .message = fmt::format(
              "report empty, using {} console result(s)",
              console_results.size()),
      });
  return console_results;
}

auto ParseTestResults(
    std::string_view console_text, std::string_view test_name,
    std::string_view class_name,
    const std::filesystem::path& report_base_path, ReportLayout layout,
    EventSink& sink) -> std::vector<TestIterationResult> {
  return ReconcileResults(
      ReportPathFor(report_base_path, class_name, layout), console_text,
      test_name, sink);
}

}  // namespace spockscan::results
