#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

#include "spockscan/common/event_sink.hpp"
#include "spockscan/results/iteration_result.hpp"

namespace spockscan::results {

// Where a build tool writes its per-class JUnit XML reports.
enum class ReportLayout : uint8_t {
  kGradle,         // build/test-results/test
  kMavenSurefire,  // target/surefire-reports
};

// <workspace>/<layout dir>/TEST-<class_name>.xml
auto ReportPathFor(
    const std::filesystem::path& workspace, std::string_view class_name,
    ReportLayout layout = ReportLayout::kGradle) -> std::filesystem::path;

// Prefer the structured report; fall back to console lines only when the
// report has no iterations. Report results are returned unchanged, so a
// passing report entry wins over a FAILED console line.
auto ReconcileResults(
    const std::filesystem::path& report_path, std::string_view console_text,
    std::string_view test_name, EventSink& sink = NullEventSink())
    -> std::vector<TestIterationResult>;

// ReconcileResults on the conventional report path of class_name.
auto ParseTestResults(
    std::string_view console_text, std::string_view test_name,
    std::string_view class_name,
    const std::filesystem::path& report_base_path,
    ReportLayout layout = ReportLayout::kGradle,
    EventSink& sink = NullEventSink()) -> std::vector<TestIterationResult>;

}  // namespace spockscan::results
