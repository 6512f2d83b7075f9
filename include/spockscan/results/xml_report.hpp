#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "spockscan/common/event_sink.hpp"
#include "spockscan/results/iteration_result.hpp"

namespace spockscan::results {

// Iteration results from a JUnit XML report (Gradle or Maven Surefire).
//
// Testcases are found by tag scanning; the document is not validated.
// Testcases whose name carries no `[..., #N]` suffix are not iterations and
// are ignored. class_name is informational: a report file already belongs
// to a single class.
auto ParseXmlReportContent(std::string_view xml, std::string_view class_name)
    -> std::vector<TestIterationResult>;

// Same as ParseXmlReportContent on a file. A missing file gives an empty
// result; a file that cannot be read gives an empty result and a warning
// event.
auto ParseXmlReport(
    const std::filesystem::path& path, std::string_view class_name,
    EventSink& sink = NullEventSink()) -> std::vector<TestIterationResult>;

// Replace the five predefined XML entities and numeric character references.
auto DecodeXmlEntities(std::string_view text) -> std::string;

}  // namespace spockscan::results
