#include "spockscan/results/failure_extractor.hpp"

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include "spockscan/common/string_utils.hpp"
#include "spockscan/common/value.hpp"

namespace spockscan::results {

namespace {

constexpr std::string_view kDefaultMessage = "Test execution failed";

auto Contains(std::string_view line, std::string_view needle) -> bool {
  return line.find(needle) != std::string_view::npos;
}

auto IsFailedTestLine(std::string_view line) -> bool {
  return Contains(line, "FAILED") &&
         (Contains(line, "Test") || Contains(line, "Spec"));
}

auto IsAssertionLine(std::string_view line) -> bool {
  return Contains(line, "Condition not satisfied:") ||
         Contains(line, "Assertion failed:");
}

auto IsSpockErrorLine(std::string_view line) -> bool {
  return Contains(line, "spock.lang.Specification") ||
         Contains(line, "groovy.lang.MissingMethodException");
}

auto IsGenericErrorLine(std::string_view line) -> bool {
  return Contains(line, "Exception") || Contains(line, "Error") ||
         Contains(line, "failed");
}

}  // namespace

auto ExtractFailure(std::string_view output) -> FailureInfo {
  static const std::regex kFramePattern(R"(at .*\((.+\.groovy):(\d+)\))");

  FailureInfo info;
  auto lines = common::SplitLines(output);

  for (const auto& line : lines) {
    if (IsFailedTestLine(line) || IsAssertionLine(line) ||
        IsSpockErrorLine(line)) {
      info.message = std::string(common::Trim(line));
    }
    if (!Contains(line, ".groovy:")) {
      continue;
    }
    std::smatch match;
    if (!std::regex_search(line, match, kFramePattern)) {
      continue;
    }
    auto line_number = ParseInteger(match[2].str());
    if (line_number && *line_number > 0 && *line_number <= UINT32_MAX) {
      info.location = FailureLocation{
          .file = match[1].str(),
          .line = static_cast<uint32_t>(*line_number - 1),
      };
    }
  }

  if (info.message.empty()) {
    for (const auto& line : lines) {
      if (IsGenericErrorLine(line)) {
        info.message = std::string(common::Trim(line));
        break;
      }
    }
  }
  if (info.message.empty()) {
    info.message = std::string(kDefaultMessage);
  }
  return info;
}

}  // namespace spockscan::results
