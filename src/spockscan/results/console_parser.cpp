#include "spockscan/results/console_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "spockscan/common/string_utils.hpp"
#include "spockscan/common/value.hpp"

namespace spockscan::results {

namespace {

constexpr std::string_view kComponent = "console-parser";

constexpr std::array<std::string_view, 3> kStatusKeywords = {
    "PASSED", "FAILED", "SKIPPED"};

auto ParseStatus(std::string_view text) -> IterationStatus {
  if (text == "PASSED") {
    return IterationStatus::kPassed;
  }
  if (text == "SKIPPED") {
    return IterationStatus::kSkipped;
  }
  return IterationStatus::kFailed;
}

auto ParseIndex(std::string_view digits) -> std::optional<uint32_t> {
  auto value = ParseInteger(digits);
  if (!value || *value < 0 || *value > UINT32_MAX) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(*value);
}

auto IsSpace(char c) -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto SkipSpaces(std::string_view text, std::size_t pos) -> std::size_t {
  while (pos < text.size() && IsSpace(text[pos])) {
    ++pos;
  }
  return pos;
}

struct IterationTail {
  std::string_view parameters;
  uint32_t index = 0;
};

// Split the text between `[` and `]` into the parameter list and the
// trailing `, #N` index. The parameter list must not be empty.
auto SplitIterationTail(std::string_view inner)
    -> std::optional<IterationTail> {
  auto hash = inner.rfind('#');
  if (hash == std::string_view::npos) {
    return std::nullopt;
  }
  auto digits = inner.substr(hash + 1);
  if (digits.empty() || !std::ranges::all_of(digits, [](char c) {
        return c >= '0' && c <= '9';
      })) {
    return std::nullopt;
  }
  auto parameters = inner.substr(0, hash);
  while (!parameters.empty() && IsSpace(parameters.back())) {
    parameters.remove_suffix(1);
  }
  if (parameters.empty() || parameters.back() != ',') {
    return std::nullopt;
  }
  parameters.remove_suffix(1);
  if (parameters.empty()) {
    return std::nullopt;
  }
  auto index = ParseIndex(digits);
  if (!index) {
    return std::nullopt;
  }
  return IterationTail{.parameters = parameters, .index = *index};
}

struct ResultLine {
  IterationTail tail;
  IterationStatus status;
};

// Find `> <method> [<params>, #N] <STATUS>` anywhere in the line. A plain
// scan, so long parameter values cannot exhaust the stack.
auto MatchResultLine(std::string_view line, std::string_view method_name)
    -> std::optional<ResultLine> {
  for (auto arrow = line.find('>'); arrow != std::string_view::npos;
       arrow = line.find('>', arrow + 1)) {
    auto pos = SkipSpaces(line, arrow + 1);
    if (!line.substr(pos).starts_with(method_name)) {
      continue;
    }
    pos = SkipSpaces(line, pos + method_name.size());
    if (pos >= line.size() || line[pos] != '[') {
      continue;
    }
    auto close = line.find(']', pos + 1);
    if (close == std::string_view::npos) {
      continue;
    }
    auto tail = SplitIterationTail(line.substr(pos + 1, close - pos - 1));
    if (!tail) {
      continue;
    }
    auto rest = line.substr(SkipSpaces(line, close + 1));
    for (auto keyword : kStatusKeywords) {
      if (rest.starts_with(keyword)) {
        return ResultLine{.tail = *tail, .status = ParseStatus(keyword)};
      }
    }
  }
  return std::nullopt;
}

}  // namespace

auto ParseParameterList(std::string_view text) -> ValueList {
  ValueList parameters;
  for (const auto& piece : common::SplitTopLevel(text, ',')) {
    auto colon = piece.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    auto name = common::Trim(std::string_view(piece).substr(0, colon));
    if (name.empty()) {
      continue;
    }
    parameters.push_back(
        NamedValue{
            .name = std::string(name),
            .value = CoerceResultToken(
                std::string_view(piece).substr(colon + 1)),
        });
  }
  return parameters;
}

auto ExtractIterationInfo(std::string_view name)
    -> std::optional<IterationInfo> {
  auto text = common::Trim(name);
  if (text.size() < 2 || text.back() != ']') {
    return std::nullopt;
  }
  text.remove_suffix(1);
  // The bracket group is the last one; at least one character precedes it.
  auto last_close = text.rfind(']');
  auto open = text.find(
      '[', last_close == std::string_view::npos ? 1 : last_close + 1);
  if (open == std::string_view::npos) {
    return std::nullopt;
  }
  auto tail = SplitIterationTail(text.substr(open + 1));
  if (!tail) {
    return std::nullopt;
  }
  return IterationInfo{
      .index = tail->index,
      .parameters = ParseParameterList(tail->parameters),
  };
}

auto ParseConsoleOutput(
    std::string_view text, std::string_view method_name, EventSink& sink)
    -> std::vector<TestIterationResult> {
  std::vector<TestIterationResult> results;
  if (method_name.empty()) {
    return results;
  }

  for (const auto& line : common::SplitLines(text)) {
    // Cheap prefilter before the full match.
    if (line.find(method_name) == std::string::npos ||
        line.find('#') == std::string::npos) {
      continue;
    }
    auto match = MatchResultLine(line, method_name);
    if (!match) {
      continue;
    }

    auto index = match->tail.index;
    std::string params_text(match->tail.parameters);
    auto status = match->status;
    TestIterationResult result{
        .index = index,
        .display_name =
            fmt::format("{} [{}, #{}]", method_name, params_text, index),
        .parameters = ParseParameterList(params_text),
        .success = status == IterationStatus::kPassed,
        .duration = 0.0,
        .output = std::string(common::Trim(line)),
        .error_info = std::nullopt,
        .status = status,
    };
    if (status != IterationStatus::kPassed) {
      result.error_info =
          fmt::format("Iteration {} {}", index, ToString(status));
    }
    results.push_back(std::move(result));
  }

  sink.Record(
      ParseEvent{
          .component = kComponent,
          .level = EventLevel::kDebug,
          .message = fmt::format(
              "{} console result(s) for '{}'", results.size(), method_name),
      });
  return results;
}

}  // namespace spockscan::results
