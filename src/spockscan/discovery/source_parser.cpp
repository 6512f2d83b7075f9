#include "spockscan/discovery/source_parser.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "spockscan/common/event_sink.hpp"
#include "spockscan/common/source_range.hpp"
#include "spockscan/common/string_utils.hpp"
#include "spockscan/discovery/data_table.hpp"
#include "spockscan/discovery/grammar.hpp"
#include "spockscan/discovery/model.hpp"
#include "spockscan/discovery/scanner.hpp"

namespace spockscan::discovery {

namespace {

constexpr std::string_view kComponent = "source-parser";

void Debug(EventSink& sink, std::string message) {
  sink.Record(
      ParseEvent{
          .component = kComponent,
          .level = EventLevel::kDebug,
          .message = std::move(message),
      });
}

// Decide whether a method heading is a feature method and build it.
auto AcceptMethod(
    std::span<const std::string> lines, std::size_t line_index,
    const MethodHeading& heading, EventSink& sink)
    -> std::optional<TestMethod> {
  if (IsLifecycleMethod(heading.name)) {
    Debug(sink, fmt::format("line {}: skip lifecycle method '{}'", line_index,
                            heading.name));
    return std::nullopt;
  }

  auto following = lines.subspan(line_index + 1);
  if (!heading.quoted &&
      !HasBlockLabelAhead(following, kBlockLabelLookahead)) {
    Debug(sink, fmt::format("line {}: '{}' has no block label, not a feature",
                            line_index, heading.name));
    return std::nullopt;
  }
  if (!heading.brace_on_line &&
      !HasOpeningBraceAhead(following, kOpeningBraceLookahead)) {
    Debug(sink, fmt::format("line {}: '{}' has no opening brace", line_index,
                            heading.name));
    return std::nullopt;
  }

  auto line_number = static_cast<uint32_t>(line_index);
  TestMethod method{
      .name = heading.name,
      .declaration_line = line_number,
      .range = SourceRange::WholeLine(line_number, lines[line_index]),
      .is_data_driven = false,
      .data_iterations = {},
      .where_block_range = std::nullopt,
  };

  if (auto block = FindDataBlock(lines, line_index)) {
    method.where_block_range = block->Range(lines);
    auto iterations = ParseIterations(lines, *block, method.name);
    Debug(sink, fmt::format("line {}: '{}' where block with {} iteration(s)",
                            line_index, method.name, iterations.size()));
    if (!iterations.empty()) {
      method.is_data_driven = true;
      method.data_iterations = std::move(iterations);
    }
  }
  return method;
}

}  // namespace

auto ParseSpecSource(std::string_view content, EventSink& sink)
    -> std::vector<TestClass> {
  std::vector<TestClass> classes;
  auto lines = common::SplitLines(content);
  std::span<const std::string> all_lines(lines);

  ScanState state;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    auto step = Step(state, lines[i]);

    switch (step.action) {
      case ScanAction::kStartClass: {
        auto line_number = static_cast<uint32_t>(i);
        Debug(sink, fmt::format("line {}: specification '{}'{}", i,
                                step.class_heading->name,
                                step.class_heading->is_abstract
                                    ? " (abstract)"
                                    : ""));
        classes.push_back(
            TestClass{
                .name = step.class_heading->name,
                .declaration_line = line_number,
                .range = SourceRange::WholeLine(line_number, lines[i]),
                .is_abstract = step.class_heading->is_abstract,
                .methods = {},
            });
        break;
      }
      case ScanAction::kMethodCandidate: {
        if (auto method =
                AcceptMethod(all_lines, i, *step.method_heading, sink)) {
          classes.back().methods.push_back(std::move(*method));
        }
        break;
      }
      case ScanAction::kNone:
        break;
    }

    state = std::move(step.state);
  }

  return classes;
}

}  // namespace spockscan::discovery
