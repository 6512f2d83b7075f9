#include "spockscan/discovery/scanner.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "spockscan/common/string_utils.hpp"
#include "spockscan/discovery/grammar.hpp"

namespace spockscan::discovery {

namespace {

auto HasOpeningBrace(std::string_view line) -> bool {
  return line.find('{') != std::string_view::npos;
}

// Apply one line's braces to the nested-type stack and the class balance.
void ApplyBraces(ScanState& state, std::string_view line) {
  bool opens = HasOpeningBrace(line);
  state.class_balance += common::CountBraceDelta(line);
  if (opens) {
    state.seen_class_brace = true;
    if (!state.nested.empty()) {
      state.nested.back().opened = true;
    }
  }
  while (!state.nested.empty() && state.nested.back().opened &&
         state.class_balance <= state.nested.back().base_balance) {
    state.nested.pop_back();
  }
}

auto ClassBodyEnded(const ScanState& state) -> bool {
  return state.seen_class_brace && state.class_balance <= 0;
}

}  // namespace

auto MatchClassHeading(std::string_view trimmed)
    -> std::optional<ClassHeading> {
  static const std::regex kClassPattern(
      R"(^(abstract\s+)?class\s+(\w+)\s+extends\s+(?:[\w.]*\.)?Specification\b)");

  std::string text(trimmed);
  std::smatch match;
  if (!std::regex_search(text, match, kClassPattern)) {
    return std::nullopt;
  }
  return ClassHeading{
      .name = match[2].str(),
      .is_abstract = match[1].matched,
  };
}

auto MatchMethodHeading(std::string_view trimmed)
    -> std::optional<MethodHeading> {
  static const std::regex kMethodPattern(
      R"re(^(?:def|void)\s+(?:'([^']+)'|"([^"]+)"|([A-Za-z_][A-Za-z0-9_]*))\s*(?:\([^)]*\))?\s*(\{)?\s*$)re");

  std::string text(trimmed);
  std::smatch match;
  if (!std::regex_match(text, match, kMethodPattern)) {
    return std::nullopt;
  }

  MethodHeading heading;
  if (match[1].matched) {
    heading.name = match[1].str();
    heading.quoted = true;
  } else if (match[2].matched) {
    heading.name = match[2].str();
    heading.quoted = true;
  } else {
    heading.name = match[3].str();
  }
  heading.name = std::string(common::Trim(heading.name));
  heading.brace_on_line = match[4].matched;
  if (heading.name.empty()) {
    return std::nullopt;
  }
  return heading;
}

auto IsNestedTypeDeclaration(std::string_view trimmed) -> bool {
  static const std::regex kTypePattern(
      R"(^(?:(?:public|protected|private|static|final|abstract)\s+)*(?:class|interface|enum|trait)\s+\w+)");

  std::string text(trimmed);
  return std::regex_search(text, kTypePattern);
}

auto HasBlockLabelAhead(
    std::span<const std::string> following, std::size_t bound) -> bool {
  auto window = following.first(std::min(bound, following.size()));
  for (const auto& line : window) {
    auto trimmed = common::Trim(line);
    if (trimmed.empty()) {
      continue;
    }
    if (ParseBlockLabel(trimmed)) {
      return true;
    }
    if (trimmed == "}") {
      return false;
    }
  }
  return false;
}

auto HasOpeningBraceAhead(
    std::span<const std::string> following, std::size_t bound) -> bool {
  auto window = following.first(std::min(bound, following.size()));
  for (const auto& line : window) {
    auto trimmed = common::Trim(line);
    if (trimmed.empty() || common::IsCommentLine(trimmed)) {
      continue;
    }
    return trimmed.starts_with('{');
  }
  return false;
}

auto Step(const ScanState& state, std::string_view line) -> ScanStep {
  auto trimmed = common::Trim(line);
  ScanStep step{.state = state};

  if (auto heading = MatchClassHeading(trimmed)) {
    // A specification declaration always starts a fresh top-level class,
    // even when it appears inside another body.
    step.action = ScanAction::kStartClass;
    step.class_heading = std::move(heading);
    step.state = ScanState{
        .in_class = true,
        .seen_class_brace = HasOpeningBrace(line),
        .class_balance = common::CountBraceDelta(line),
        .nested = {},
    };
    if (ClassBodyEnded(step.state)) {
      step.state = ScanState{};
      step.class_closed = true;
    }
    return step;
  }

  if (!state.in_class) {
    return step;
  }

  if (state.InNestedType()) {
    if (IsNestedTypeDeclaration(trimmed)) {
      step.state.nested.push_back(
          NestedScope{.base_balance = state.class_balance, .opened = false});
    }
  } else if (auto heading = MatchMethodHeading(trimmed)) {
    step.action = ScanAction::kMethodCandidate;
    step.method_heading = std::move(heading);
  } else if (IsNestedTypeDeclaration(trimmed)) {
    step.state.nested.push_back(
        NestedScope{.base_balance = state.class_balance, .opened = false});
  }

  ApplyBraces(step.state, line);
  if (ClassBodyEnded(step.state)) {
    step.state = ScanState{};
    step.class_closed = true;
  }
  return step;
}

}  // namespace spockscan::discovery
