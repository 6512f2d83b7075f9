#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spockscan::discovery {

// `[abstract] class <Name> extends [<pkg>.]Specification`
struct ClassHeading {
  std::string name;
  bool is_abstract = false;

  auto operator==(const ClassHeading&) const -> bool = default;
};

// `def|void <'name'|"name"|identifier>[(...)] [{]`
struct MethodHeading {
  std::string name;
  bool quoted = false;
  bool brace_on_line = false;

  auto operator==(const MethodHeading&) const -> bool = default;
};

// Heading matchers. All take a trimmed line.
auto MatchClassHeading(std::string_view trimmed)
    -> std::optional<ClassHeading>;
auto MatchMethodHeading(std::string_view trimmed)
    -> std::optional<MethodHeading>;
// class/interface/enum/trait declaration that is not a specification.
auto IsNestedTypeDeclaration(std::string_view trimmed) -> bool;

// Bounded lookahead probes. `following` starts at the line after the
// heading; at most `bound` lines are examined.
//
// A block label within the window confirms a feature method; a line that is
// exactly `}` ends the search early.
auto HasBlockLabelAhead(
    std::span<const std::string> following, std::size_t bound) -> bool;
// The first non-blank, non-comment line within the window starts with `{`.
auto HasOpeningBraceAhead(
    std::span<const std::string> following, std::size_t bound) -> bool;

// Nested type body inside a specification. It closes when the class balance
// drops back to `base_balance` after its brace was opened.
struct NestedScope {
  int base_balance = 0;
  bool opened = false;

  auto operator==(const NestedScope&) const -> bool = default;
};

// Scanner state between two lines. Values only; Step never mutates its input.
struct ScanState {
  bool in_class = false;
  bool seen_class_brace = false;
  int class_balance = 0;
  std::vector<NestedScope> nested;

  auto operator==(const ScanState&) const -> bool = default;

  [[nodiscard]] auto InNestedType() const -> bool {
    return !nested.empty();
  }
};

enum class ScanAction : uint8_t {
  kNone,
  kStartClass,
  kMethodCandidate,
};

// Outcome of feeding one line to the scanner.
struct ScanStep {
  ScanState state;
  ScanAction action = ScanAction::kNone;
  std::optional<ClassHeading> class_heading;
  std::optional<MethodHeading> method_heading;
  // The current class body ended on this line.
  bool class_closed = false;
};

auto Step(const ScanState& state, std::string_view line) -> ScanStep;

}  // namespace spockscan::discovery
