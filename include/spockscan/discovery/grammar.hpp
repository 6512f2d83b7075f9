#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace spockscan::discovery {

// Fixture methods Spock calls around features. Never test methods.
inline constexpr std::array<std::string_view, 4> kLifecycleMethods = {
    "setup", "setupSpec", "cleanup", "cleanupSpec"};

// Block labels that identify a bare-identifier method as a feature.
enum class BlockLabel : uint8_t {
  kGiven,
  kWhen,
  kThen,
  kExpect,
  kWhere,
};

inline constexpr std::array<std::string_view, 5> kBlockLabelNames = {
    "given", "when", "then", "expect", "where"};

// Lookahead bounds of the method heading heuristics.
inline constexpr std::size_t kBlockLabelLookahead = 50;
inline constexpr std::size_t kOpeningBraceLookahead = 4;

constexpr auto IsLifecycleMethod(std::string_view name) -> bool {
  for (auto reserved : kLifecycleMethods) {
    if (reserved == name) {
      return true;
    }
  }
  return false;
}

// Matches a trimmed line of the form `<label>:` (whitespace allowed before
// the colon). Labels with a description (`when: "x"`) do not match.
auto ParseBlockLabel(std::string_view trimmed) -> std::optional<BlockLabel>;

}  // namespace spockscan::discovery
