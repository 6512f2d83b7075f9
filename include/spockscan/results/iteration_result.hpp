#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "spockscan/common/value.hpp"

namespace spockscan::results {

enum class IterationStatus : uint8_t {
  kPassed,
  kFailed,
  kSkipped,
};

// Outcome of one executed data iteration, as reported by the build tool.
struct TestIterationResult {
  uint32_t index = 0;
  std::string display_name;
  ValueList parameters;
  // True iff status is kPassed.
  bool success = false;
  // Seconds; 0 when the source does not say.
  double duration = 0.0;
  // Raw console line, or the testcase name for report results.
  std::string output;
  std::optional<std::string> error_info;
  IterationStatus status = IterationStatus::kFailed;

  auto operator==(const TestIterationResult&) const -> bool = default;
};

auto ToString(IterationStatus status) -> const char*;

}  // namespace spockscan::results
