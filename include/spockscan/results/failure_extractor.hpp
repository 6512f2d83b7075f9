#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace spockscan::results {

struct FailureLocation {
  std::filesystem::path file;
  // 0-based.
  uint32_t line = 0;

  auto operator==(const FailureLocation&) const -> bool = default;
};

struct FailureInfo {
  std::string message;
  std::optional<FailureLocation> location;

  auto operator==(const FailureInfo&) const -> bool = default;
};

// Pull a readable failure message, and the Groovy source position of the
// failing assertion when a stack frame names one, out of the combined output
// of a failed run.
auto ExtractFailure(std::string_view output) -> FailureInfo;

}  // namespace spockscan::results
