#pragma once

#include <cstdint>
#include <string_view>

namespace spockscan {

// Line/column span inside one source file. All coordinates are 0-based;
// end_column is exclusive.
struct SourceRange {
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;

  auto operator==(const SourceRange&) const -> bool = default;

  // Range covering a whole line, as used for class and method declarations.
  static auto WholeLine(uint32_t line, std::string_view text) -> SourceRange {
    return SourceRange{
        .start_line = line,
        .start_column = 0,
        .end_line = line,
        .end_column = static_cast<uint32_t>(text.size()),
    };
  }
};

}  // namespace spockscan
