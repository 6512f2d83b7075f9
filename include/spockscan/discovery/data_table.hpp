#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "spockscan/common/source_range.hpp"
#include "spockscan/common/value.hpp"
#include "spockscan/discovery/model.hpp"

namespace spockscan::discovery {

// Lines of a `where:` block. `label_line` holds `where:`; the content is
// [label_line + 1, end_line). end_line is the closing `}` line, or the line
// count when the method never closes.
struct DataBlock {
  uint32_t label_line = 0;
  uint32_t end_line = 0;

  auto operator==(const DataBlock&) const -> bool = default;

  [[nodiscard]] auto Range(std::span<const std::string> lines) const
      -> SourceRange;
};

// Locate the `where:` block of the method declared at method_start_line.
// Stays inside the method body by brace balance.
auto FindDataBlock(
    std::span<const std::string> lines, std::size_t method_start_line)
    -> std::optional<DataBlock>;

// Recover one DataIteration per table row or pipe element, in file order.
auto ParseIterations(
    std::span<const std::string> lines, const DataBlock& block,
    std::string_view method_name) -> std::vector<DataIteration>;

enum class RowSeparator : uint8_t {
  kDoublePipe,
  kDoubleSemicolon,
  kPipe,
  kSemicolon,
  // Only considered when none of the above occurs.
  kComma,
};

// The separator that occurs most often in the row; ties go to the earlier
// enumerator. A row without pipes or semicolons falls back to top-level
// commas. nullopt when the row has no separator at all.
auto SelectSeparator(std::string_view row) -> std::optional<RowSeparator>;

// Split a table row on its dominant separator, trimming cells and dropping
// empty ones.
auto SplitRow(std::string_view row) -> std::vector<std::string>;

// Read the elements of an array literal `[a, b, ...]` (brackets included).
// `new Type(name: 'x', age: 1)` elements become "Type(name: x, age: 1)".
// Anything that is not an array literal gives no elements.
auto ParseListLiteral(std::string_view expression) -> std::vector<Value>;

// Substitute `#name` placeholders from values; without placeholders, append
// " [k: v, ...]".
auto BuildDisplayName(std::string_view method_name, const ValueList& values)
    -> std::string;

}  // namespace spockscan::discovery
