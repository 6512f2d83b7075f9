#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace spockscan {

// Typed value recovered from a data table, a pipe or a result line.
// std::monostate is Groovy's null.
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

// One entry of an ordered name -> value mapping. Order is the column order
// of the table (or the order parameters appear in a result line).
struct NamedValue {
  std::string name;
  Value value;

  auto operator==(const NamedValue&) const -> bool = default;
};

using ValueList = std::vector<NamedValue>;

// Look up a value by name. Returns nullptr when absent.
auto FindValue(const ValueList& values, std::string_view name) -> const Value*;

// Coerce a raw data-table token:
//   -?\d+        -> int64 (falls back to double when out of range)
//   -?\d+\.\d+   -> double
//   true / false -> bool
//   null         -> null
//   'x' or "x"   -> x
//   otherwise    -> the raw token
// The token is trimmed first.
auto CoerceToken(std::string_view token) -> Value;

// Coerce a parameter value printed by the build tool in an iteration name.
// Same as CoerceToken except that `null` stays the string "null", and
// exponent forms such as 1e5 are numbers.
auto CoerceResultToken(std::string_view token) -> Value;

// Render a value the way Groovy prints it in unrolled iteration names.
auto FormatValue(const Value& value) -> std::string;

// "k1: v1, k2: v2"
auto FormatValueList(const ValueList& values) -> std::string;

// Parse a numeric token; nullopt unless the whole token is a number.
auto ParseInteger(std::string_view token) -> std::optional<int64_t>;
auto ParseDouble(std::string_view token) -> std::optional<double>;

}  // namespace spockscan
