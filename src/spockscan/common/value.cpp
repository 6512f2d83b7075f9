#include "spockscan/common/value.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include <fmt/core.h>

#include "spockscan/common/overloaded.hpp"
#include "spockscan/common/string_utils.hpp"

namespace spockscan {

namespace {

auto IsQuoted(std::string_view token) -> bool {
  if (token.size() < 2) {
    return false;
  }
  char first = token.front();
  return (first == '\'' || first == '"') && token.back() == first;
}

auto Dequote(std::string_view token) -> std::string {
  return std::string(token.substr(1, token.size() - 2));
}

}  // namespace

auto FindValue(const ValueList& values, std::string_view name)
    -> const Value* {
  for (const auto& entry : values) {
    if (entry.name == name) {
      return &entry.value;
    }
  }
  return nullptr;
}

auto ParseInteger(std::string_view token) -> std::optional<int64_t> {
  int64_t result = 0;
  const char* begin = token.data();
  const char* end = token.data() + token.size();
  auto [ptr, ec] = std::from_chars(begin, end, result);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return result;
}

auto ParseDouble(std::string_view token) -> std::optional<double> {
  double result = 0.0;
  const char* begin = token.data();
  const char* end = token.data() + token.size();
  auto [ptr, ec] = std::from_chars(begin, end, result);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return result;
}

auto CoerceToken(std::string_view token) -> Value {
  static const std::regex kIntegerPattern(R"(-?\d+)");
  static const std::regex kDecimalPattern(R"(-?\d+\.\d+)");

  std::string_view trimmed = common::Trim(token);
  std::string text(trimmed);

  if (std::regex_match(text, kIntegerPattern)) {
    if (auto integer = ParseInteger(trimmed)) {
      return *integer;
    }
    if (auto real = ParseDouble(trimmed)) {
      return *real;
    }
    return text;
  }
  if (std::regex_match(text, kDecimalPattern)) {
    if (auto real = ParseDouble(trimmed)) {
      return *real;
    }
    return text;
  }
  if (trimmed == "true") {
    return true;
  }
  if (trimmed == "false") {
    return false;
  }
  if (trimmed == "null") {
    return std::monostate{};
  }
  if (IsQuoted(trimmed)) {
    return Dequote(trimmed);
  }
  return text;
}

auto CoerceResultToken(std::string_view token) -> Value {
  static const std::regex kNumberPattern(
      R"([+-]?(\d+\.?\d*|\.\d+)([eE][+-]?\d+)?)");

  std::string_view trimmed = common::Trim(token);
  std::string text(trimmed);

  if (trimmed == "true") {
    return true;
  }
  if (trimmed == "false") {
    return false;
  }
  if (!text.empty() && std::regex_match(text, kNumberPattern)) {
    std::string_view digits = trimmed;
    if (digits.starts_with('+')) {
      digits.remove_prefix(1);
    }
    if (auto integer = ParseInteger(digits)) {
      return *integer;
    }
    if (auto real = ParseDouble(digits)) {
      return *real;
    }
  }
  if (IsQuoted(trimmed)) {
    return Dequote(trimmed);
  }
  // `null` intentionally stays a string on this path.
  return text;
}

auto FormatValue(const Value& value) -> std::string {
  return std::visit(
      common::Overloaded{
          [](std::monostate) -> std::string { return "null"; },
          [](bool b) -> std::string { return b ? "true" : "false"; },
          [](int64_t i) -> std::string { return fmt::format("{}", i); },
          [](double d) -> std::string {
            // Groovy prints whole BigDecimals with a trailing .0
            std::string text = fmt::format("{}", d);
            if (text.find_first_of(".eEn") == std::string::npos) {
              text += ".0";
            }
            return text;
          },
          [](const std::string& s) -> std::string { return s; },
      },
      value);
}

auto FormatValueList(const ValueList& values) -> std::string {
  std::string result;
  for (const auto& entry : values) {
    if (!result.empty()) {
      result += ", ";
    }
    result += fmt::format("{}: {}", entry.name, FormatValue(entry.value));
  }
  return result;
}

}  // namespace spockscan
