#include "spockscan/discovery/data_table.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "spockscan/common/string_utils.hpp"
#include "spockscan/common/value.hpp"
#include "spockscan/discovery/grammar.hpp"

namespace spockscan::discovery {

namespace {

constexpr std::array<std::pair<RowSeparator, std::string_view>, 4>
    kSeparators = {{
        {RowSeparator::kDoublePipe, "||"},
        {RowSeparator::kDoubleSemicolon, ";;"},
        {RowSeparator::kPipe, "|"},
        {RowSeparator::kSemicolon, ";"},
    }};

constexpr std::string_view kPlaceholderColumn = "_";

auto SeparatorText(RowSeparator separator) -> std::string_view {
  for (const auto& [kind, text] : kSeparators) {
    if (kind == separator) {
      return text;
    }
  }
  return "|";
}

// Index one past the `]` that closes the `[` at position 0, or npos.
auto FindClosingBracket(std::string_view text) -> std::size_t {
  int depth = 0;
  char quote = '\0';
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (quote != '\0') {
      if (c == '\\' && i + 1 < text.size()) {
        ++i;
      } else if (c == quote) {
        quote = '\0';
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
    } else if (c == '[') {
      ++depth;
    } else if (c == ']') {
      --depth;
      if (depth == 0) {
        return i + 1;
      }
    }
  }
  return std::string_view::npos;
}

// `new Person(name: 'Alice', age: 30)` or `new Person('Alice', 30)`.
auto ParseRecordConstructor(std::string_view element) -> std::optional<Value> {
  static const std::regex kConstructorPattern(
      R"(^new\s+([A-Za-z_][\w.]*)\s*\((.*)\)$)");
  constexpr std::array<std::string_view, 2> kPositionalFields = {
      "name", "age"};

  std::string text(element);
  std::smatch match;
  if (!std::regex_match(text, match, kConstructorPattern)) {
    return std::nullopt;
  }

  std::string fields;
  auto arguments = common::SplitTopLevel(match[2].str(), ',');
  std::size_t position = 0;
  for (const auto& argument : arguments) {
    if (argument.empty()) {
      continue;
    }
    std::string field_name;
    std::string_view raw = argument;
    auto named = common::SplitTopLevel(argument, ':');
    if (named.size() == 2 && !named[0].empty()) {
      field_name = named[0];
      raw = argument;
      raw.remove_prefix(argument.find(':') + 1);
    } else if (position < kPositionalFields.size()) {
      field_name = kPositionalFields[position];
    } else {
      field_name = fmt::format("arg{}", position);
    }
    ++position;

    if (!fields.empty()) {
      fields += ", ";
    }
    fields +=
        fmt::format("{}: {}", field_name, FormatValue(CoerceToken(raw)));
  }

  auto type_name = match[1].str();
  auto last_dot = type_name.rfind('.');
  if (last_dot != std::string::npos) {
    type_name = type_name.substr(last_dot + 1);
  }
  return Value{fmt::format("{}({})", type_name, fields)};
}

auto MakeIteration(
    uint32_t index, ValueList values, std::string_view method_name,
    SourceRange range) -> DataIteration {
  DataIteration iteration;
  iteration.index = index;
  iteration.display_name = BuildDisplayName(method_name, values);
  iteration.data_values = std::move(values);
  iteration.range = range;
  iteration.original_method_name = std::string(method_name);
  return iteration;
}

}  // namespace

auto DataBlock::Range(std::span<const std::string> lines) const
    -> SourceRange {
  uint32_t last = end_line > label_line + 1 ? end_line - 1 : label_line;
  uint32_t last_width =
      last < lines.size() ? static_cast<uint32_t>(lines[last].size()) : 0;
  return SourceRange{
      .start_line = label_line,
      .start_column = 0,
      .end_line = last,
      .end_column = last_width,
  };
}

auto FindDataBlock(
    std::span<const std::string> lines, std::size_t method_start_line)
    -> std::optional<DataBlock> {
  int balance = 0;
  bool seen_opening_brace = false;
  std::optional<std::size_t> label_line;

  for (std::size_t i = method_start_line; i < lines.size(); ++i) {
    const auto& line = lines[i];
    if (i > method_start_line && seen_opening_brace && balance > 0 &&
        ParseBlockLabel(common::Trim(line)) == BlockLabel::kWhere) {
      label_line = i;
      break;
    }
    if (line.find('{') != std::string::npos) {
      seen_opening_brace = true;
    }
    balance += common::CountBraceDelta(line);
    if (seen_opening_brace && balance <= 0) {
      return std::nullopt;
    }
  }
  if (!label_line) {
    return std::nullopt;
  }

  std::size_t end = *label_line + 1;
  while (end < lines.size() && common::Trim(lines[end]) != "}") {
    ++end;
  }
  return DataBlock{
      .label_line = static_cast<uint32_t>(*label_line),
      .end_line = static_cast<uint32_t>(end),
  };
}

auto SelectSeparator(std::string_view row) -> std::optional<RowSeparator> {
  std::optional<RowSeparator> best;
  std::size_t best_count = 0;
  for (const auto& [kind, text] : kSeparators) {
    auto count = common::CountOccurrences(row, text);
    if (count > best_count) {
      best = kind;
      best_count = count;
    }
  }
  if (!best && common::SplitTopLevel(row, ',').size() > 1) {
    best = RowSeparator::kComma;
  }
  return best;
}

auto SplitRow(std::string_view row) -> std::vector<std::string> {
  std::vector<std::string> cells;
  auto separator = SelectSeparator(row);
  if (!separator) {
    auto cell = common::Trim(row);
    if (!cell.empty()) {
      cells.emplace_back(cell);
    }
    return cells;
  }

  if (*separator == RowSeparator::kComma) {
    for (auto& cell : common::SplitTopLevel(row, ',')) {
      if (!cell.empty()) {
        cells.push_back(std::move(cell));
      }
    }
    return cells;
  }

  auto text = SeparatorText(*separator);
  std::string_view rest = row;
  while (true) {
    auto pos = rest.find(text);
    auto cell = common::Trim(rest.substr(0, pos));
    if (!cell.empty()) {
      cells.emplace_back(cell);
    }
    if (pos == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(pos + text.size());
  }
  return cells;
}

auto ParseListLiteral(std::string_view expression) -> std::vector<Value> {
  std::vector<Value> values;
  auto trimmed = common::Trim(expression);
  if (!trimmed.starts_with('[')) {
    return values;
  }
  auto close = FindClosingBracket(trimmed);
  if (close == std::string_view::npos) {
    return values;
  }

  auto inner = trimmed.substr(1, close - 2);
  for (const auto& element : common::SplitTopLevel(inner, ',')) {
    if (element.empty()) {
      continue;
    }
    if (auto record = ParseRecordConstructor(element)) {
      values.push_back(std::move(*record));
    } else {
      values.push_back(CoerceToken(element));
    }
  }
  return values;
}

auto BuildDisplayName(std::string_view method_name, const ValueList& values)
    -> std::string {
  static const std::regex kPlaceholderPattern(R"(#([A-Za-z_]\w*))");

  std::string name(method_name);
  if (!std::regex_search(name, kPlaceholderPattern)) {
    return fmt::format("{} [{}]", method_name, FormatValueList(values));
  }

  std::string result;
  auto begin =
      std::sregex_iterator(name.begin(), name.end(), kPlaceholderPattern);
  auto end = std::sregex_iterator();
  std::size_t copied = 0;
  for (auto it = begin; it != end; ++it) {
    const auto& match = *it;
    auto position = static_cast<std::size_t>(match.position(0));
    result.append(name, copied, position - copied);
    if (const auto* value = FindValue(values, match[1].str())) {
      result += FormatValue(*value);
    } else {
      result += match.str(0);
    }
    copied = position + static_cast<std::size_t>(match.length(0));
  }
  result.append(name, copied, std::string::npos);
  return result;
}

auto ParseIterations(
    std::span<const std::string> lines, const DataBlock& block,
    std::string_view method_name) -> std::vector<DataIteration> {
  static const std::regex kPipePattern(R"(^([A-Za-z_]\w*)\s*<<\s*(.*)$)");
  static const std::regex kDerivedPattern(R"(^[A-Za-z_]\w*\s*=[^=].*$)");

  std::vector<DataIteration> iterations;
  std::vector<std::string> header;
  std::size_t end = std::min<std::size_t>(block.end_line, lines.size());

  for (std::size_t i = block.label_line + 1; i < end; ++i) {
    auto trimmed = common::Trim(lines[i]);
    if (trimmed.empty() || common::IsCommentLine(trimmed)) {
      continue;
    }
    std::string text(trimmed);
    std::smatch match;

    if (std::regex_match(text, match, kPipePattern)) {
      std::string variable = match[1].str();
      std::string expression = match[2].str();
      std::size_t first_line = i;
      // Array literals may continue over several lines until `]`.
      if (common::Trim(expression).starts_with('[')) {
        while (FindClosingBracket(common::Trim(expression)) ==
                   std::string_view::npos &&
               i + 1 < end) {
          ++i;
          expression += ' ';
          expression += common::Trim(lines[i]);
        }
      }
      auto range = SourceRange{
          .start_line = static_cast<uint32_t>(first_line),
          .start_column = 0,
          .end_line = static_cast<uint32_t>(i),
          .end_column = static_cast<uint32_t>(lines[i].size()),
      };
      for (auto& element : ParseListLiteral(expression)) {
        ValueList values;
        values.push_back(
            NamedValue{.name = variable, .value = std::move(element)});
        iterations.push_back(MakeIteration(
            static_cast<uint32_t>(iterations.size()), std::move(values),
            method_name, range));
      }
      continue;
    }

    if (std::regex_match(text, kDerivedPattern)) {
      continue;
    }

    auto cells = SplitRow(trimmed);
    if (header.empty()) {
      header = std::move(cells);
      continue;
    }

    ValueList values;
    std::size_t columns = std::min(header.size(), cells.size());
    for (std::size_t column = 0; column < columns; ++column) {
      if (header[column] == kPlaceholderColumn) {
        continue;
      }
      values.push_back(
          NamedValue{
              .name = header[column], .value = CoerceToken(cells[column])});
    }
    if (values.empty()) {
      continue;
    }
    iterations.push_back(MakeIteration(
        static_cast<uint32_t>(iterations.size()), std::move(values),
        method_name,
        SourceRange::WholeLine(static_cast<uint32_t>(i), lines[i])));
  }
  return iterations;
}

}  // namespace spockscan::discovery
