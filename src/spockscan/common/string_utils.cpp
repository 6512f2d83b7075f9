#include "spockscan/common/string_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace spockscan::common {

auto NormalizeLineEndings(std::string_view content) -> std::string {
  std::string result;
  result.reserve(content.size());

  for (std::size_t i = 0; i < content.size(); ++i) {
    char c = content[i];
    if (c == '\r') {
      // \r\n and lone \r both become a single \n
      if (i + 1 < content.size() && content[i + 1] == '\n') {
        ++i;
      }
      result += '\n';
    } else {
      result += c;
    }
  }
  return result;
}

auto SplitLines(std::string_view content) -> std::vector<std::string> {
  std::vector<std::string> lines;
  if (content.empty()) {
    return lines;
  }

  std::string normalized = NormalizeLineEndings(content);
  std::string_view rest = normalized;
  while (!rest.empty()) {
    auto newline = rest.find('\n');
    if (newline == std::string_view::npos) {
      lines.emplace_back(rest);
      break;
    }
    lines.emplace_back(rest.substr(0, newline));
    rest.remove_prefix(newline + 1);
  }
  return lines;
}

auto Trim(std::string_view text) -> std::string_view {
  constexpr std::string_view kWhitespace = " \t\r\n\f\v";
  auto start = text.find_first_not_of(kWhitespace);
  if (start == std::string_view::npos) {
    return {};
  }
  auto end = text.find_last_not_of(kWhitespace);
  return text.substr(start, end - start + 1);
}

auto CountOccurrences(std::string_view text, std::string_view needle)
    -> std::size_t {
  if (needle.empty()) {
    return 0;
  }
  std::size_t count = 0;
  std::size_t pos = text.find(needle);
  while (pos != std::string_view::npos) {
    ++count;
    pos = text.find(needle, pos + needle.size());
  }
  return count;
}

auto CountBraceDelta(std::string_view line) -> int {
  auto open = std::ranges::count(line, '{');
  auto close = std::ranges::count(line, '}');
  return static_cast<int>(open - close);
}

auto IsCommentLine(std::string_view trimmed) -> bool {
  return trimmed.starts_with("//") || trimmed.starts_with("/*") ||
         trimmed.starts_with("*");
}

auto SplitTopLevel(std::string_view text, char separator)
    -> std::vector<std::string> {
  std::vector<std::string> pieces;
  int depth = 0;
  char quote = '\0';
  std::size_t start = 0;

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
    switch (c) {
      case '\'':
      case '"':
        quote = c;
        break;
      case '(':
      case '[':
      case '{':
        ++depth;
        break;
      case ')':
      case ']':
      case '}':
        depth = std::max(0, depth - 1);
        break;
      default:
        if (c == separator && depth == 0) {
          pieces.emplace_back(Trim(text.substr(start, i - start)));
          start = i + 1;
        }
        break;
    }
  }
  pieces.emplace_back(Trim(text.substr(start)));
  return pieces;
}

}  // namespace spockscan::common
