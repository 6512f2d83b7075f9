#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace spockscan::common {

// Convert CRLF and lone CR line endings to LF.
auto NormalizeLineEndings(std::string_view content) -> std::string;

// Split on LF after normalizing line endings. A trailing newline does not
// produce an extra empty line; empty input produces no lines.
auto SplitLines(std::string_view content) -> std::vector<std::string>;

// Strip leading and trailing spaces, tabs and line-ending characters.
auto Trim(std::string_view text) -> std::string_view;

// Non-overlapping occurrences of needle in text, scanning left to right.
auto CountOccurrences(std::string_view text, std::string_view needle)
    -> std::size_t;

// Number of '{' minus number of '}' on the line, string contents included.
auto CountBraceDelta(std::string_view line) -> int;

// A trimmed line that is a `//` comment or a `/* ... */` fragment.
auto IsCommentLine(std::string_view trimmed) -> bool;

// Split on `separator` where it is not inside quotes, parentheses, brackets
// or braces. Pieces are trimmed; empty pieces are kept.
auto SplitTopLevel(std::string_view text, char separator)
    -> std::vector<std::string>;

}  // namespace spockscan::common
