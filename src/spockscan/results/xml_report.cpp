#include "spockscan/results/xml_report.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "spockscan/common/string_utils.hpp"
#include "spockscan/common/value.hpp"
#include "spockscan/results/console_parser.hpp"

namespace spockscan::results {

namespace {

constexpr std::string_view kComponent = "xml-report";

using Attributes = std::vector<std::pair<std::string, std::string>>;

// One element located by tag scanning. `body` is empty for `<x/>`.
struct Element {
  Attributes attributes;
  std::string_view body;
  // Offset just past the element (after `/>` or the closing tag).
  std::size_t end = 0;
};

auto IsNameBoundary(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '>' ||
         c == '/';
}

// Position of the `>` ending the open tag that starts at `from`, skipping
// quoted attribute values.
auto FindTagEnd(std::string_view xml, std::size_t from) -> std::size_t {
  char quote = '\0';
  for (std::size_t i = from; i < xml.size(); ++i) {
    char c = xml[i];
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '>') {
      return i;
    }
  }
  return std::string_view::npos;
}

auto ParseAttributes(std::string_view open_tag) -> Attributes {
  static const std::regex kAttributePattern(
      R"re(([A-Za-z_:][\w:.\-]*)\s*=\s*(?:"([^"]*)"|'([^']*)'))re");

  Attributes attributes;
  std::string text(open_tag);
  for (auto it = std::sregex_iterator(text.begin(), text.end(),
                                      kAttributePattern);
       it != std::sregex_iterator(); ++it) {
    const auto& match = *it;
    auto raw = match[2].matched ? match[2].str() : match[3].str();
    attributes.emplace_back(match[1].str(), DecodeXmlEntities(raw));
  }
  return attributes;
}

auto FindAttribute(const Attributes& attributes, std::string_view name)
    -> const std::string* {
  for (const auto& [key, value] : attributes) {
    if (key == name) {
      return &value;
    }
  }
  return nullptr;
}

// Find the next `<tag ...>` element at or after `from`.
auto FindElement(std::string_view xml, std::string_view tag, std::size_t from)
    -> std::optional<Element> {
  std::string open = fmt::format("<{}", tag);
  std::string close = fmt::format("</{}>", tag);

  auto start = xml.find(open, from);
  while (start != std::string_view::npos) {
    auto after = start + open.size();
    if (after < xml.size() && IsNameBoundary(xml[after])) {
      break;
    }
    start = xml.find(open, after);
  }
  if (start == std::string_view::npos) {
    return std::nullopt;
  }

  auto tag_end = FindTagEnd(xml, start + open.size());
  if (tag_end == std::string_view::npos) {
    return std::nullopt;
  }

  Element element;
  auto attributes_begin = start + open.size();
  auto open_tag = xml.substr(attributes_begin, tag_end - attributes_begin);
  bool self_closing = !open_tag.empty() && open_tag.back() == '/';
  if (self_closing) {
    open_tag.remove_suffix(1);
  }
  element.attributes = ParseAttributes(open_tag);

  if (self_closing) {
    element.end = tag_end + 1;
    return element;
  }
  auto close_pos = xml.find(close, tag_end + 1);
  if (close_pos == std::string_view::npos) {
    // Truncated report: treat the rest of the document as the body.
    element.body = xml.substr(tag_end + 1);
    element.end = xml.size();
    return element;
  }
  element.body = xml.substr(tag_end + 1, close_pos - tag_end - 1);
  element.end = close_pos + close.size();
  return element;
}

auto StripCdata(std::string_view text) -> std::string {
  std::string result;
  constexpr std::string_view kOpen = "<![CDATA[";
  constexpr std::string_view kClose = "]]>";
  while (!text.empty()) {
    auto open = text.find(kOpen);
    if (open == std::string_view::npos) {
      result += DecodeXmlEntities(text);
      break;
    }
    result += DecodeXmlEntities(text.substr(0, open));
    text.remove_prefix(open + kOpen.size());
    auto close = text.find(kClose);
    result += text.substr(0, close);
    if (close == std::string_view::npos) {
      break;
    }
    text.remove_prefix(close + kClose.size());
  }
  return result;
}

// Message of a <failure>/<error> element: its text, else its message.
auto FailureMessage(const Element& element) -> std::string {
  auto text = StripCdata(element.body);
  auto trimmed = common::Trim(text);
  if (!trimmed.empty()) {
    return std::string(trimmed);
  }
  if (const auto* message = FindAttribute(element.attributes, "message")) {
    return *message;
  }
  return {};
}

auto ParseTestcase(const Element& testcase)
    -> std::optional<TestIterationResult> {
  const auto* name = FindAttribute(testcase.attributes, "name");
  const auto* classname = FindAttribute(testcase.attributes, "classname");
  if (name == nullptr || classname == nullptr) {
    return std::nullopt;
  }
  auto info = ExtractIterationInfo(*name);
  if (!info) {
    return std::nullopt;
  }

  double duration = 0.0;
  if (const auto* time = FindAttribute(testcase.attributes, "time")) {
    duration = ParseDouble(common::Trim(*time)).value_or(0.0);
  }

  TestIterationResult result{
      .index = info->index,
      .display_name = *name,
      .parameters = std::move(info->parameters),
      .success = true,
      .duration = duration,
      .output = *name,
      .error_info = std::nullopt,
      .status = IterationStatus::kPassed,
  };

  auto failure = FindElement(testcase.body, "failure", 0);
  if (!failure) {
    failure = FindElement(testcase.body, "error", 0);
  }
  if (failure) {
    result.success = false;
    result.status = IterationStatus::kFailed;
    result.error_info = FailureMessage(*failure);
  } else if (FindElement(testcase.body, "skipped", 0)) {
    // Only <failure> and <error> clear `success`.
    result.status = IterationStatus::kSkipped;
  }
  return result;
}

}  // namespace

auto DecodeXmlEntities(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '&') {
      result += text[i++];
      continue;
    }
    auto semicolon = text.find(';', i);
    if (semicolon == std::string_view::npos || semicolon - i > 10) {
      result += text[i++];
      continue;
    }
    auto entity = text.substr(i + 1, semicolon - i - 1);
    std::optional<std::string> replacement;
    if (entity == "lt") {
      replacement = "<";
    } else if (entity == "gt") {
      replacement = ">";
    } else if (entity == "amp") {
      replacement = "&";
    } else if (entity == "quot") {
      replacement = "\"";
    } else if (entity == "apos") {
      replacement = "'";
    } else if (entity.starts_with('#')) {
      std::optional<int64_t> code;
      if (entity.size() > 2 && (entity[1] == 'x' || entity[1] == 'X')) {
        int64_t value = 0;
        auto digits = entity.substr(2);
        auto [ptr, ec] = std::from_chars(
            digits.data(), digits.data() + digits.size(), value, 16);
        if (ec == std::errc{} && ptr == digits.data() + digits.size()) {
          code = value;
        }
      } else {
        code = ParseInteger(entity.substr(1));
      }
      if (code && *code > 0 && *code < 0x80) {
        replacement = std::string(1, static_cast<char>(*code));
      }
    }
    if (!replacement) {
      result += text[i++];
      continue;
    }
    result += *replacement;
    i = semicolon + 1;
  }
  return result;
}

auto ParseXmlReportContent(
    std::string_view xml, std::string_view /*class_name*/)
    -> std::vector<TestIterationResult> {
  std::vector<TestIterationResult> results;
  std::size_t offset = 0;
  while (auto testcase = FindElement(xml, "testcase", offset)) {
    offset = testcase->end;
    if (auto result = ParseTestcase(*testcase)) {
      results.push_back(std::move(*result));
    }
  }
  return results;
}

auto ParseXmlReport(
    const std::filesystem::path& path, std::string_view class_name,
    EventSink& sink) -> std::vector<TestIterationResult> {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    sink.Record(
        ParseEvent{
            .component = kComponent,
            .level = EventLevel::kDebug,
            .message = fmt::format("no report at {}", path.string()),
        });
    return {};
  }
  // A directory opens fine as a stream on POSIX, so check the kind first.
  if (!std::filesystem::is_regular_file(path, ec)) {
    sink.Record(
        ParseEvent{
            .component = kComponent,
            .level = EventLevel::kWarning,
            .message =
                fmt::format("report {} is not a regular file", path.string()),
        });
    return {};
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    sink.Record(
        ParseEvent{
            .component = kComponent,
            .level = EventLevel::kWarning,
            .message = fmt::format("cannot open report {}", path.string()),
        });
    return {};
  }
  std::ostringstream content;
  content << file.rdbuf();
  if (file.bad()) {
    sink.Record(
        ParseEvent{
            .component = kComponent,
            .level = EventLevel::kWarning,
            .message = fmt::format("error reading report {}", path.string()),
        });
    return {};
  }

  auto results = ParseXmlReportContent(content.str(), class_name);
  sink.Record(
      ParseEvent{
          .component = kComponent,
          .level = EventLevel::kDebug,
          .message = fmt::format(
              "{} iteration(s) in {}", results.size(), path.string()),
      });
  return results;
}

}  // namespace spockscan::results
