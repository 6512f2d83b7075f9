#include "print.hpp"

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "spockscan/common/diagnostic.hpp"

namespace spockscan::driver {

namespace {

constexpr auto kToolName = "spockscan";
constexpr auto kToolStyle =
    fmt::fg(fmt::terminal_color::white) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

// "file:line" (1-based line), "file", or the tool name.
auto FormatLocation(const DiagItem& item) -> std::string {
  if (!item.location || item.location->file.empty()) {
    return kToolName;
  }
  if (item.location->line) {
    return fmt::format(
        "{}:{}", item.location->file.string(), *item.location->line + 1);
  }
  return item.location->file.string();
}

void PrintDiagItem(const DiagItem& item, bool is_primary) {
  auto location = FormatLocation(item);
  auto location_style =
      location == kToolName ? kToolStyle : fmt::text_style(fmt::emphasis::bold);
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled(location, location_style),
      fmt::styled(DiagKindToString(item.kind), DiagKindToStyle(item.kind)),
      fmt::styled(
          item.message, is_primary ? fmt::emphasis::bold : fmt::text_style{}));
}

}  // namespace

void PrintError(const std::string& message) {
  PrintDiagItem(
      DiagItem{
          .kind = DiagKind::kError, .location = std::nullopt, .message = message},
      true);
}

void PrintWarning(const std::string& message) {
  PrintDiagItem(
      DiagItem{
          .kind = DiagKind::kWarning,
          .location = std::nullopt,
          .message = message},
      true);
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintDiagItem(diag.primary, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, false);
  }
}

void PrintDiagnostics(const DiagnosticSink& sink) {
  uint32_t error_count = 0;
  uint32_t warning_count = 0;

  for (const auto& diag : sink.GetDiagnostics()) {
    switch (diag.primary.kind) {
      case DiagKind::kError:
      case DiagKind::kHostError:
        ++error_count;
        break;
      case DiagKind::kWarning:
        ++warning_count;
        break;
      case DiagKind::kNote:
        break;
    }
    PrintDiagnostic(diag);
  }

  if (warning_count > 0 || error_count > 0) {
    std::string summary;
    if (warning_count > 0) {
      summary += fmt::format(
          "{} warning{}", warning_count, warning_count == 1 ? "" : "s");
    }
    if (warning_count > 0 && error_count > 0) {
      summary += " and ";
    }
    if (error_count > 0) {
      summary +=
          fmt::format("{} error{}", error_count, error_count == 1 ? "" : "s");
    }
    fmt::print(stderr, "{} generated.\n", summary);
  }
}

}  // namespace spockscan::driver
