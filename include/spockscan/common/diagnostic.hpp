#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spockscan {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Invalid user input (bad flag value, bad config entry)
  kHostError,  // I/O, unreadable files
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// Where a diagnostic points. Line is 0-based; absent when only the file is
// known (or not even that).
struct DiagLocation {
  std::filesystem::path file;
  std::optional<uint32_t> line;

  auto operator==(const DiagLocation&) const -> bool = default;
};

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  std::optional<DiagLocation> location;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto Error(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .location = std::nullopt,
             .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto Error(DiagLocation location, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .location = std::move(location),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error about a specific file
  static auto HostError(std::filesystem::path file, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .location = DiagLocation{.file = std::move(file), .line = {}},
             .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto Warning(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .location = std::nullopt,
             .message = std::move(msg)},
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .location = std::nullopt,
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

// Collects diagnostics while processing several inputs. Not thread-safe.
// Diagnostics are stored in order of reporting.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.primary.kind == DiagKind::kError ||
        diag.primary.kind == DiagKind::kHostError) {
      has_errors_ = true;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Warning(std::string msg) {
    Report(Diagnostic::Warning(std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  bool has_errors_ = false;
};

}  // namespace spockscan
