#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "spockscan/build/build_tool.hpp"
#include "spockscan/common/diagnostic.hpp"

namespace spockscan::config {

inline constexpr std::string_view kConfigFileName = "spockscan.toml";

struct ProjectConfig {
  // Workspace root. Relative `workspace.root` values resolve against the
  // directory holding spockscan.toml.
  std::filesystem::path root_dir;
  // Detected from the workspace when absent.
  std::optional<build::BuildTool> build_tool;
  // Directory names skipped while walking for sources.
  std::vector<std::string> exclude = {"bin"};
  // Report directory overriding the build tool's layout.
  std::optional<std::filesystem::path> reports_dir;
  std::string log_level = "warn";
};

// Search for spockscan.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse a spockscan.toml file.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

// Parse configuration text. `config_dir` anchors relative paths; `origin`
// names the source in diagnostics.
auto LoadConfigFromString(
    std::string_view text, const std::filesystem::path& config_dir,
    std::string_view origin) -> Result<ProjectConfig>;

// Log levels accepted by `[logging] level`.
auto IsValidLogLevel(std::string_view level) -> bool;

}  // namespace spockscan::config
