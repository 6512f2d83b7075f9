#include "spockscan/config/project_config.hpp"

#include <array>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "spockscan/build/build_tool.hpp"
#include "spockscan/common/diagnostic.hpp"

namespace spockscan::config {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

auto ConfigError(std::string_view origin, std::string message) -> Diagnostic {
  return Diagnostic::Error(
      DiagLocation{.file = fs::path(origin), .line = std::nullopt},
      std::move(message));
}

auto ResolvePath(const fs::path& base, const std::string& value) -> fs::path {
  fs::path path = value;
  if (path.is_relative()) {
    path = base / path;
  }
  return path.lexically_normal();
}

auto FromTable(
    const toml::table& tbl, const fs::path& config_dir,
    std::string_view origin) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = config_dir;

  // [workspace] section
  if (auto workspace = tbl["workspace"]) {
    if (auto root = workspace["root"].value<std::string>()) {
      config.root_dir = ResolvePath(config_dir, *root);
    }
    if (auto tool_name = workspace["build_tool"].value<std::string>()) {
      auto tool = build::ParseBuildTool(*tool_name);
      if (!tool) {
        return std::unexpected(
            ConfigError(
                origin, fmt::format(
                            "'workspace.build_tool': {}",
                            tool.error().primary.message)));
      }
      config.build_tool = *tool;
    }
    if (auto* exclude = workspace["exclude"].as_array()) {
      config.exclude.clear();
      for (const auto& elem : *exclude) {
        auto name = elem.value<std::string>();
        if (!name) {
          return std::unexpected(
              ConfigError(
                  origin, "'workspace.exclude' must be an array of strings"));
        }
        config.exclude.push_back(*name);
      }
    }
  }

  // [reports] section (optional)
  if (auto reports = tbl["reports"]) {
    if (auto dir = reports["dir"].value<std::string>()) {
      config.reports_dir = ResolvePath(config.root_dir, *dir);
    }
  }

  // [logging] section (optional)
  if (auto logging = tbl["logging"]) {
    if (auto level = logging["level"].value<std::string>()) {
      if (!IsValidLogLevel(*level)) {
        return std::unexpected(
            ConfigError(
                origin, fmt::format(
                            "unknown log level '{}' in 'logging.level'",
                            *level)));
      }
      config.log_level = *level;
    }
  }

  return config;
}

}  // namespace

auto IsValidLogLevel(std::string_view level) -> bool {
  for (auto known : kLogLevels) {
    if (known == level) {
      return true;
    }
  }
  return false;
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            config_path,
            fmt::format("failed to parse {}: {}", config_path.string(),
                        e.description())));
  }
  return FromTable(tbl, config_path.parent_path(), config_path.string());
}

auto LoadConfigFromString(
    std::string_view text, const fs::path& config_dir, std::string_view origin)
    -> Result<ProjectConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse(text, origin);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        ConfigError(
            origin, fmt::format("failed to parse {}: {}", origin,
                                e.description())));
  }
  return FromTable(tbl, config_dir, origin);
}

}  // namespace spockscan::config
