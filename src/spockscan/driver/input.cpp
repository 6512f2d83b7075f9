#include "input.hpp"

#include <algorithm>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "spockscan/common/diagnostic.hpp"
#include "spockscan/config/project_config.hpp"

namespace spockscan::driver {

namespace fs = std::filesystem;

namespace {

constexpr auto kSourceExtension = ".groovy";

auto IsExcluded(const fs::path& dir, std::span<const std::string> exclude)
    -> bool {
  auto name = dir.filename().string();
  return std::find(exclude.begin(), exclude.end(), name) != exclude.end();
}

}  // namespace

auto LoadOptionalConfig(const std::optional<fs::path>& explicit_path)
    -> Result<std::optional<config::ProjectConfig>> {
  std::optional<fs::path> config_path = explicit_path;
  if (config_path) {
    std::error_code ec;
    if (!fs::exists(*config_path, ec)) {
      return std::unexpected(
          Diagnostic::HostError(*config_path, "configuration file not found"));
    }
  } else {
    config_path = config::FindConfig();
    if (!config_path) {
      return std::optional<config::ProjectConfig>{};
    }
  }

  auto loaded = config::LoadConfig(*config_path);
  if (!loaded) {
    return std::unexpected(std::move(loaded.error()));
  }
  return std::optional<config::ProjectConfig>{std::move(*loaded)};
}

auto ReadTextFile(const fs::path& path) -> Result<std::string> {
  if (path == "-") {
    return std::string(
        std::istreambuf_iterator<char>(std::cin),
        std::istreambuf_iterator<char>());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(Diagnostic::HostError(path, "cannot open file"));
  }
  std::ostringstream content;
  content << in.rdbuf();
  if (in.bad()) {
    return std::unexpected(Diagnostic::HostError(path, "error reading file"));
  }
  return content.str();
}

auto CollectSourceFiles(
    std::span<const std::string> paths, std::span<const std::string> exclude)
    -> Result<std::vector<fs::path>> {
  std::vector<fs::path> files;

  for (const auto& arg : paths) {
    fs::path root(arg);
    std::error_code ec;
    auto status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
      return std::unexpected(
          Diagnostic::HostError(root, "no such file or directory"));
    }
    if (!fs::is_directory(status)) {
      files.push_back(root);
      continue;
    }

    std::vector<fs::path> found;
    fs::recursive_directory_iterator it(
        root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      return std::unexpected(
          Diagnostic::HostError(
              root, fmt::format("cannot read directory: {}", ec.message())));
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) {
        return std::unexpected(
            Diagnostic::HostError(
                root, fmt::format("cannot read directory: {}", ec.message())));
      }
      const auto& entry = *it;
      if (entry.is_directory(ec)) {
        if (IsExcluded(entry.path(), exclude)) {
          it.disable_recursion_pending();
        }
        continue;
      }
      if (entry.is_regular_file(ec) &&
          entry.path().extension() == kSourceExtension) {
        found.push_back(entry.path());
      }
    }
    std::sort(found.begin(), found.end());
    files.insert(files.end(), found.begin(), found.end());
  }
  return files;
}

}  // namespace spockscan::driver
