#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "spockscan/common/diagnostic.hpp"
#include "spockscan/config/project_config.hpp"

namespace spockscan::driver {

// Load the configuration named by --config, else the nearest spockscan.toml
// above the working directory. No file is not an error when searching.
auto LoadOptionalConfig(
    const std::optional<std::filesystem::path>& explicit_path)
    -> Result<std::optional<config::ProjectConfig>>;

// Whole file as text. "-" reads standard input.
auto ReadTextFile(const std::filesystem::path& path) -> Result<std::string>;

// Groovy sources under the given files and directories, sorted per argument.
// Directories named in `exclude` are not entered. Explicit files are taken
// as given.
auto CollectSourceFiles(
    std::span<const std::string> paths,
    std::span<const std::string> exclude)
    -> Result<std::vector<std::filesystem::path>>;

}  // namespace spockscan::driver
