#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "spockscan/common/diagnostic.hpp"

namespace spockscan::build {

enum class BuildTool : uint8_t {
  kGradle,
  kMaven,
};

auto ToString(BuildTool tool) -> const char*;

// "gradle" / "maven", as written in spockscan.toml or on the command line.
auto ParseBuildTool(std::string_view name) -> Result<BuildTool>;

// build.gradle or build.gradle.kts -> Gradle; pom.xml -> Maven.
auto DetectBuildTool(const std::filesystem::path& workspace)
    -> std::optional<BuildTool>;

// Project name from the build files, else the workspace directory name.
auto GetProjectName(const std::filesystem::path& workspace) -> std::string;

auto HasGradleWrapper(const std::filesystem::path& workspace) -> bool;

struct CommandOptions {
  bool debug = false;
  // JDWP port handed to Surefire. Gradle picks its own with --debug-jvm.
  std::optional<uint16_t> debug_port;
  // Millisecond run marker passed as a system property so the build cache
  // never treats the run as up to date.
  std::optional<int64_t> timestamp;
  // Used to look for a Gradle wrapper.
  std::optional<std::filesystem::path> workspace;
};

// Argument vector that runs a single test method. Composed only; never
// executed here.
auto BuildTestCommand(
    BuildTool tool, std::string_view class_name, std::string_view test_name,
    const CommandOptions& options) -> std::vector<std::string>;

}  // namespace spockscan::build
