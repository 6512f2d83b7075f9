#include "spockscan/build/build_tool.hpp"

#include <expected>
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

#include "spockscan/common/diagnostic.hpp"
#include "spockscan/common/internal_error.hpp"

namespace spockscan::build {

namespace fs = std::filesystem;

namespace {

auto Exists(const fs::path& path) -> bool {
  std::error_code ec;
  return fs::exists(path, ec);
}

auto ReadFile(const fs::path& path) -> std::optional<std::string> {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }
  std::ostringstream content;
  content << file.rdbuf();
  if (file.bad()) {
    return std::nullopt;
  }
  return content.str();
}

auto SearchFirst(const std::string& text, const std::regex& pattern)
    -> std::optional<std::string> {
  std::smatch match;
  if (!std::regex_search(text, match, pattern)) {
    return std::nullopt;
  }
  return match[1].str();
}

auto GradleProjectName(const fs::path& workspace)
    -> std::optional<std::string> {
  static const std::regex kRootProjectName(
      R"(rootProject\.name\s*=\s*['"]([^'"]+)['"])");
  static const std::regex kAnyName(R"(name\s*=\s*['"]([^'"]+)['"])");

  std::vector<std::string> contents;
  for (const auto* file : {"settings.gradle", "settings.gradle.kts",
                           "build.gradle", "build.gradle.kts"}) {
    if (auto content = ReadFile(workspace / file)) {
      contents.push_back(std::move(*content));
    }
  }
  for (const auto& content : contents) {
    if (auto name = SearchFirst(content, kRootProjectName)) {
      return name;
    }
  }
  for (const auto& content : contents) {
    if (auto name = SearchFirst(content, kAnyName)) {
      return name;
    }
  }
  return std::nullopt;
}

auto MavenProjectName(const fs::path& workspace)
    -> std::optional<std::string> {
  static const std::regex kArtifactId(R"(<artifactId>([^<]+)</artifactId>)");

  auto content = ReadFile(workspace / "pom.xml");
  if (!content) {
    return std::nullopt;
  }
  return SearchFirst(*content, kArtifactId);
}

}  // namespace

auto ToString(BuildTool tool) -> const char* {
  switch (tool) {
    case BuildTool::kGradle:
      return "gradle";
    case BuildTool::kMaven:
      return "maven";
  }
  return "gradle";
}

auto ParseBuildTool(std::string_view name) -> Result<BuildTool> {
  if (name == "gradle") {
    return BuildTool::kGradle;
  }
  if (name == "maven") {
    return BuildTool::kMaven;
  }
  return std::unexpected(
      Diagnostic::Error(fmt::format("unknown build tool '{}'", name))
          .WithNote("expected 'gradle' or 'maven'"));
}

auto DetectBuildTool(const fs::path& workspace) -> std::optional<BuildTool> {
  if (Exists(workspace / "build.gradle") ||
      Exists(workspace / "build.gradle.kts")) {
    return BuildTool::kGradle;
  }
  if (Exists(workspace / "pom.xml")) {
    return BuildTool::kMaven;
  }
  return std::nullopt;
}

auto GetProjectName(const fs::path& workspace) -> std::string {
  std::optional<std::string> name;
  if (Exists(workspace / "build.gradle") ||
      Exists(workspace / "build.gradle.kts")) {
    name = GradleProjectName(workspace);
  }
  if (!name && Exists(workspace / "pom.xml")) {
    name = MavenProjectName(workspace);
  }
  if (name) {
    return *name;
  }

  auto normalized = workspace.lexically_normal();
  if (!normalized.has_filename()) {
    normalized = normalized.parent_path();
  }
  return normalized.filename().string();
}

auto HasGradleWrapper(const fs::path& workspace) -> bool {
  return Exists(workspace / "gradlew");
}

auto BuildTestCommand(
    BuildTool tool, std::string_view class_name, std::string_view test_name,
    const CommandOptions& options) -> std::vector<std::string> {
  std::vector<std::string> args;
  switch (tool) {
    case BuildTool::kGradle: {
      bool wrapper = options.workspace && HasGradleWrapper(*options.workspace);
      args.emplace_back(wrapper ? "./gradlew" : "gradle");
      args.emplace_back("test");
      args.emplace_back("--tests");
      args.push_back(fmt::format("{}.{}", class_name, test_name));
      if (options.debug) {
        args.emplace_back("--debug-jvm");
      }
      if (options.timestamp) {
        args.push_back(fmt::format(
            "-Dorg.gradle.jvmargs=-Dtest.timestamp={}", *options.timestamp));
      }
      return args;
    }
    case BuildTool::kMaven: {
      args.emplace_back("mvn");
      args.emplace_back("test");
      args.push_back(fmt::format("-Dtest={}#{}", class_name, test_name));
      if (options.timestamp) {
        args.push_back(fmt::format("-Dtest.timestamp={}", *options.timestamp));
      }
      if (options.debug && options.debug_port) {
        args.push_back(fmt::format(
            "-Dmaven.surefire.debug=-agentlib:jdwp=transport=dt_socket,"
            "server=y,suspend=y,address={}",
            *options.debug_port));
      }
      return args;
    }
  }
  common::ThrowInternalError(
      "BuildTestCommand",
      fmt::format("unhandled build tool {}", static_cast<int>(tool)));
}

}  // namespace spockscan::build
