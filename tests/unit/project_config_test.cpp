#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "spockscan/build/build_tool.hpp"
#include "spockscan/common/diagnostic.hpp"
#include "spockscan/config/project_config.hpp"

namespace spockscan::config {
namespace {

namespace fs = std::filesystem;

const fs::path kConfigDir = "/work/app";

auto Load(const std::string& text) -> Result<ProjectConfig> {
  return LoadConfigFromString(text, kConfigDir, "spockscan.toml");
}

// ============================================================================
// Parsing
// ============================================================================

TEST(ProjectConfigTest, EmptyConfigUsesDefaults) {
  auto config = Load("");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->root_dir, kConfigDir);
  EXPECT_FALSE(config->build_tool.has_value());
  EXPECT_EQ(config->exclude, std::vector<std::string>{"bin"});
  EXPECT_FALSE(config->reports_dir.has_value());
  EXPECT_EQ(config->log_level, "warn");
}

TEST(ProjectConfigTest, FullConfig) {
  auto config = Load(R"(
[workspace]
root = "service"
build_tool = "maven"
exclude = ["bin", "generated"]

[reports]
dir = "out/reports"

[logging]
level = "debug"
)");

  ASSERT_TRUE(config.has_value()) << config.error().primary.message;
  EXPECT_EQ(config->root_dir, kConfigDir / "service");
  EXPECT_EQ(config->build_tool, build::BuildTool::kMaven);
  EXPECT_EQ(
      config->exclude, (std::vector<std::string>{"bin", "generated"}));
  EXPECT_EQ(config->reports_dir, kConfigDir / "service" / "out" / "reports");
  EXPECT_EQ(config->log_level, "debug");
}

TEST(ProjectConfigTest, AbsolutePathsAreKept) {
  auto config = Load(R"(
[workspace]
root = "/srv/app"
[reports]
dir = "/tmp/reports"
)");

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->root_dir, fs::path("/srv/app"));
  EXPECT_EQ(config->reports_dir, fs::path("/tmp/reports"));
}

TEST(ProjectConfigTest, RelativeRootIsNormalized) {
  auto config = Load("[workspace]\nroot = \"../shared/./app\"\n");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->root_dir, fs::path("/work/shared/app"));
}

TEST(ProjectConfigTest, EmptyExcludeClearsDefault) {
  auto config = Load("[workspace]\nexclude = []\n");
  ASSERT_TRUE(config.has_value());
  EXPECT_TRUE(config->exclude.empty());
}

// ============================================================================
// Errors
// ============================================================================

TEST(ProjectConfigTest, UnknownBuildTool) {
  auto config = Load("[workspace]\nbuild_tool = \"ant\"\n");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().primary.kind, DiagKind::kError);
  EXPECT_EQ(
      config.error().primary.message,
      "'workspace.build_tool': unknown build tool 'ant'");
  ASSERT_TRUE(config.error().primary.location.has_value());
  EXPECT_EQ(config.error().primary.location->file, "spockscan.toml");
}

TEST(ProjectConfigTest, NonStringExclude) {
  auto config = Load("[workspace]\nexclude = [\"bin\", 3]\n");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(
      config.error().primary.message,
      "'workspace.exclude' must be an array of strings");
}

TEST(ProjectConfigTest, UnknownLogLevel) {
  auto config = Load("[logging]\nlevel = \"loud\"\n");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(
      config.error().primary.message,
      "unknown log level 'loud' in 'logging.level'");
}

TEST(ProjectConfigTest, MalformedToml) {
  auto config = Load("[workspace\nroot = 1\n");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().primary.kind, DiagKind::kError);
  EXPECT_TRUE(
      config.error().primary.message.starts_with(
          "failed to parse spockscan.toml: "));
}

TEST(ProjectConfigTest, LogLevels) {
  for (const auto* level :
       {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
    EXPECT_TRUE(IsValidLogLevel(level)) << level;
  }
  EXPECT_FALSE(IsValidLogLevel("warning"));
  EXPECT_FALSE(IsValidLogLevel(""));
}

// ============================================================================
// Files
// ============================================================================

class ProjectConfigFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_ = fs::temp_directory_path() /
        (std::string("spockscan_config_test_") + info->name());
    fs::remove_all(root_);
    fs::create_directories(root_ / "src" / "test" / "groovy");
  }

  void TearDown() override {
    fs::remove_all(root_);
  }

  void WriteConfig(const std::string& text) {
    std::ofstream out(root_ / kConfigFileName);
    out << text;
  }

  fs::path root_;
};

TEST_F(ProjectConfigFileTest, FindConfigWalksUp) {
  WriteConfig("");
  auto found = FindConfig(root_ / "src" / "test" / "groovy");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, root_ / kConfigFileName);
}

TEST_F(ProjectConfigFileTest, LoadConfigAnchorsOnFileDirectory) {
  WriteConfig("[workspace]\nbuild_tool = \"gradle\"\n[reports]\ndir = \"r\"\n");

  auto config = LoadConfig(root_ / kConfigFileName);

  ASSERT_TRUE(config.has_value()) << config.error().primary.message;
  EXPECT_EQ(config->root_dir, root_);
  EXPECT_EQ(config->build_tool, build::BuildTool::kGradle);
  EXPECT_EQ(config->reports_dir, root_ / "r");
}

TEST_F(ProjectConfigFileTest, LoadConfigParseErrorIsHostError) {
  WriteConfig("this is = = not toml\n");

  auto config = LoadConfig(root_ / kConfigFileName);

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().primary.kind, DiagKind::kHostError);
  EXPECT_TRUE(config.error().primary.message.starts_with("failed to parse "));
}

}  // namespace
}  // namespace spockscan::config
