// tests/unit/driver/test_config.cpp - Unit tests for tactflow.yaml loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "tactflow/driver/config.hpp"

using namespace tactflow;

namespace fs = std::filesystem;

// ============================================================================
// Helper Functions
// ============================================================================

static void expect_error(const std::string & yaml, const std::string & message)
{
  const auto result = parse_config(yaml);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, message);
}

namespace
{

/// Scratch directory removed at the end of the test
struct TempDir
{
  fs::path path;

  explicit TempDir(const std::string & name) : path(fs::temp_directory_path() / name)
  {
    fs::remove_all(path);
    fs::create_directories(path);
  }

  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  void write(const fs::path & relative, const std::string & content) const
  {
    fs::create_directories((path / relative).parent_path());
    std::ofstream out(path / relative);
    out << content;
  }
};

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(ConfigTest, EmptyDocumentGivesDefaults)
{
  const auto result = parse_config("");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.detectors.empty());
  EXPECT_FALSE(result.config.include_stdlib);
  EXPECT_EQ(result.config.verbosity, Verbosity::Default);
  EXPECT_FALSE(result.config.solver.max_iterations.has_value());
  EXPECT_EQ(result.config.solver.widening_threshold, 5u);
}

TEST(ConfigTest, ParsesEverySetting)
{
  const auto result = parse_config(
    "detectors: [SendInLoop, ExitCodeUsage]\n"
    "include_stdlib: true\n"
    "verbosity: debug\n"
    "solver:\n"
    "  max_iterations: 1000\n"
    "  widening_threshold: 3\n");
  ASSERT_TRUE(result.success) << result.error;

  const Config & config = result.config;
  EXPECT_EQ(config.detectors, (std::vector<std::string>{"SendInLoop", "ExitCodeUsage"}));
  EXPECT_TRUE(config.include_stdlib);
  EXPECT_EQ(config.verbosity, Verbosity::Debug);
  ASSERT_TRUE(config.solver.max_iterations.has_value());
  EXPECT_EQ(*config.solver.max_iterations, 1000u);
  EXPECT_EQ(config.solver.widening_threshold, 3u);
}

TEST(ConfigTest, RejectsInvalidSettings)
{
  expect_error("- a\n- b\n", "configuration must be a map");
  expect_error("detectors: SendInLoop\n", "detectors must be a list");
  expect_error("detectors: [Reentrancy]\n", "unknown detector: 'Reentrancy'");
  expect_error(
    "verbosity: loud\n", "invalid verbosity: 'loud' (must be 'quiet', 'default' or 'debug')");
  expect_error("solver: 3\n", "solver must be a map");
  expect_error("solver:\n  max_iterations: 0\n", "solver.max_iterations must be positive, got 0");
  expect_error(
    "solver:\n  widening_threshold: -2\n", "solver.widening_threshold must be positive, got -2");
  expect_error("solver:\n  max_iterations: many\n", "solver.max_iterations must be an integer");
}

TEST(ConfigTest, MalformedYamlIsReported)
{
  const auto result = parse_config("detectors: [SendInLoop\n");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("failed to parse YAML: ", 0), 0u) << result.error;
}

// ============================================================================
// Files
// ============================================================================

TEST(ConfigTest, LoadConfigSetsRoot)
{
  const TempDir dir("tactflow_config_load_test");
  dir.write(k_config_file_name, "include_stdlib: true\n");

  const auto result = load_config(dir.path / k_config_file_name);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.include_stdlib);
  EXPECT_EQ(result.config.config_root, fs::absolute(dir.path));
}

TEST(ConfigTest, LoadConfigPrefixesErrorsWithPath)
{
  const TempDir dir("tactflow_config_error_test");
  dir.write(k_config_file_name, "verbosity: loud\n");

  const fs::path path = dir.path / k_config_file_name;
  const auto result = load_config(path);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind(path.string() + ": invalid verbosity", 0), 0u) << result.error;
}

TEST(ConfigTest, LoadConfigMissingFile)
{
  const fs::path path = fs::temp_directory_path() / "tactflow_no_such_dir" / "tactflow.yaml";
  const auto result = load_config(path);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "configuration file not found: " + path.string());
}

TEST(ConfigTest, FindConfigSearchesParents)
{
  const TempDir dir("tactflow_config_find_test");
  dir.write(k_config_file_name, "");
  dir.write("contracts/build/unit.json", "{}");

  const auto from_dir = find_config(dir.path / "contracts" / "build");
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_EQ(fs::canonical(*from_dir), fs::canonical(dir.path / k_config_file_name));

  const auto from_file = find_config(dir.path / "contracts" / "build" / "unit.json");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(fs::canonical(*from_file), fs::canonical(dir.path / k_config_file_name));
}
