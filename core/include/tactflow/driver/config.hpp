// tactflow/driver/config.hpp - Analyzer configuration (tactflow.yaml)
//
// Parses and validates tactflow.yaml. The command line overrides the
// values read here.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "tactflow/basic/logging.hpp"

namespace tactflow
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Solver section.
 */
struct SolverConfig
{
  /// Maximum block visits per CFG; unset means unbounded
  std::optional<uint64_t> max_iterations;

  /// Block updates before the interval analyses start widening
  uint64_t widening_threshold = 5;
};

/**
 * Complete analyzer configuration (tactflow.yaml).
 */
struct Config
{
  /// Detector ids to run; empty means every built-in detector
  std::vector<std::string> detectors;

  /// Also analyze functions from the bundled standard library
  bool include_stdlib = false;

  Verbosity verbosity = Verbosity::Default;

  SolverConfig solver;

  /// Directory containing tactflow.yaml, empty for the default config
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  Config config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(Config cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a configuration from a tactflow.yaml file.
 *
 * Unknown detector ids, an unknown verbosity and non-positive solver limits
 * are errors.
 */
[[nodiscard]] ConfigLoadResult load_config(const std::filesystem::path & config_path);

/// Same as load_config() for YAML text already in memory
[[nodiscard]] ConfigLoadResult parse_config(const std::string & yaml_text);

/**
 * Search for tactflow.yaml in `start_dir` and its parents.
 *
 * @return Path to the file if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_config_file_name = "tactflow.yaml";

}  // namespace tactflow
