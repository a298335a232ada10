// tactflow/driver/analyzer.hpp - Analysis driver
//
// Single entry point for loading an IR file and running detectors over it.
// Used by the CLI and by the end-to-end tests.
//
#pragma once

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tactflow/basic/diagnostic.hpp"
#include "tactflow/driver/config.hpp"
#include "tactflow/ir/compilation_unit.hpp"

namespace tactflow
{

// ============================================================================
// Analyze Options
// ============================================================================

/**
 * Command line overrides of the configuration.
 */
struct AnalyzeOptions
{
  /// Detectors to run instead of the configured ones
  std::vector<std::string> detectors;

  /// Run every built-in detector, ignoring `detectors` and the config
  bool all_detectors = false;

  std::optional<bool> include_stdlib;
};

// ============================================================================
// Analyze Result
// ============================================================================

/// Diagnostic code of a detector that could not complete
inline constexpr const char * k_analysis_failure_code = "analysis-failure";

struct AnalyzeResult
{
  /// Input was loaded and every selected detector completed
  bool success = false;

  /// Findings, and errors for inputs or detectors that failed
  DiagnosticBag diagnostics;

  /// Loaded unit (null when loading failed)
  std::unique_ptr<CompilationUnit> unit;

  /// Ids of the detectors that ran, in order
  std::vector<std::string> detectors_run;

  /// Number of diagnostics produced by detectors
  [[nodiscard]] size_t finding_count() const;
};

// ============================================================================
// Analyzer
// ============================================================================

/**
 * Runs the selected detectors over a CompilationUnit.
 *
 * A detector that throws AnalysisError is logged and recorded as an error
 * diagnostic with code k_analysis_failure_code; the remaining detectors
 * still run.
 */
class Analyzer
{
public:
  Analyzer(Config config, std::shared_ptr<spdlog::logger> logger);

  /// Load the JSON IR at `ir_path` and analyze it
  [[nodiscard]] AnalyzeResult analyze_file(
    const std::filesystem::path & ir_path, const AnalyzeOptions & options = {}) const;

  /// Analyze an already loaded unit
  [[nodiscard]] AnalyzeResult analyze_unit(
    std::unique_ptr<CompilationUnit> unit, const AnalyzeOptions & options = {}) const;

  /**
   * Detector ids selected by `options` over the configuration. Unknown ids
   * are reported to `diags` and dropped.
   */
  [[nodiscard]] std::vector<std::string> select_detectors(
    const AnalyzeOptions & options, DiagnosticBag & diags) const;

  [[nodiscard]] const Config & config() const noexcept { return config_; }

private:
  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tactflow
