// tests/unit/driver/test_analyzer.cpp - Unit tests for the analysis driver
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "tactflow/basic/logging.hpp"
#include "tactflow/driver/analyzer.hpp"
#include "tactflow/test_support/ir_helpers.hpp"

using namespace tactflow;
using test_support::UnitBuilder;

namespace fs = std::filesystem;

// ============================================================================
// Helper Functions
// ============================================================================

/// `fun tick() { let t = now(); if (t > 100) {} }`
static std::unique_ptr<CompilationUnit> timestamp_unit()
{
  UnitBuilder b;
  const auto * fn = b.function(
    "tick",
    {
      b.let("t", b.call("now")),
      b.condition(b.bin(BinaryOp::Gt, b.id("t"), b.num(100))),
    });
  b.linear_cfg(*fn);
  return b.finish();
}

static Analyzer make_analyzer(Config config = {})
{
  return Analyzer(std::move(config), make_null_logger("test"));
}

static const char * const k_ir = R"json({
  "project": "clock",
  "files": [ { "id": 0, "path": "clock.tact", "content": "fun f() { let t = now(); }" } ],
  "functions": [
    { "id": 1, "name": "tick", "kind": "function",
      "body": [
        { "id": 2, "kind": "statement_let", "name": "t",
          "expression": { "id": 3, "kind": "static_call", "function": "now", "args": [],
                          "loc": { "file": 0, "start": 18, "end": 23 } } }
      ] }
  ],
  "cfgs": [
    { "idx": 0, "name": "tick", "function_id": 1, "kind": "function",
      "blocks": [ { "idx": 0, "stmts": [2], "kind": "exit" } ], "edges": [] }
  ]
})json";

// ============================================================================
// Detector Selection
// ============================================================================

TEST(AnalyzerTest, DefaultsToEveryDetector)
{
  const Analyzer analyzer = make_analyzer();
  DiagnosticBag diags;
  const auto ids = analyzer.select_detectors({}, diags);
  EXPECT_EQ(ids.size(), 4u);
  EXPECT_EQ(diags.size(), 0u);
}

TEST(AnalyzerTest, OptionsOverrideConfig)
{
  Config config;
  config.detectors = {"ExitCodeUsage"};
  const Analyzer analyzer = make_analyzer(config);
  DiagnosticBag diags;

  EXPECT_EQ(analyzer.select_detectors({}, diags), (std::vector<std::string>{"ExitCodeUsage"}));

  AnalyzeOptions options;
  options.detectors = {"SendInLoop"};
  EXPECT_EQ(analyzer.select_detectors(options, diags), (std::vector<std::string>{"SendInLoop"}));

  AnalyzeOptions all;
  all.all_detectors = true;
  EXPECT_EQ(analyzer.select_detectors(all, diags).size(), 4u);
}

TEST(AnalyzerTest, UnknownDetectorIsAnError)
{
  const Analyzer analyzer = make_analyzer();
  AnalyzeOptions options;
  options.detectors = {"Reentrancy"};

  const auto result = analyzer.analyze_unit(timestamp_unit(), options);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.detectors_run.empty());
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics.begin()->message, "unknown detector: 'Reentrancy'");
  EXPECT_EQ(result.finding_count(), 0u);
}

// ============================================================================
// Analysis
// ============================================================================

TEST(AnalyzerTest, RunsSelectedDetectors)
{
  const auto result = make_analyzer().analyze_unit(timestamp_unit());
  ASSERT_TRUE(result.success);
  ASSERT_NE(result.unit, nullptr);
  EXPECT_EQ(
    result.detectors_run, (std::vector<std::string>{
                            "TimestampDependence",
                            "ExitCodeUsage",
                            "UnprotectedCall",
                            "SendInLoop",
                          }));
  EXPECT_EQ(result.finding_count(), 2u);
  EXPECT_EQ(result.diagnostics.with_code("TimestampDependence").size(), 2u);
}

TEST(AnalyzerTest, FailingDetectorDoesNotStopOthers)
{
  Config config;
  config.solver.max_iterations = 1;
  AnalyzeOptions options;
  options.detectors = {"TimestampDependence", "SendInLoop"};

  const auto result = make_analyzer(config).analyze_unit(timestamp_unit(), options);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(
    result.detectors_run, (std::vector<std::string>{"TimestampDependence", "SendInLoop"}));

  const auto failures = result.diagnostics.with_code(k_analysis_failure_code);
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures.front().severity, Severity::Error);
  EXPECT_EQ(failures.front().message.rfind("TimestampDependence failed: ", 0), 0u);
  EXPECT_EQ(result.finding_count(), 0u);
}

TEST(AnalyzerTest, AnalyzesFile)
{
  const fs::path path = fs::temp_directory_path() / "tactflow_analyzer_test.json";
  {
    std::ofstream out(path);
    out << k_ir;
  }
  AnalyzeOptions options;
  options.detectors = {"TimestampDependence"};
  const auto result = make_analyzer().analyze_file(path, options);
  fs::remove(path);

  ASSERT_TRUE(result.success);
  ASSERT_NE(result.unit, nullptr);
  EXPECT_EQ(result.unit->project_name(), "clock");
  ASSERT_EQ(result.finding_count(), 1u);
  EXPECT_EQ(
    result.diagnostics.begin()->message, "Variable declaration uses now() or a tainted variable");
}

TEST(AnalyzerTest, MissingFileFails)
{
  const fs::path path = fs::temp_directory_path() / "tactflow_no_such_input.json";
  const auto result = make_analyzer().analyze_file(path);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.unit, nullptr);
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_NE(result.diagnostics.begin()->message.find("cannot open"), std::string::npos);
  EXPECT_TRUE(result.detectors_run.empty());
}
