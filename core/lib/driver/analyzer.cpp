// tactflow/driver/analyzer.cpp - Analysis driver implementation
//
#include "tactflow/driver/analyzer.hpp"

#include <spdlog/spdlog.h>

#include "tactflow/basic/exceptions.hpp"
#include "tactflow/detectors/registry.hpp"
#include "tactflow/ir/ir_loader.hpp"

namespace tactflow
{

size_t AnalyzeResult::finding_count() const
{
  size_t n = 0;
  for (const auto & d : diagnostics) {
    if (is_builtin_detector(d.code)) {
      ++n;
    }
  }
  return n;
}

Analyzer::Analyzer(Config config, std::shared_ptr<spdlog::logger> logger)
: config_(std::move(config)), logger_(std::move(logger))
{
}

std::vector<std::string> Analyzer::select_detectors(
  const AnalyzeOptions & options, DiagnosticBag & diags) const
{
  std::vector<std::string> requested;
  if (!options.all_detectors) {
    requested = !options.detectors.empty() ? options.detectors : config_.detectors;
  }
  if (requested.empty()) {
    for (const auto id : builtin_detector_ids()) {
      requested.emplace_back(id);
    }
    return requested;
  }

  std::vector<std::string> selected;
  for (auto & id : requested) {
    if (!is_builtin_detector(id)) {
      diags.report_error(SourceRange{}, "unknown detector: '" + id + "'")
        .with_help("run 'tactflow list-detectors' to see the available detectors");
      continue;
    }
    selected.push_back(std::move(id));
  }
  return selected;
}

AnalyzeResult Analyzer::analyze_file(
  const std::filesystem::path & ir_path, const AnalyzeOptions & options) const
{
  IrLoader loader(logger_);
  IrLoadResult loaded = loader.load_file(ir_path);
  if (!loaded.success) {
    AnalyzeResult result;
    result.diagnostics.report_error(SourceRange{}, loaded.error);
    return result;
  }
  return analyze_unit(std::move(loaded.unit), options);
}

AnalyzeResult Analyzer::analyze_unit(
  std::unique_ptr<CompilationUnit> unit, const AnalyzeOptions & options) const
{
  AnalyzeResult result;
  result.unit = std::move(unit);

  const auto ids = select_detectors(options, result.diagnostics);

  DetectorContext ctx;
  ctx.logger = logger_;
  ctx.iteration.include_stdlib = options.include_stdlib.value_or(config_.include_stdlib);
  ctx.solver.max_iterations = config_.solver.max_iterations;
  ctx.widening_threshold = config_.solver.widening_threshold;

  bool failed = result.diagnostics.has_errors();
  for (const auto & id : ids) {
    auto detector = make_detector(id);
    if (!detector) {
      throw InternalError("detector '" + id + "' is registered but cannot be created");
    }

    DiagnosticBag found;
    try {
      detector->check(ctx, *result.unit, found);
    } catch (const AnalysisError & e) {
      logger_->error("{} failed: {}", id, e.what());
      result.diagnostics.report_error(SourceRange{}, id + " failed: " + e.what())
        .with_code(k_analysis_failure_code);
      failed = true;
      result.detectors_run.push_back(id);
      continue;
    }
    logger_->debug("{}: {} findings", id, found.size());
    result.diagnostics.merge(std::move(found));
    result.detectors_run.push_back(id);
  }

  result.diagnostics.sort_by_location();
  result.success = !failed;
  return result;
}

}  // namespace tactflow
