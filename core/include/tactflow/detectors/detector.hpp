// tactflow/detectors/detector.hpp - Detector interface
#pragma once

#include <spdlog/logger.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>

#include "tactflow/basic/diagnostic.hpp"
#include "tactflow/dataflow/solver_results.hpp"
#include "tactflow/dataflow/transfer.hpp"
#include "tactflow/dataflow/worklist_solver.hpp"
#include "tactflow/ir/compilation_unit.hpp"

namespace tactflow
{

/**
 * Settings a detector runs with. Filled by the driver from the
 * configuration file and command line.
 */
struct DetectorContext
{
  std::shared_ptr<spdlog::logger> logger;

  /// Which CFGs to analyze
  CfgIterationOptions iteration;

  /// Budget passed to every solver
  SolverOptions solver;

  /// Block updates before WideningWorklistSolver starts widening
  uint64_t widening_threshold = 5;
};

/**
 * A check over a CompilationUnit that reports findings as diagnostics.
 *
 * Detectors do not own the unit and must not modify it. Findings carry the
 * detector id as their code.
 */
class Detector
{
public:
  virtual ~Detector() = default;

  [[nodiscard]] virtual std::string_view id() const noexcept = 0;
  [[nodiscard]] virtual std::string_view description() const noexcept = 0;

  /// Severity of the findings
  [[nodiscard]] virtual Severity severity() const noexcept { return Severity::Warning; }

  /**
   * Analyze `cu` and add findings to `diags`.
   *
   * @throws AnalysisError when the IR is inconsistent or an analysis cannot
   *         complete
   */
  virtual void check(const DetectorContext & ctx, const CompilationUnit & cu, DiagnosticBag & diags) = 0;

protected:
  /// Start a finding with this detector's severity and code
  DiagnosticBuilder report(
    DiagnosticBag & diags, SourceRange range, std::string message,
    std::string label_message = "") const;
};

/**
 * Walk the statements of `cfg` with the state holding just before each of
 * them, starting every block from its in-state in `results` and replaying
 * `transfer` through the block. Blocks without an in-state are skipped.
 * Only meaningful for forward analyses.
 */
template <typename S>
void for_each_statement_state(
  const CompilationUnit & cu, const Cfg & cfg, const SolverResults<S> & results,
  const Transfer<S> & transfer,
  const std::function<void(const Stmt &, const BasicBlock &, const S &)> & fn)
{
  for (const auto & block : cfg.blocks()) {
    const S * in = results.get_in_state(block->idx);
    if (in == nullptr) {
      continue;
    }
    S state = *in;
    for (const AstId id : block->stmts) {
      const Stmt * stmt = cu.ast().get_stmt(id);
      if (stmt == nullptr) {
        throw InternalError(
          "cannot find statement " + std::to_string(id) + " of block " +
          std::to_string(block->idx) + " in '" + cfg.name() + "'");
      }
      fn(*stmt, *block, state);
      state = transfer.transfer(state, *block, *stmt);
    }
  }
}

}  // namespace tactflow
