// tactflow/detectors/timestamp_dependence.hpp - Dependencies on the block timestamp
#pragma once

#include <set>
#include <string>

#include "tactflow/dataflow/lattice.hpp"
#include "tactflow/dataflow/transfer.hpp"
#include "tactflow/detectors/detector.hpp"

namespace tactflow
{

/// Variables holding a value derived from `now()`
using TimestampTaint = std::set<std::string>;

/**
 * `let x = e`, `x = e` and `x op= e` taint `x` when `e` calls `now()` or
 * reads a tainted variable. Assignments to field paths are not tracked.
 */
class TimestampTaintTransfer final : public Transfer<TimestampTaint>
{
public:
  [[nodiscard]] TimestampTaint transfer(
    const TimestampTaint & in, const BasicBlock & block, const Stmt & stmt) const override;

  /// `expr` or a subexpression calls `now()` or reads a variable in `taint`
  [[nodiscard]] static bool is_tainted(const Expr & expr, const TimestampTaint & taint);
};

/**
 * Reports statements that use `now()` or a variable derived from it.
 *
 * Block timestamps are chosen by validators and are public, so they must
 * not drive randomness, loop bounds or access control.
 */
class TimestampDependence final : public Detector
{
public:
  [[nodiscard]] std::string_view id() const noexcept override { return "TimestampDependence"; }
  [[nodiscard]] std::string_view description() const noexcept override
  {
    return "Logic that depends on now()";
  }
  [[nodiscard]] Severity severity() const noexcept override { return Severity::Info; }

  void check(const DetectorContext & ctx, const CompilationUnit & cu, DiagnosticBag & diags) override;

  /// Finding message for a tainted use in a statement of kind `kind`
  [[nodiscard]] static std::string_view message_for(StmtKind kind) noexcept;
};

}  // namespace tactflow
