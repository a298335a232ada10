// tactflow/detectors/exit_code_usage.hpp - Exit codes outside the user range
#pragma once

#include "tactflow/dataflow/interval_lattice.hpp"
#include "tactflow/dataflow/transfer.hpp"
#include "tactflow/detectors/detector.hpp"

namespace tactflow
{

/**
 * Tracks the interval of each local variable through `let` and assignments
 * to a plain variable. Only number literals, variables and `+ - * /` are
 * evaluated; every other expression is FULL. A variable missing from the
 * state is EMPTY, matching the lattice's bottom.
 */
class IntervalTransfer final : public Transfer<VariableIntervals>
{
public:
  [[nodiscard]] VariableIntervals transfer(
    const VariableIntervals & in, const BasicBlock & block, const Stmt & stmt) const override;

  /// Abstract value of `expr`; unbound variables are EMPTY
  [[nodiscard]] static Interval evaluate(const Expr & expr, const VariableIntervals & state);
};

/**
 * Reports `throw(code)`-like calls whose code variable can only hold values
 * reserved by the VM (0-255) or values above 65535.
 */
class ExitCodeUsage final : public Detector
{
public:
  static constexpr long k_min_user_exit_code = 256;
  static constexpr long k_max_user_exit_code = 65535;

  [[nodiscard]] std::string_view id() const noexcept override { return "ExitCodeUsage"; }
  [[nodiscard]] std::string_view description() const noexcept override
  {
    return "Exit code variables outside the range 256-65535";
  }
  [[nodiscard]] Severity severity() const noexcept override { return Severity::Error; }

  void check(const DetectorContext & ctx, const CompilationUnit & cu, DiagnosticBag & diags) override;

  /// Parameters and names `fn` never declares, all FULL
  [[nodiscard]] static VariableIntervals entry_state(const FunctionDef & fn);

  /// Every value of `interval` lies outside the user range; false for EMPTY
  [[nodiscard]] static bool is_outside_allowed_range(const Interval & interval);
};

}  // namespace tactflow
