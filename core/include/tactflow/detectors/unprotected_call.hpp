// tactflow/detectors/unprotected_call.hpp - Sends and state writes driven by unchecked arguments
#pragma once

#include <string>
#include <vector>

#include "tactflow/dataflow/lattice.hpp"
#include "tactflow/dataflow/persistent_list.hpp"
#include "tactflow/dataflow/transfer.hpp"
#include "tactflow/detectors/detector.hpp"

namespace tactflow
{

/**
 * A variable whose value derives from a function argument.
 *
 * `id` is the statement that introduced the variable (the function itself
 * for parameters) and `parents` the ids of the taints it was computed from.
 * The origin of a taint is its statement and variable; `parents` depend on
 * the incoming state and do not distinguish taints. A taint stops being
 * `unprotected` once an `if` tests it.
 */
struct ArgTaint
{
  AstId id = 0;
  std::string name;
  std::vector<AstId> parents;
  bool unprotected = true;

  /// Same variable from the same statement, regardless of protection
  [[nodiscard]] bool same_origin(const ArgTaint & other) const noexcept
  {
    return id == other.id && name == other.name;
  }

  friend bool operator==(const ArgTaint & a, const ArgTaint & b) noexcept
  {
    return a.same_origin(b) && a.unprotected == b.unprotected;
  }
};

using ArgTaints = PersistentList<ArgTaint>;

/**
 * Sets of taints keyed by origin. For the same origin an unprotected taint
 * is above a protected one.
 */
class ArgTaintLattice final : public JoinSemilattice<ArgTaints>
{
public:
  [[nodiscard]] ArgTaints bottom() const override { return {}; }
  [[nodiscard]] ArgTaints join(const ArgTaints & a, const ArgTaints & b) const override;
  [[nodiscard]] bool leq(const ArgTaints & a, const ArgTaints & b) const override;
};

/**
 * `let x = e` and `x = e` add a taint for `x` when `e` uses a tainted value;
 * `if (c)` protects the taints used in `c`.
 */
class UnprotectedCallTransfer final : public Transfer<ArgTaints>
{
public:
  /// `params` are the taints of the analyzed function's parameters
  explicit UnprotectedCallTransfer(std::vector<ArgTaint> params);

  [[nodiscard]] ArgTaints transfer(
    const ArgTaints & in, const BasicBlock & block, const Stmt & stmt) const override;

  /// Taints `expr` reads, looked up in `state` and then in the parameters
  [[nodiscard]] std::vector<ArgTaint> find_taints(const Expr & expr, const ArgTaints & state) const;

private:
  void collect_taints(
    const Expr & expr, const ArgTaints & state, std::vector<ArgTaint> & out) const;

  std::vector<ArgTaint> params_;
};

/**
 * Reports send arguments and in-place mutations of contract fields whose
 * values come from function arguments that were never checked in a
 * condition.
 */
class UnprotectedCall final : public Detector
{
public:
  [[nodiscard]] std::string_view id() const noexcept override { return "UnprotectedCall"; }
  [[nodiscard]] std::string_view description() const noexcept override
  {
    return "Sends or state writes that use unchecked function arguments";
  }
  [[nodiscard]] Severity severity() const noexcept override { return Severity::Error; }

  void check(const DetectorContext & ctx, const CompilationUnit & cu, DiagnosticBag & diags) override;

  /// Seed taints for the parameters of `fn`
  [[nodiscard]] static std::vector<ArgTaint> parameter_taints(const FunctionDef & fn);
};

}  // namespace tactflow
