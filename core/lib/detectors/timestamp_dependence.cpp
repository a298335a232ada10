// tactflow/detectors/timestamp_dependence.cpp - Dependencies on the block timestamp
#include "tactflow/detectors/timestamp_dependence.hpp"

#include <spdlog/spdlog.h>

#include "tactflow/ast/ast_utils.hpp"
#include "tactflow/ast/iterators.hpp"

namespace tactflow
{

namespace
{

bool reads_timestamp(const Expr & e, const TimestampTaint & taint)
{
  if (is_static_call(e, "now")) {
    return true;
  }
  const auto * id = e.as<IdExpr>();
  return id != nullptr && (id->name == "now" || taint.count(id->name) > 0);
}

}  // namespace

// ============================================================================
// TimestampTaintTransfer
// ============================================================================

bool TimestampTaintTransfer::is_tainted(const Expr & expr, const TimestampTaint & taint)
{
  return find_in_expression(expr, [&](const Expr & e) { return reads_timestamp(e, taint); }) !=
         nullptr;
}

TimestampTaint TimestampTaintTransfer::transfer(
  const TimestampTaint & in, const BasicBlock & /*block*/, const Stmt & stmt) const
{
  TimestampTaint out = in;
  if (const auto * let = stmt.as<LetStmt>()) {
    if (let->init != nullptr && is_tainted(*let->init, in)) {
      out.insert(let->name);
    }
    return out;
  }

  const Expr * value = nullptr;
  if (const auto * assign = stmt.as<AssignStmt>()) {
    value = assign->value;
  } else if (const auto * aug = stmt.as<AugmentedAssignStmt>()) {
    value = aug->value;
  }
  if (value != nullptr && is_tainted(*value, in)) {
    if (auto var = assigned_variable(stmt)) {
      out.insert(std::move(*var));
    }
  }
  return out;
}

// ============================================================================
// TimestampDependence
// ============================================================================

std::string_view TimestampDependence::message_for(StmtKind kind) noexcept
{
  switch (kind) {
    case StmtKind::Condition:
      return "Tainted timestamp used in a condition";
    case StmtKind::Return:
      return "Returning a tainted timestamp";
    case StmtKind::While:
    case StmtKind::Until:
    case StmtKind::Repeat:
      return "Loop condition depends on tainted timestamp";
    case StmtKind::Assign:
    case StmtKind::AugmentedAssign:
      return "Assignment uses now() or a tainted variable";
    case StmtKind::Let:
      return "Variable declaration uses now() or a tainted variable";
    default:
      break;
  }
  return "Time-dependent usage found";
}

void TimestampDependence::check(
  const DetectorContext & ctx, const CompilationUnit & cu, DiagnosticBag & diags)
{
  const SetJoinSemilattice<std::string> lattice{};
  const TimestampTaintTransfer transfer{};

  cu.for_each_cfg(
    [&](const Cfg & cfg) {
      const WorklistSolver<TimestampTaint> solver(
        cu, cfg, transfer, lattice, AnalysisKind::Forward, ctx.solver);
      const auto results = solver.solve();
      ctx.logger->debug(
        "{}: '{}' solved in {} block visits", id(), cfg.name(), results.iterations());

      for_each_statement_state<TimestampTaint>(
        cu, cfg, results, transfer,
        [&](const Stmt & stmt, const BasicBlock &, const TimestampTaint & state) {
          const Expr * use = find_in_expressions(
            stmt, [&](const Expr & e) { return reads_timestamp(e, state); });
          if (use == nullptr) {
            return;
          }
          report(diags, stmt.range, std::string(message_for(stmt.kind())))
            .with_secondary_label(use->range, "depends on now()")
            .with_help("Block timestamps are predictable; do not use them for randomness or control flow");
        });
    },
    ctx.iteration);
}

}  // namespace tactflow
