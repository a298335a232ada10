// tactflow/detectors/exit_code_usage.cpp - Exit codes outside the user range
#include "tactflow/detectors/exit_code_usage.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <string>

#include "tactflow/ast/ast_utils.hpp"
#include "tactflow/ast/iterators.hpp"
#include "tactflow/basic/exceptions.hpp"

namespace tactflow
{

// ============================================================================
// IntervalTransfer
// ============================================================================

Interval IntervalTransfer::evaluate(const Expr & expr, const VariableIntervals & state)
{
  return std::visit(
    Overloaded{
      [](const NumberExpr & n) { return Interval::from_num(n.value); },
      [&](const IdExpr & id) {
        const auto it = state.find(id.name);
        return it != state.end() ? it->second : Interval::empty();
      },
      [&](const UnaryExpr & u) {
        if (u.op == UnaryOp::Neg) return evaluate(*u.operand, state).inv();
        if (u.op == UnaryOp::Plus) return evaluate(*u.operand, state);
        return Interval::full();
      },
      [&](const BinaryExpr & b) {
        const Interval lhs = evaluate(*b.left, state);
        const Interval rhs = evaluate(*b.right, state);
        try {
          switch (b.op) {
            case BinaryOp::Add:
              return lhs.plus(rhs);
            case BinaryOp::Sub:
              return lhs.minus(rhs);
            case BinaryOp::Mul:
              return lhs.times(rhs);
            case BinaryOp::Div:
              return lhs.div(rhs);
            default:
              break;
          }
        } catch (const ExecutionError &) {
          // Division by a range containing zero: the result is unknown.
        }
        return Interval::full();
      },
      [](const auto &) { return Interval::full(); },
    },
    expr.node);
}

VariableIntervals IntervalTransfer::transfer(
  const VariableIntervals & in, const BasicBlock & /*block*/, const Stmt & stmt) const
{
  VariableIntervals out = in;
  if (const auto * let = stmt.as<LetStmt>()) {
    out[let->name] = let->init != nullptr ? evaluate(*let->init, in) : Interval::full();
  } else if (const auto * assign = stmt.as<AssignStmt>()) {
    if (const auto var = assigned_variable(stmt)) {
      out[*var] = evaluate(*assign->value, in);
    }
  } else if (stmt.as<AugmentedAssignStmt>() != nullptr) {
    if (const auto var = assigned_variable(stmt)) {
      out[*var] = Interval::full();
    }
  }
  return out;
}

// ============================================================================
// ExitCodeUsage
// ============================================================================

namespace
{

/// Variable passed as the exit code of a throw-family call in `stmt`
const Expr * find_exit_code_variable(const Stmt & stmt)
{
  const Expr * call = find_in_expressions(stmt, [](const Expr & e) {
    const auto * c = e.as<StaticCallExpr>();
    return c != nullptr && is_throw_function(c->function) && !c->args.empty() &&
           c->args.front()->as<IdExpr>() != nullptr;
  });
  return call != nullptr ? call->as<StaticCallExpr>()->args.front() : nullptr;
}

}  // namespace

VariableIntervals ExitCodeUsage::entry_state(const FunctionDef & fn)
{
  std::set<std::string> declared;
  std::set<std::string> referenced;
  for (const Stmt * top : fn.body) {
    for_each_statement(*top, [&](const Stmt & stmt) {
      if (const auto * let = stmt.as<LetStmt>()) {
        declared.insert(let->name);
      }
    });
    for_each_expression_deep(*top, [&](const Expr & expr) {
      if (const auto * id = expr.as<IdExpr>()) {
        referenced.insert(id->name);
      }
    });
  }

  VariableIntervals state;
  for (const auto & param : fn.params) {
    state.emplace(param.name, Interval::full());
  }
  for (const auto & name : referenced) {
    if (declared.count(name) == 0) {
      state.emplace(name, Interval::full());
    }
  }
  return state;
}

bool ExitCodeUsage::is_outside_allowed_range(const Interval & interval)
{
  if (interval.is_empty()) {
    return false;
  }
  return interval.high() < Num::integer(k_min_user_exit_code) ||
         interval.low() > Num::integer(k_max_user_exit_code);
}

void ExitCodeUsage::check(
  const DetectorContext & ctx, const CompilationUnit & cu, DiagnosticBag & diags)
{
  const VariableIntervalLattice lattice{};
  const IntervalTransfer transfer{};

  cu.for_each_cfg(
    [&](const Cfg & cfg) {
      const FunctionDef * fn = cu.ast().get_function(cfg.function_id());
      if (fn == nullptr) {
        return;
      }
      WideningWorklistSolver<VariableIntervals> solver(
        cu, cfg, transfer, lattice, AnalysisKind::Forward, ctx.widening_threshold, ctx.solver);
      solver.set_boundary_state(entry_state(*fn));
      const auto results = solver.solve();
      ctx.logger->debug(
        "{}: '{}' solved in {} block visits", id(), cfg.name(), results.iterations());

      for_each_statement_state<VariableIntervals>(
        cu, cfg, results, transfer,
        [&](const Stmt & stmt, const BasicBlock &, const VariableIntervals & state) {
          const Expr * code = find_exit_code_variable(stmt);
          if (code == nullptr) {
            return;
          }
          const std::string & name = code->as<IdExpr>()->name;
          const auto it = state.find(name);
          if (it == state.end() || !is_outside_allowed_range(it->second)) {
            return;
          }
          report(
            diags, code->range,
            "Exit code variable \"" + name + "\" has value outside allowed range",
            "value: " + it->second.to_string())
            .with_note("Exit codes 0-255 are reserved")
            .with_help("Use a value between 256 and 65535");
        });
    },
    ctx.iteration);
}

}  // namespace tactflow
