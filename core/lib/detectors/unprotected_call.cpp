// tactflow/detectors/unprotected_call.cpp - Sends and state writes driven by unchecked arguments
#include "tactflow/detectors/unprotected_call.hpp"

#include <gsl/span>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>

#include "tactflow/ast/ast_utils.hpp"
#include "tactflow/ast/iterators.hpp"

namespace tactflow
{

namespace
{

/// Receiver at the bottom of `x.a().b()` and the number of calls above it
const Expr * method_chain_root(const Expr & expr, size_t & calls)
{
  const Expr * current = &expr;
  calls = 0;
  while (const auto * call = current->as<MethodCallExpr>()) {
    if (call->self == nullptr) {
      return nullptr;
    }
    ++calls;
    current = call->self;
  }
  return current;
}

/// Taint in `list` with the origin of `taint`, or nullptr
const ArgTaint * find_same_origin(const ArgTaints & list, const ArgTaint & taint)
{
  for (const ArgTaint & t : list) {
    if (t.same_origin(taint)) {
      return &t;
    }
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// ArgTaintLattice
// ============================================================================

ArgTaints ArgTaintLattice::join(const ArgTaints & a, const ArgTaints & b) const
{
  if (b.empty() || a.shares_storage_with(b)) {
    return a;
  }
  // Taints of `b` that `a` lacks, or has only in protected form.
  std::vector<const ArgTaint *> missing;
  for (const ArgTaint & t : b) {
    const ArgTaint * existing = find_same_origin(a, t);
    if (existing == nullptr || (t.unprotected && !existing->unprotected)) {
      missing.push_back(&t);
    }
  }
  if (missing.empty()) {
    return a;
  }
  ArgTaints out = a.remove_if([&](const ArgTaint & t) {
    return std::any_of(missing.begin(), missing.end(), [&](const ArgTaint * m) {
      return m->same_origin(t);
    });
  });
  for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
    out = out.push_front(**it);
  }
  return out;
}

bool ArgTaintLattice::leq(const ArgTaints & a, const ArgTaints & b) const
{
  if (a.shares_storage_with(b)) {
    return true;
  }
  for (const ArgTaint & t : a) {
    const ArgTaint * other = find_same_origin(b, t);
    if (other == nullptr || (t.unprotected && !other->unprotected)) {
      return false;
    }
  }
  return true;
}

// ============================================================================
// UnprotectedCallTransfer
// ============================================================================

UnprotectedCallTransfer::UnprotectedCallTransfer(std::vector<ArgTaint> params)
: params_(std::move(params))
{
}

void UnprotectedCallTransfer::collect_taints(
  const Expr & expr, const ArgTaints & state, std::vector<ArgTaint> & out) const
{
  const auto lookup = [&](const std::string & name) {
    for (const ArgTaint & t : state) {
      if (t.name == name && t.unprotected) {
        out.push_back(t);
        return;
      }
    }
    for (const ArgTaint & t : params_) {
      if (t.name == name) {
        out.push_back(t);
        return;
      }
    }
  };

  std::visit(
    Overloaded{
      [&](const IdExpr & id) { lookup(id.name); },
      [&](const BinaryExpr & b) {
        collect_taints(*b.left, state, out);
        collect_taints(*b.right, state, out);
      },
      [&](const UnaryExpr & u) { collect_taints(*u.operand, state, out); },
      [&](const ConditionalExpr & c) {
        collect_taints(*c.condition, state, out);
        collect_taints(*c.then_branch, state, out);
        collect_taints(*c.else_branch, state, out);
      },
      [&](const MethodCallExpr &) {
        // `arg.loadRef().beginParse()` carries the taint of `arg`.
        size_t calls = 0;
        const Expr * root = method_chain_root(expr, calls);
        if (root != nullptr) {
          if (const auto * id = root->as<IdExpr>()) {
            lookup(id->name);
          }
        }
      },
      [](const auto &) {},
    },
    expr.node);
}

std::vector<ArgTaint> UnprotectedCallTransfer::find_taints(
  const Expr & expr, const ArgTaints & state) const
{
  std::vector<ArgTaint> out;
  collect_taints(expr, state, out);
  return out;
}

ArgTaints UnprotectedCallTransfer::transfer(
  const ArgTaints & in, const BasicBlock & /*block*/, const Stmt & stmt) const
{
  std::optional<std::string> target;
  const Expr * value = nullptr;
  if (const auto * let = stmt.as<LetStmt>()) {
    target = let->name;
    value = let->init;
  } else if (const auto * assign = stmt.as<AssignStmt>()) {
    target = assigned_variable(stmt);
    value = assign->value;
  } else if (const auto * aug = stmt.as<AugmentedAssignStmt>()) {
    target = assigned_variable(stmt);
    value = aug->value;
  }

  if (target && value != nullptr) {
    const auto found = find_taints(*value, in);
    if (found.empty()) {
      return in;
    }
    ArgTaint taint;
    taint.id = stmt.id;
    taint.name = std::move(*target);
    for (const ArgTaint & t : found) {
      taint.parents.push_back(t.id);
    }
    const ArgTaints rest = in.remove_if([&](const ArgTaint & t) { return t.same_origin(taint); });
    return rest.push_front(std::move(taint));
  }

  if (const auto * cond = stmt.as<ConditionStmt>()) {
    const auto found = find_taints(*cond->condition, in);
    const auto is_checked = [&](const ArgTaint & t) {
      return t.unprotected && std::any_of(found.begin(), found.end(), [&](const ArgTaint & f) {
               return f.id == t.id;
             });
    };
    std::vector<ArgTaint> checked;
    for (const ArgTaint & t : in) {
      if (is_checked(t)) {
        checked.push_back(t);
      }
    }
    if (checked.empty()) {
      return in;
    }
    ArgTaints out = in.remove_if(is_checked);
    for (auto it = checked.rbegin(); it != checked.rend(); ++it) {
      ArgTaint t = *it;
      t.unprotected = false;
      out = out.push_front(std::move(t));
    }
    return out;
  }

  return in;
}

// ============================================================================
// UnprotectedCall
// ============================================================================

std::vector<ArgTaint> UnprotectedCall::parameter_taints(const FunctionDef & fn)
{
  std::vector<ArgTaint> taints;
  taints.reserve(fn.params.size());
  for (const Param & p : fn.params) {
    ArgTaint t;
    t.id = fn.id;
    t.name = p.name;
    taints.push_back(std::move(t));
  }
  return taints;
}

namespace
{

bool is_unprotected(const ArgTaints & state, const std::string & name)
{
  return state.any_of([&](const ArgTaint & t) { return t.name == name && t.unprotected; });
}

/// Variables among `args` that hold unprotected taints
std::vector<const Expr *> unprotected_arguments(
  gsl::span<const Expr * const> args, const ArgTaints & state)
{
  std::vector<const Expr *> found;
  for (const Expr * arg : args) {
    const auto * id = arg->as<IdExpr>();
    if (id != nullptr && is_unprotected(state, id->name)) {
      found.push_back(arg);
    }
  }
  return found;
}

/// Arguments of a send call, with struct literals replaced by their field initializers
std::vector<const Expr *> send_arguments(const Expr & call)
{
  const std::vector<const Expr *> * args = nullptr;
  if (const auto * s = call.as<StaticCallExpr>()) {
    args = &s->args;
  } else if (const auto * m = call.as<MethodCallExpr>()) {
    args = &m->args;
  }
  std::vector<const Expr *> flat;
  if (args == nullptr) {
    return flat;
  }
  for (const Expr * arg : *args) {
    if (const auto * si = arg->as<StructInstanceExpr>()) {
      for (const auto & field : si->fields) {
        flat.push_back(field.initializer);
      }
    } else {
      flat.push_back(arg);
    }
  }
  return flat;
}

/// `self.f.m(...)` where `m` mutates the field in place
bool is_field_mutation(const Expr & expr)
{
  const auto * call = expr.as<MethodCallExpr>();
  if (call == nullptr) {
    return false;
  }
  size_t calls = 0;
  const Expr * root = method_chain_root(expr, calls);
  if (root == nullptr || calls != 1 || !is_mutating_method(call->method)) {
    return false;
  }
  const auto * access = root->as<FieldAccessExpr>();
  return access != nullptr && access->aggregate != nullptr && is_self(*access->aggregate);
}

}  // namespace

void UnprotectedCall::check(
  const DetectorContext & ctx, const CompilationUnit & cu, DiagnosticBag & diags)
{
  const ArgTaintLattice lattice{};
  const CallGraph & cg = cu.call_graph();

  cu.for_each_cfg(
    [&](const Cfg & cfg) {
      const FunctionDef * fn = cu.ast().get_function(cfg.function_id());
      if (fn == nullptr) {
        ctx.logger->warn("{}: no function definition for CFG '{}'", id(), cfg.name());
        return;
      }
      const auto node_id = cg.get_node_id_by_ast_id(fn->id);
      const CGNode * node = node_id ? cg.get_node(*node_id) : nullptr;
      if (node == nullptr) {
        ctx.logger->warn("{}: no call graph node for function #{}", id(), fn->id);
        return;
      }
      if (!node->has_any_effect({Effect::Send, Effect::StateWrite})) {
        return;
      }

      const UnprotectedCallTransfer transfer(parameter_taints(*fn));
      const WorklistSolver<ArgTaints> solver(
        cu, cfg, transfer, lattice, AnalysisKind::Forward, ctx.solver);
      const auto results = solver.solve();

      for_each_statement_state<ArgTaints>(
        cu, cfg, results, transfer,
        [&](const Stmt & stmt, const BasicBlock &, const ArgTaints & state) {
          for_each_expression(stmt, [&](const Expr & e) {
            if (is_send_call(e)) {
              const auto args = send_arguments(e);
              for (const Expr * arg : unprotected_arguments(args, state)) {
                report(diags, arg->range, "Unprotected send argument: " + arg->as<IdExpr>()->name)
                  .with_help("Validate the argument in a condition before sending it");
              }
            } else if (is_field_mutation(e)) {
              const auto & args = e.as<MethodCallExpr>()->args;
              for (const Expr * arg : unprotected_arguments(args, state)) {
                report(
                  diags, arg->range, "Unprotected field mutation: " + arg->as<IdExpr>()->name)
                  .with_help("Validate the argument in a condition before storing it");
              }
            }
          });
        });
    },
    ctx.iteration);
}

}  // namespace tactflow
