// tactflow/detectors/send_in_loop.cpp - Messages sent from loop bodies
#include "tactflow/detectors/send_in_loop.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

#include "tactflow/ast/ast_utils.hpp"
#include "tactflow/ast/iterators.hpp"
#include "tactflow/ir/call_graph_builder.hpp"

namespace tactflow
{

namespace
{

bool is_loop(const Stmt & stmt) noexcept
{
  switch (stmt.kind()) {
    case StmtKind::While:
    case StmtKind::Until:
    case StmtKind::Repeat:
    case StmtKind::Foreach:
      return true;
    default:
      return false;
  }
}

bool is_call(const Expr & expr) noexcept
{
  return expr.kind() == ExprKind::StaticCall || expr.kind() == ExprKind::MethodCall;
}

}  // namespace

void SendInLoop::check(
  const DetectorContext & ctx, const CompilationUnit & cu, DiagnosticBag & diags)
{
  const CallGraph & cg = cu.call_graph();
  std::unordered_set<AstId> reported;

  for (const auto & fn : cu.ast().functions()) {
    if (fn->origin == ItemOrigin::Stdlib && !ctx.iteration.include_stdlib) {
      continue;
    }
    for (const Stmt * top : fn->body) {
      for_each_statement(*top, [&](const Stmt & stmt) {
        if (!is_loop(stmt)) {
          return;
        }
        for_each_expression_deep(stmt, [&](const Expr & e) {
          if (!is_call(e) || reported.count(e.id) > 0) {
            return;
          }
          if (is_send_call(e)) {
            reported.insert(e.id);
            report(diags, e.range, "Send function called inside a loop")
              .with_secondary_label(stmt.range, "loop")
              .with_help("Consider refactoring to avoid calling send functions inside loops");
            return;
          }
          const auto callee = CallGraphBuilder::callee_name(e, fn->contract);
          if (!callee) {
            return;
          }
          const auto node_id = cg.get_node_id_by_name(*callee);
          const CGNode * node = node_id ? cg.get_node(*node_id) : nullptr;
          if (node == nullptr || !node->has_effect(Effect::Send)) {
            return;
          }
          reported.insert(e.id);
          report(diags, e.range, "Call to '" + *callee + "' inside a loop sends a message")
            .with_secondary_label(stmt.range, "loop")
            .with_help("Consider refactoring to avoid calling send functions inside loops");
        });
      });
    }
  }
  ctx.logger->debug("{}: {} sends in loops", id(), reported.size());
}

}  // namespace tactflow
