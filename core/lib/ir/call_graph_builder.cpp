// tactflow/ir/call_graph_builder.cpp - Call graph construction from the AST
#include "tactflow/ir/call_graph_builder.hpp"

#include <spdlog/spdlog.h>

#include "tactflow/ast/ast_utils.hpp"
#include "tactflow/ast/iterators.hpp"

namespace tactflow
{

CallGraphBuilder::CallGraphBuilder(std::shared_ptr<spdlog::logger> logger)
: logger_(std::move(logger))
{
}

CallGraph CallGraphBuilder::build(const AstStore & ast)
{
  CallGraph graph;

  for (const auto & fn : ast.functions()) {
    const std::string name = fn->qualified_name();
    if (graph.get_node_id_by_name(name)) {
      logger_->warn("function '{}' is defined more than once; keeping the first definition", name);
      continue;
    }
    graph.add_node(name, fn->id, fn->range);
  }

  for (const auto & fn : ast.functions()) {
    const auto caller = graph.get_node_id_by_ast_id(fn->id);
    if (!caller) {
      continue;
    }
    for (const Stmt * stmt : fn->body) {
      for_each_statement(*stmt, [&](const Stmt & s) {
        process_statement(graph, s, *caller, fn->contract);
      });
    }
  }

  graph.propagate_effects();
  logger_->debug(
    "call graph: {} nodes, {} edges", graph.get_nodes().size(), graph.get_edges().size());
  return graph;
}

std::optional<std::string> CallGraphBuilder::callee_name(
  const Expr & call, const std::optional<std::string> & contract)
{
  if (const auto * s = call.as<StaticCallExpr>()) {
    return s->function;
  }
  const auto * m = call.as<MethodCallExpr>();
  if (m == nullptr || m->method.empty()) {
    return std::nullopt;
  }
  std::optional<std::string> owner = contract;
  if (m->self != nullptr) {
    if (const auto * id = m->self->as<IdExpr>(); id != nullptr && id->name != "self") {
      owner = id->name;
    }
  }
  return owner ? *owner + "::" + m->method : m->method;
}

void CallGraphBuilder::process_statement(
  CallGraph & graph, const Stmt & stmt, CGNodeId caller, const std::optional<std::string> & contract)
{
  for (auto & field : find_state_writes(stmt)) {
    graph.add_effect(caller, Effect::StateWrite, std::move(field));
  }

  // The target of an assignment is a write, not a read.
  const auto visit = [&](const Expr & e) { process_expression(graph, e, caller, contract); };
  if (const auto * s = stmt.as<AssignStmt>()) {
    if (s->value != nullptr) {
      for_each_subexpression(*s->value, visit);
    }
    return;
  }
  if (const auto * s = stmt.as<AugmentedAssignStmt>()) {
    if (s->value != nullptr) {
      for_each_subexpression(*s->value, visit);
    }
    return;
  }
  for_each_expression(stmt, visit);
}

void CallGraphBuilder::process_expression(
  CallGraph & graph, const Expr & expr, CGNodeId caller, const std::optional<std::string> & contract)
{
  if (expr.as<StaticCallExpr>() != nullptr || expr.as<MethodCallExpr>() != nullptr) {
    if (const auto name = callee_name(expr, contract)) {
      if (!graph.get_node_id_by_name(*name)) {
        logger_->debug("call graph: adding node '{}' without a definition", *name);
      }
      graph.add_edge(caller, graph.find_or_add_node(*name), expr.range);
    } else {
      logger_->warn("call expression {} has no callee name", expr.id);
    }
  }

  if (const auto * call = expr.as<StaticCallExpr>()) {
    if (is_datetime_function(call->function)) {
      graph.add_effect(caller, Effect::AccessDatetime);
    } else if (is_prg_use_function(call->function)) {
      graph.add_effect(caller, Effect::PrgUse);
    } else if (is_prg_init_function(call->function)) {
      graph.add_effect(caller, Effect::PrgSeedInit);
    }
  }
  if (is_send_call(expr)) {
    graph.add_effect(caller, Effect::Send);
  }
  if (auto field = find_state_read(expr)) {
    graph.add_effect(caller, Effect::StateRead, std::move(*field));
  }
}

}  // namespace tactflow
