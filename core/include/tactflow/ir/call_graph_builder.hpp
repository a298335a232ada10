// tactflow/ir/call_graph_builder.hpp - Derive the call graph from the AST
#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string>

#include "tactflow/ast/ast.hpp"
#include "tactflow/ast/ast_store.hpp"
#include "tactflow/ir/call_graph.hpp"

namespace tactflow
{

/**
 * Builds a CallGraph from every function in an AstStore.
 *
 * Each FunctionDef becomes a node named by FunctionDef::qualified_name().
 * Calls become edges:
 * - `f(...)` calls `f`;
 * - `self.m(...)`, or `m` called on anything but a plain identifier, calls
 *   `Contract::m` where `Contract` encloses the caller;
 * - `x.m(...)` on an identifier `x` calls `x::m`.
 * Callees without a definition get a node of their own.
 *
 * Direct effects come from the standard library names in ast_utils.hpp.
 * The builder finishes by calling CallGraph::propagate_effects().
 */
class CallGraphBuilder
{
public:
  explicit CallGraphBuilder(std::shared_ptr<spdlog::logger> logger);

  [[nodiscard]] CallGraph build(const AstStore & ast);

  /// Callee node name for a static or method call, nullopt for other expressions
  [[nodiscard]] static std::optional<std::string> callee_name(
    const Expr & call, const std::optional<std::string> & contract);

private:
  void process_statement(
    CallGraph & graph, const Stmt & stmt, CGNodeId caller,
    const std::optional<std::string> & contract);

  void process_expression(
    CallGraph & graph, const Expr & expr, CGNodeId caller,
    const std::optional<std::string> & contract);

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tactflow
