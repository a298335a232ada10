// tactflow/ast/iterators.hpp - Traversal helpers over statements and expressions
//
// A statement "owns" the expressions written in it directly: the condition
// of an `if`, the count of a `repeat`, the initializer of a `let`. Nested
// bodies are separate statements that a CFG places in their own blocks, so
// the plain traversals below stop at them. The `_deep` variants descend into
// nested bodies as well.
//
#pragma once

#include <functional>
#include <utility>
#include <vector>

#include "tactflow/ast/ast.hpp"

namespace tactflow
{

using ExprCallback = std::function<void(const Expr &)>;
using StmtCallback = std::function<void(const Stmt &)>;
using ExprPredicate = std::function<bool(const Expr &)>;

/// Direct operands of `expr`, left to right
[[nodiscard]] std::vector<const Expr *> child_expressions(const Expr & expr);

/// Expressions written directly in `stmt`, left to right
[[nodiscard]] std::vector<const Expr *> own_expressions(const Stmt & stmt);

/// Bodies nested in `stmt` (branches, loop bodies, catch blocks)
[[nodiscard]] std::vector<const StmtList *> nested_bodies(const Stmt & stmt);

/// Visit `expr` and every subexpression in pre-order
void for_each_subexpression(const Expr & expr, const ExprCallback & fn);

/// Visit every expression owned by `stmt`, including subexpressions
void for_each_expression(const Stmt & stmt, const ExprCallback & fn);

/// Visit every expression of `stmt` and of all nested statements
void for_each_expression_deep(const Stmt & stmt, const ExprCallback & fn);

/// Visit `stmt` and every nested statement in pre-order
void for_each_statement(const Stmt & stmt, const StmtCallback & fn);

/// First expression owned by `stmt` satisfying `pred`, or nullptr
[[nodiscard]] const Expr * find_in_expressions(const Stmt & stmt, const ExprPredicate & pred);

/// First subexpression of `expr` (including itself) satisfying `pred`, or nullptr
[[nodiscard]] const Expr * find_in_expression(const Expr & expr, const ExprPredicate & pred);

/**
 * Fold over the expressions owned by `stmt` in pre-order.
 */
template <typename Acc, typename Fn>
Acc fold_expressions(const Stmt & stmt, Acc init, Fn && fn)
{
  Acc acc = std::move(init);
  for_each_expression(stmt, [&](const Expr & e) { acc = fn(std::move(acc), e); });
  return acc;
}

}  // namespace tactflow
