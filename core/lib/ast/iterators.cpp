// tactflow/ast/iterators.cpp - AST traversal
#include "tactflow/ast/iterators.hpp"

namespace tactflow
{

namespace
{

void push_if(std::vector<const Expr *> & out, const Expr * e)
{
  if (e != nullptr) out.push_back(e);
}

}  // namespace

std::vector<const Expr *> child_expressions(const Expr & expr)
{
  std::vector<const Expr *> out;
  std::visit(
    Overloaded{
      [](const IdExpr &) {},
      [](const NumberExpr &) {},
      [](const BoolExpr &) {},
      [](const StringExpr &) {},
      [](const NullExpr &) {},
      [&](const BinaryExpr & e) {
        push_if(out, e.left);
        push_if(out, e.right);
      },
      [&](const UnaryExpr & e) { push_if(out, e.operand); },
      [&](const ConditionalExpr & e) {
        push_if(out, e.condition);
        push_if(out, e.then_branch);
        push_if(out, e.else_branch);
      },
      [&](const StaticCallExpr & e) {
        for (const auto * a : e.args) push_if(out, a);
      },
      [&](const MethodCallExpr & e) {
        push_if(out, e.self);
        for (const auto * a : e.args) push_if(out, a);
      },
      [&](const FieldAccessExpr & e) { push_if(out, e.aggregate); },
      [&](const StructInstanceExpr & e) {
        for (const auto & f : e.fields) push_if(out, f.initializer);
      },
      [&](const InitOfExpr & e) {
        for (const auto * a : e.args) push_if(out, a);
      },
    },
    expr.node);
  return out;
}

std::vector<const Expr *> own_expressions(const Stmt & stmt)
{
  std::vector<const Expr *> out;
  std::visit(
    Overloaded{
      [&](const LetStmt & s) { push_if(out, s.init); },
      [&](const ReturnStmt & s) { push_if(out, s.value); },
      [&](const ExpressionStmt & s) { push_if(out, s.expr); },
      [&](const AssignStmt & s) {
        push_if(out, s.path);
        push_if(out, s.value);
      },
      [&](const AugmentedAssignStmt & s) {
        push_if(out, s.path);
        push_if(out, s.value);
      },
      [&](const ConditionStmt & s) { push_if(out, s.condition); },
      [&](const WhileStmt & s) { push_if(out, s.condition); },
      [&](const UntilStmt & s) { push_if(out, s.condition); },
      [&](const RepeatStmt & s) { push_if(out, s.count); },
      [](const TryStmt &) {},
      [&](const ForeachStmt & s) { push_if(out, s.map); },
    },
    stmt.node);
  return out;
}

std::vector<const StmtList *> nested_bodies(const Stmt & stmt)
{
  std::vector<const StmtList *> out;
  std::visit(
    Overloaded{
      [](const LetStmt &) {},
      [](const ReturnStmt &) {},
      [](const ExpressionStmt &) {},
      [](const AssignStmt &) {},
      [](const AugmentedAssignStmt &) {},
      [&](const ConditionStmt & s) {
        out.push_back(&s.true_branch);
        out.push_back(&s.false_branch);
      },
      [&](const WhileStmt & s) { out.push_back(&s.body); },
      [&](const UntilStmt & s) { out.push_back(&s.body); },
      [&](const RepeatStmt & s) { out.push_back(&s.body); },
      [&](const TryStmt & s) {
        out.push_back(&s.body);
        out.push_back(&s.catch_body);
      },
      [&](const ForeachStmt & s) { out.push_back(&s.body); },
    },
    stmt.node);
  return out;
}

void for_each_subexpression(const Expr & expr, const ExprCallback & fn)
{
  fn(expr);
  for (const auto * child : child_expressions(expr)) {
    for_each_subexpression(*child, fn);
  }
}

void for_each_expression(const Stmt & stmt, const ExprCallback & fn)
{
  for (const auto * e : own_expressions(stmt)) {
    for_each_subexpression(*e, fn);
  }
}

void for_each_statement(const Stmt & stmt, const StmtCallback & fn)
{
  fn(stmt);
  for (const auto * body : nested_bodies(stmt)) {
    for (const auto * child : *body) {
      if (child != nullptr) for_each_statement(*child, fn);
    }
  }
}

void for_each_expression_deep(const Stmt & stmt, const ExprCallback & fn)
{
  for_each_statement(stmt, [&](const Stmt & s) { for_each_expression(s, fn); });
}

const Expr * find_in_expression(const Expr & expr, const ExprPredicate & pred)
{
  if (pred(expr)) {
    return &expr;
  }
  for (const auto * child : child_expressions(expr)) {
    if (const Expr * found = find_in_expression(*child, pred)) {
      return found;
    }
  }
  return nullptr;
}

const Expr * find_in_expressions(const Stmt & stmt, const ExprPredicate & pred)
{
  for (const auto * e : own_expressions(stmt)) {
    if (const Expr * found = find_in_expression(*e, pred)) {
      return found;
    }
  }
  return nullptr;
}

}  // namespace tactflow
