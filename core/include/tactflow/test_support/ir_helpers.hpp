// tactflow/test_support/ir_helpers.hpp - helpers for unit/integration tests
//
// Build small compilation units in code instead of writing JSON IR by hand.
// Nodes get fresh ids from the unit's AstStore; CFGs are built explicitly or
// as a straight chain of one block per top-level statement.
//
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tactflow/basic/logging.hpp"
#include "tactflow/ir/call_graph_builder.hpp"
#include "tactflow/ir/compilation_unit.hpp"

namespace tactflow::test_support
{

class UnitBuilder
{
public:
  explicit UnitBuilder(std::string project = "test")
  : cu_(std::make_unique<CompilationUnit>(std::move(project)))
  {
  }

  [[nodiscard]] CompilationUnit & unit() noexcept { return *cu_; }
  [[nodiscard]] AstStore & ast() noexcept { return cu_->ast(); }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  const Expr * id(std::string name) { return ast().add_expr(IdExpr{std::move(name)}); }

  const Expr * num(long value) { return ast().add_expr(NumberExpr{Num::integer(value)}); }

  const Expr * bin(BinaryOp op, const Expr * lhs, const Expr * rhs)
  {
    return ast().add_expr(BinaryExpr{op, lhs, rhs});
  }

  const Expr * unary(UnaryOp op, const Expr * operand)
  {
    return ast().add_expr(UnaryExpr{op, operand});
  }

  const Expr * call(std::string function, std::vector<const Expr *> args = {})
  {
    return ast().add_expr(StaticCallExpr{std::move(function), std::move(args)});
  }

  const Expr * method(const Expr * self, std::string name, std::vector<const Expr *> args = {})
  {
    return ast().add_expr(MethodCallExpr{self, std::move(name), std::move(args)});
  }

  const Expr * field(const Expr * aggregate, std::string name)
  {
    return ast().add_expr(FieldAccessExpr{aggregate, std::move(name)});
  }

  /// `self.name`
  const Expr * self_field(std::string name) { return field(id("self"), std::move(name)); }

  const Expr * struct_instance(std::string type, std::vector<StructFieldInit> fields)
  {
    return ast().add_expr(StructInstanceExpr{std::move(type), std::move(fields)});
  }

  // ===========================================================================
  // Statements
  // ===========================================================================

  const Stmt * let(std::string name, const Expr * init)
  {
    return ast().add_stmt(LetStmt{std::move(name), std::nullopt, init});
  }

  const Stmt * assign(const Expr * path, const Expr * value)
  {
    return ast().add_stmt(AssignStmt{path, value});
  }

  const Stmt * augmented_assign(BinaryOp op, const Expr * path, const Expr * value)
  {
    return ast().add_stmt(AugmentedAssignStmt{op, path, value});
  }

  const Stmt * expr_stmt(const Expr * e) { return ast().add_stmt(ExpressionStmt{e}); }

  const Stmt * ret(const Expr * value = nullptr) { return ast().add_stmt(ReturnStmt{value}); }

  const Stmt * condition(const Expr * cond, StmtList then_body = {}, StmtList else_body = {})
  {
    return ast().add_stmt(ConditionStmt{cond, std::move(then_body), std::move(else_body)});
  }

  const Stmt * while_loop(const Expr * cond, StmtList body)
  {
    return ast().add_stmt(WhileStmt{cond, std::move(body)});
  }

  const Stmt * repeat_loop(const Expr * count, StmtList body)
  {
    return ast().add_stmt(RepeatStmt{count, std::move(body)});
  }

  // ===========================================================================
  // Items
  // ===========================================================================

  const FunctionDef * function(
    std::string name, StmtList body, std::vector<std::string> params = {},
    std::optional<std::string> contract = std::nullopt,
    FunctionKind kind = FunctionKind::Function, ItemOrigin origin = ItemOrigin::User)
  {
    FunctionDef def;
    def.name = std::move(name);
    def.kind = contract && kind == FunctionKind::Function ? FunctionKind::Method : kind;
    def.contract = std::move(contract);
    for (auto & p : params) {
      def.params.push_back(Param{std::move(p), std::nullopt});
    }
    def.body = std::move(body);
    def.origin = origin;
    return ast().add_function(std::move(def));
  }

  /// Empty CFG for `fn`, to be filled by the caller
  Cfg & empty_cfg(const FunctionDef & fn)
  {
    return cu_->create_cfg(fn.name, fn.id, fn.kind, fn.origin, fn.range, fn.contract);
  }

  /// One block per top-level statement of `fn`, chained in order
  Cfg & linear_cfg(const FunctionDef & fn)
  {
    Cfg & cfg = empty_cfg(fn);
    std::optional<BasicBlockIdx> prev;
    for (const Stmt * s : fn.body) {
      const BasicBlockIdx idx = cfg.add_block({s->id}).idx;
      if (prev) {
        cfg.add_edge(*prev, idx);
      }
      prev = idx;
    }
    return cfg;
  }

  /// Build the call graph and hand over the unit
  [[nodiscard]] std::unique_ptr<CompilationUnit> finish()
  {
    CallGraphBuilder builder(make_null_logger("test"));
    cu_->set_call_graph(builder.build(cu_->ast()));
    return std::move(cu_);
  }

private:
  std::unique_ptr<CompilationUnit> cu_;
};

}  // namespace tactflow::test_support
