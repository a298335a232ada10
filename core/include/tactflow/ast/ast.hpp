// tactflow/ast/ast.hpp - AST consumed by the analyses
//
// The AST is produced by an external frontend and loaded from its JSON IR.
// Expressions and statements are closed tagged unions: every kind is one
// alternative of ExprNode / StmtNode, and dispatch goes through std::visit
// so that adding a kind breaks every dispatch site that does not handle it.
//
// All nodes are owned by an AstStore and referenced by const pointer.
//
#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "tactflow/ast/ast_enums.hpp"
#include "tactflow/basic/indices.hpp"
#include "tactflow/basic/source_manager.hpp"
#include "tactflow/numeric/num.hpp"

namespace tactflow
{

struct Expr;
struct Stmt;

/// Helper for building a visitor from lambdas
template <class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// ============================================================================
// Expressions
// ============================================================================

struct IdExpr
{
  std::string name;
};

struct NumberExpr
{
  Num value;
};

struct BoolExpr
{
  bool value = false;
};

struct StringExpr
{
  std::string value;
};

struct NullExpr
{
};

struct BinaryExpr
{
  BinaryOp op = BinaryOp::Add;
  const Expr * left = nullptr;
  const Expr * right = nullptr;
};

struct UnaryExpr
{
  UnaryOp op = UnaryOp::Neg;
  const Expr * operand = nullptr;
};

struct ConditionalExpr
{
  const Expr * condition = nullptr;
  const Expr * then_branch = nullptr;
  const Expr * else_branch = nullptr;
};

/// Call of a free function: `now()`, `send(...)`
struct StaticCallExpr
{
  std::string function;
  std::vector<const Expr *> args;
};

/// Call through a receiver: `self.reply(...)`, `m.set(k, v)`
struct MethodCallExpr
{
  const Expr * self = nullptr;
  std::string method;
  std::vector<const Expr *> args;
};

struct FieldAccessExpr
{
  const Expr * aggregate = nullptr;
  std::string field;
};

struct StructFieldInit
{
  std::string field;
  const Expr * initializer = nullptr;
};

struct StructInstanceExpr
{
  std::string type;
  std::vector<StructFieldInit> fields;
};

struct InitOfExpr
{
  std::string contract;
  std::vector<const Expr *> args;
};

using ExprNode = std::variant<
  IdExpr, NumberExpr, BoolExpr, StringExpr, NullExpr, BinaryExpr, UnaryExpr, ConditionalExpr,
  StaticCallExpr, MethodCallExpr, FieldAccessExpr, StructInstanceExpr, InitOfExpr>;

static_assert(std::variant_size_v<ExprNode> == static_cast<size_t>(ExprKind::InitOf) + 1);

struct Expr
{
  AstId id = 0;
  SourceRange range;
  ExprNode node;

  [[nodiscard]] ExprKind kind() const noexcept { return static_cast<ExprKind>(node.index()); }

  template <typename T>
  [[nodiscard]] const T * as() const noexcept
  {
    return std::get_if<T>(&node);
  }
};

// ============================================================================
// Statements
// ============================================================================

using StmtList = std::vector<const Stmt *>;

struct LetStmt
{
  std::string name;
  std::optional<std::string> type;
  const Expr * init = nullptr;
};

struct ReturnStmt
{
  const Expr * value = nullptr;  ///< nullptr for a bare `return`
};

struct ExpressionStmt
{
  const Expr * expr = nullptr;
};

struct AssignStmt
{
  const Expr * path = nullptr;
  const Expr * value = nullptr;
};

/// `path op= value`
struct AugmentedAssignStmt
{
  BinaryOp op = BinaryOp::Add;
  const Expr * path = nullptr;
  const Expr * value = nullptr;
};

/// `if`; an `else if` chain is a single ConditionStmt in `false_branch`
struct ConditionStmt
{
  const Expr * condition = nullptr;
  StmtList true_branch;
  StmtList false_branch;
};

struct WhileStmt
{
  const Expr * condition = nullptr;
  StmtList body;
};

/// `do { ... } until (condition)`
struct UntilStmt
{
  const Expr * condition = nullptr;
  StmtList body;
};

struct RepeatStmt
{
  const Expr * count = nullptr;
  StmtList body;
};

struct TryStmt
{
  StmtList body;
  std::optional<std::string> catch_name;
  StmtList catch_body;
};

struct ForeachStmt
{
  std::string key_name;
  std::string value_name;
  const Expr * map = nullptr;
  StmtList body;
};

using StmtNode = std::variant<
  LetStmt, ReturnStmt, ExpressionStmt, AssignStmt, AugmentedAssignStmt, ConditionStmt, WhileStmt,
  UntilStmt, RepeatStmt, TryStmt, ForeachStmt>;

static_assert(std::variant_size_v<StmtNode> == static_cast<size_t>(StmtKind::Foreach) + 1);

struct Stmt
{
  AstId id = 0;
  SourceRange range;
  StmtNode node;

  [[nodiscard]] StmtKind kind() const noexcept { return static_cast<StmtKind>(node.index()); }

  template <typename T>
  [[nodiscard]] const T * as() const noexcept
  {
    return std::get_if<T>(&node);
  }
};

// ============================================================================
// Items
// ============================================================================

struct Param
{
  std::string name;
  std::optional<std::string> type;
};

/**
 * A function, method, receiver or contract initializer.
 */
struct FunctionDef
{
  AstId id = 0;
  std::string name;
  FunctionKind kind = FunctionKind::Function;
  std::optional<std::string> contract;  ///< enclosing contract or trait
  std::vector<Param> params;
  StmtList body;
  ItemOrigin origin = ItemOrigin::User;
  bool is_asm = false;
  SourceRange range;

  /**
   * Name used by the call graph: `Contract::name` for contract members,
   * `asm_Contract::name` for asm members, the bare name otherwise.
   * Initializers and receivers are named `Contract::contract_init_<id>`
   * and `Contract::receiver_<id>`.
   */
  [[nodiscard]] std::string qualified_name() const;
};

struct ContractDef
{
  AstId id = 0;
  std::string name;
  std::vector<std::string> fields;
  std::vector<const FunctionDef *> functions;
  ItemOrigin origin = ItemOrigin::User;
  SourceRange range;
};

}  // namespace tactflow
