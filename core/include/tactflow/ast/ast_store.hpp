// tactflow/ast/ast_store.hpp - Owner of all AST nodes of a compilation unit
#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "tactflow/ast/ast.hpp"
#include "tactflow/basic/indices.hpp"

namespace tactflow
{

/**
 * Owns expressions, statements, functions and contracts and indexes them by
 * AstId.
 *
 * Ids are either supplied by the caller (the IR loader keeps the
 * frontend's ids) or drawn from the store's own IdxGenerator. Expressions,
 * statements and items share one id space; reusing an id throws
 * InternalError. Nodes are never removed, so returned pointers stay valid
 * for the lifetime of the store.
 */
class AstStore
{
public:
  AstStore() = default;

  AstStore(const AstStore &) = delete;
  AstStore & operator=(const AstStore &) = delete;
  AstStore(AstStore &&) = default;
  AstStore & operator=(AstStore &&) = default;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  const Expr * add_expr(
    ExprNode node, SourceRange range = {}, std::optional<AstId> id = std::nullopt);

  const Stmt * add_stmt(
    StmtNode node, SourceRange range = {}, std::optional<AstId> id = std::nullopt);

  /**
   * Register a function. The id of `def` is replaced by `id` or a fresh one.
   * Functions naming a registered contract are appended to it.
   */
  const FunctionDef * add_function(FunctionDef def, std::optional<AstId> id = std::nullopt);

  const ContractDef * add_contract(ContractDef def, std::optional<AstId> id = std::nullopt);

  // ===========================================================================
  // Lookup
  // ===========================================================================

  [[nodiscard]] const Stmt * get_stmt(AstId id) const noexcept;
  [[nodiscard]] const Expr * get_expr(AstId id) const noexcept;
  [[nodiscard]] const FunctionDef * get_function(AstId id) const noexcept;
  [[nodiscard]] const ContractDef * find_contract(std::string_view name) const noexcept;

  /// Functions in registration order
  [[nodiscard]] const std::vector<std::unique_ptr<FunctionDef>> & functions() const noexcept
  {
    return functions_;
  }

  [[nodiscard]] const std::vector<std::unique_ptr<ContractDef>> & contracts() const noexcept
  {
    return contracts_;
  }

  [[nodiscard]] size_t stmt_count() const noexcept { return stmts_.size(); }
  [[nodiscard]] size_t expr_count() const noexcept { return exprs_.size(); }

private:
  AstId claim_id(std::optional<AstId> id);

  IdxGenerator<AstId> ids_{1};

  std::vector<std::unique_ptr<Expr>> exprs_;
  std::vector<std::unique_ptr<Stmt>> stmts_;
  std::vector<std::unique_ptr<FunctionDef>> functions_;
  std::vector<std::unique_ptr<ContractDef>> contracts_;

  std::unordered_map<AstId, const Expr *> expr_index_;
  std::unordered_map<AstId, const Stmt *> stmt_index_;
  std::unordered_map<AstId, const FunctionDef *> function_index_;
  std::unordered_set<AstId> used_ids_;
};

}  // namespace tactflow
