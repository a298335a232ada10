// tactflow/ast/ast_store.cpp - AST ownership and indexing
#include "tactflow/ast/ast_store.hpp"

#include <algorithm>
#include <string>

#include "tactflow/basic/exceptions.hpp"

namespace tactflow
{

AstId AstStore::claim_id(std::optional<AstId> id)
{
  if (!id) {
    AstId fresh = ids_.next();
    while (used_ids_.count(fresh) != 0) {
      fresh = ids_.next();
    }
    used_ids_.insert(fresh);
    return fresh;
  }
  if (!used_ids_.insert(*id).second) {
    throw InternalError("duplicate AST id " + std::to_string(*id));
  }
  ids_.observe(*id);
  return *id;
}

const Expr * AstStore::add_expr(ExprNode node, SourceRange range, std::optional<AstId> id)
{
  auto expr = std::make_unique<Expr>();
  expr->id = claim_id(id);
  expr->range = range;
  expr->node = std::move(node);

  const Expr * ptr = expr.get();
  expr_index_.emplace(ptr->id, ptr);
  exprs_.push_back(std::move(expr));
  return ptr;
}

const Stmt * AstStore::add_stmt(StmtNode node, SourceRange range, std::optional<AstId> id)
{
  auto stmt = std::make_unique<Stmt>();
  stmt->id = claim_id(id);
  stmt->range = range;
  stmt->node = std::move(node);

  const Stmt * ptr = stmt.get();
  stmt_index_.emplace(ptr->id, ptr);
  stmts_.push_back(std::move(stmt));
  return ptr;
}

const FunctionDef * AstStore::add_function(FunctionDef def, std::optional<AstId> id)
{
  auto func = std::make_unique<FunctionDef>(std::move(def));
  func->id = claim_id(id);

  const FunctionDef * ptr = func.get();
  function_index_.emplace(ptr->id, ptr);

  if (ptr->contract) {
    const auto it = std::find_if(
      contracts_.begin(), contracts_.end(),
      [&](const std::unique_ptr<ContractDef> & c) { return c->name == *ptr->contract; });
    if (it != contracts_.end()) {
      (*it)->functions.push_back(ptr);
    }
  }

  functions_.push_back(std::move(func));
  return ptr;
}

const ContractDef * AstStore::add_contract(ContractDef def, std::optional<AstId> id)
{
  if (find_contract(def.name) != nullptr) {
    throw InternalError("duplicate contract '" + def.name + "'");
  }
  auto contract = std::make_unique<ContractDef>(std::move(def));
  contract->id = claim_id(id);

  const ContractDef * ptr = contract.get();
  contracts_.push_back(std::move(contract));
  return ptr;
}

const Stmt * AstStore::get_stmt(AstId id) const noexcept
{
  const auto it = stmt_index_.find(id);
  return it != stmt_index_.end() ? it->second : nullptr;
}

const Expr * AstStore::get_expr(AstId id) const noexcept
{
  const auto it = expr_index_.find(id);
  return it != expr_index_.end() ? it->second : nullptr;
}

const FunctionDef * AstStore::get_function(AstId id) const noexcept
{
  const auto it = function_index_.find(id);
  return it != function_index_.end() ? it->second : nullptr;
}

const ContractDef * AstStore::find_contract(std::string_view name) const noexcept
{
  for (const auto & c : contracts_) {
    if (c->name == name) {
      return c.get();
    }
  }
  return nullptr;
}

}  // namespace tactflow
