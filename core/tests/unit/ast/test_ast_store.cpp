// tests/unit/ast/test_ast_store.cpp - Unit tests for AST ownership and naming
//
#include <gtest/gtest.h>

#include "tactflow/ast/ast_store.hpp"
#include "tactflow/basic/exceptions.hpp"

using namespace tactflow;

TEST(AstStoreTest, FreshIdsAreUniqueAndIndexed)
{
  AstStore ast;
  const Expr * a = ast.add_expr(IdExpr{"a"});
  const Expr * b = ast.add_expr(NumberExpr{Num::integer(1L)});
  const Stmt * s = ast.add_stmt(ExpressionStmt{a});

  EXPECT_NE(a->id, b->id);
  EXPECT_NE(a->id, s->id);
  EXPECT_EQ(ast.get_expr(b->id), b);
  EXPECT_EQ(ast.get_stmt(s->id), s);
  EXPECT_EQ(ast.get_stmt(a->id), nullptr);
  EXPECT_EQ(ast.expr_count(), 2u);
  EXPECT_EQ(ast.stmt_count(), 1u);
}

TEST(AstStoreTest, ExplicitIdsAreKeptAndSkippedByGenerator)
{
  AstStore ast;
  const Expr * e = ast.add_expr(IdExpr{"x"}, {}, 10);
  EXPECT_EQ(e->id, 10u);

  const Expr * next = ast.add_expr(IdExpr{"y"});
  EXPECT_GT(next->id, 10u);
}

TEST(AstStoreTest, DuplicateIdThrows)
{
  AstStore ast;
  (void)ast.add_expr(IdExpr{"x"}, {}, 7);
  EXPECT_THROW((void)ast.add_stmt(ReturnStmt{}, {}, 7), InternalError);
}

TEST(AstStoreTest, FunctionsAttachToContracts)
{
  AstStore ast;
  ContractDef contract;
  contract.name = "Vault";
  const ContractDef * vault = ast.add_contract(std::move(contract));

  FunctionDef fn;
  fn.name = "withdraw";
  fn.kind = FunctionKind::Method;
  fn.contract = "Vault";
  const FunctionDef * withdraw = ast.add_function(std::move(fn), 42);

  EXPECT_EQ(withdraw->id, 42u);
  EXPECT_EQ(ast.get_function(42), withdraw);
  ASSERT_EQ(vault->functions.size(), 1u);
  EXPECT_EQ(vault->functions.front(), withdraw);
  EXPECT_EQ(ast.find_contract("Vault"), vault);
  EXPECT_EQ(ast.find_contract("Other"), nullptr);

  ContractDef again;
  again.name = "Vault";
  EXPECT_THROW((void)ast.add_contract(std::move(again)), InternalError);
}

TEST(FunctionDefTest, QualifiedNames)
{
  FunctionDef free_fn;
  free_fn.name = "helper";
  EXPECT_EQ(free_fn.qualified_name(), "helper");

  FunctionDef method;
  method.name = "withdraw";
  method.kind = FunctionKind::Method;
  method.contract = "Vault";
  EXPECT_EQ(method.qualified_name(), "Vault::withdraw");

  FunctionDef init;
  init.id = 5;
  init.name = "init";
  init.kind = FunctionKind::Init;
  init.contract = "Vault";
  EXPECT_EQ(init.qualified_name(), "Vault::contract_init_5");

  FunctionDef receiver;
  receiver.id = 9;
  receiver.kind = FunctionKind::Receiver;
  receiver.contract = "Vault";
  EXPECT_EQ(receiver.qualified_name(), "Vault::receiver_9");

  FunctionDef native;
  native.name = "load";
  native.kind = FunctionKind::Method;
  native.contract = "Vault";
  native.is_asm = true;
  EXPECT_EQ(native.qualified_name(), "asm_Vault::load");
}

TEST(ExprTest, KindMatchesAlternative)
{
  AstStore ast;
  const Expr * call = ast.add_expr(StaticCallExpr{"now", {}});
  EXPECT_EQ(call->kind(), ExprKind::StaticCall);
  ASSERT_NE(call->as<StaticCallExpr>(), nullptr);
  EXPECT_EQ(call->as<IdExpr>(), nullptr);

  const Stmt * let = ast.add_stmt(LetStmt{"t", std::nullopt, call});
  EXPECT_EQ(let->kind(), StmtKind::Let);
}
