// tests/unit/ir/test_ir_loader.cpp - Unit tests for loading the JSON IR
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "tactflow/basic/logging.hpp"
#include "tactflow/ir/ir_loader.hpp"
#include "tactflow/numeric/num.hpp"

using namespace tactflow;

namespace fs = std::filesystem;

// ============================================================================
// Helper Functions
// ============================================================================

static const char * const k_valid_ir = R"json({
  "project": "demo",
  "files": [ { "id": 0, "path": "demo.tact", "content": "fun f() { let t = now(); }" } ],
  "contracts": [ { "id": 1, "name": "Vault", "fields": ["owner"] } ],
  "functions": [
    { "id": 2, "name": "tick", "kind": "method", "contract": "Vault",
      "params": [ { "name": "delay", "type": "Int" } ],
      "body": [
        { "id": 3, "kind": "statement_let", "name": "t",
          "expression": { "id": 4, "kind": "static_call", "function": "now", "args": [],
                          "loc": { "file": 0, "start": 18, "end": 23 } } },
        { "id": 5, "kind": "statement_condition",
          "condition": { "id": 6, "kind": "op_binary", "op": ">",
                         "left": { "id": 7, "kind": "id", "text": "t" },
                         "right": { "id": 8, "kind": "number", "value": "0x10" } },
          "true_statements": [ { "id": 9, "kind": "statement_return" } ] }
      ] }
  ],
  "cfgs": [
    { "idx": 0, "name": "tick", "function_id": 2, "kind": "method", "contract": "Vault",
      "blocks": [ { "idx": 0, "stmts": [3, 5], "kind": "branch" },
                  { "idx": 1, "stmts": [9], "kind": "exit" },
                  { "idx": 2, "stmts": [], "kind": "exit" } ],
      "edges": [ [0, 1], [0, 2] ] }
  ]
})json";

static IrLoadResult load(const std::string & text)
{
  const IrLoader loader(make_null_logger("test"));
  return loader.load_string(text, "mem.json");
}

/// Minimal document with one function `f` whose body is `body` and a single-block CFG
static std::string with_body(const std::string & body, const std::string & stmts)
{
  return R"({"functions": [ { "id": 1, "name": "f", "kind": "function", "body": [)" + body +
         R"(] } ], "cfgs": [ { "idx": 0, "name": "f", "function_id": 1, "kind": "function",
         "blocks": [ { "idx": 0, "stmts": [)" +
         stmts + R"(] } ] } ] })";
}

static void expect_failure(const std::string & text, const std::string & fragment)
{
  const auto result = load(text);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.unit, nullptr);
  EXPECT_EQ(result.error.rfind("mem.json", 0), 0u) << result.error;
  EXPECT_NE(result.error.find(fragment), std::string::npos) << result.error;
}

// ============================================================================
// Valid Documents
// ============================================================================

TEST(IrLoaderTest, LoadsCompleteUnit)
{
  const auto result = load(k_valid_ir);
  ASSERT_TRUE(result.success) << result.error;
  const CompilationUnit & cu = *result.unit;

  EXPECT_EQ(cu.project_name(), "demo");
  ASSERT_EQ(cu.ast().functions().size(), 1u);
  const FunctionDef & tick = *cu.ast().functions().front();
  EXPECT_EQ(tick.id, 2u);
  EXPECT_EQ(tick.qualified_name(), "Vault::tick");
  ASSERT_EQ(tick.params.size(), 1u);
  EXPECT_EQ(tick.params.front().type, "Int");
  ASSERT_EQ(tick.body.size(), 2u);

  const ContractDef * vault = cu.ast().find_contract("Vault");
  ASSERT_NE(vault, nullptr);
  EXPECT_EQ(vault->functions.size(), 1u);

  const Expr * number = cu.ast().get_expr(8);
  ASSERT_NE(number, nullptr);
  ASSERT_NE(number->as<NumberExpr>(), nullptr);
  EXPECT_EQ(number->as<NumberExpr>()->value, Num::integer(16L));

  const Expr * now = cu.ast().get_expr(4);
  ASSERT_NE(now, nullptr);
  EXPECT_EQ(cu.sources().get_slice(now->range), "now()");

  const Cfg * cfg = cu.find_method_cfg_by_name("Vault", "tick");
  ASSERT_NE(cfg, nullptr);
  EXPECT_EQ(cfg->size(), 3u);
  EXPECT_EQ(cfg->entry(), 0u);
  EXPECT_EQ(cfg->get_basic_block(0)->kind, BasicBlockKind::Branch);
  EXPECT_EQ(cfg->get_exit_nodes().size(), 2u);
}

TEST(IrLoaderTest, BuildsCallGraph)
{
  const auto result = load(k_valid_ir);
  ASSERT_TRUE(result.success) << result.error;
  const CallGraph & graph = result.unit->call_graph();

  const auto tick = graph.get_node_id_by_ast_id(2);
  ASSERT_TRUE(tick.has_value());
  EXPECT_TRUE(graph.get_node(*tick)->has_effect(Effect::AccessDatetime));
  EXPECT_TRUE(graph.get_node_id_by_name("now").has_value());
}

TEST(IrLoaderTest, EmptyDocumentGivesEmptyUnit)
{
  const auto result = load("{}");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.unit->cfgs().empty());
  EXPECT_TRUE(result.unit->call_graph().empty());
}

TEST(IrLoaderTest, LoadsFromFile)
{
  const fs::path path = fs::temp_directory_path() / "tactflow_ir_loader_test.json";
  {
    std::ofstream out(path);
    out << k_valid_ir;
  }
  const IrLoader loader(make_null_logger("test"));
  const auto result = loader.load_file(path);
  fs::remove(path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.unit->cfgs().size(), 1u);
}

// ============================================================================
// Malformed Documents
// ============================================================================

TEST(IrLoaderTest, MissingFileFails)
{
  const IrLoader loader(make_null_logger("test"));
  const auto result = loader.load_file("/nonexistent/tactflow/ir.json");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("cannot open"), std::string::npos);
}

TEST(IrLoaderTest, InvalidJsonFails) { expect_failure("{ \"files\": [", "invalid JSON"); }

TEST(IrLoaderTest, NonObjectDocumentFails) { expect_failure("[1, 2]", "expected an object"); }

TEST(IrLoaderTest, UnknownKindFails)
{
  expect_failure(
    with_body(R"({ "id": 2, "kind": "statement_goto" })", "2"), "unknown kind 'statement_goto'");
}

TEST(IrLoaderTest, MissingFieldFails)
{
  expect_failure(
    with_body(R"({ "id": 2, "kind": "statement_expression", "expression": { "id": 3, "kind": "id" } })", "2"),
    "missing 'text'");
}

TEST(IrLoaderTest, DuplicateIdFails)
{
  expect_failure(
    with_body(R"({ "id": 1, "kind": "statement_return" })", "1"), "duplicate AST id 1");
}

TEST(IrLoaderTest, MalformedNumberFails)
{
  expect_failure(
    with_body(
      R"({ "id": 2, "kind": "statement_return", "expression": { "id": 3, "kind": "number", "value": "12abc" } })",
      "2"),
    "12abc");
}

TEST(IrLoaderTest, LargeIntegerLiteralIsExact)
{
  const auto result = load(with_body(
    R"({ "id": 2, "kind": "statement_return", "expression": { "id": 3, "kind": "number", "value": 18446744073709551615 } })",
    "2"));
  ASSERT_TRUE(result.success) << result.error;
  const Expr * number = result.unit->ast().get_expr(3);
  ASSERT_NE(number, nullptr);
  EXPECT_EQ(number->as<NumberExpr>()->value, Num::parse("18446744073709551615"));
}

TEST(IrLoaderTest, NegativeIntegerLiteralLoads)
{
  const auto result = load(with_body(
    R"({ "id": 2, "kind": "statement_return", "expression": { "id": 3, "kind": "number", "value": -42 } })",
    "2"));
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.unit->ast().get_expr(3)->as<NumberExpr>()->value, Num::integer(-42L));
}

TEST(IrLoaderTest, FractionalLiteralFails)
{
  expect_failure(
    with_body(
      R"({ "id": 2, "kind": "statement_return", "expression": { "id": 3, "kind": "number", "value": 1.5 } })",
      "2"),
    "number literal must be an integer, got 1.5");
}

TEST(IrLoaderTest, OutOfRangeIdsFail)
{
  expect_failure(
    with_body(R"({ "id": -1, "kind": "statement_return" })", "2"),
    "expected an integer in [0, 4294967295], got -1");
  expect_failure(
    with_body(R"({ "id": 4294967298, "kind": "statement_return" })", "2"),
    "got 4294967298");
  expect_failure(
    with_body(R"({ "id": 2.0, "kind": "statement_return" })", "2"), "got 2.0");
  expect_failure(with_body(R"({ "id": 2, "kind": "statement_return" })", "-2"), "got -2");
}

TEST(IrLoaderTest, DuplicateFileIdFails)
{
  expect_failure(
    R"({ "files": [ { "id": 0, "path": "a.tact" }, { "id": 0, "path": "b.tact" } ] })",
    "duplicate id 0");
}

TEST(IrLoaderTest, UnknownStatementInBlockFails)
{
  expect_failure(
    with_body(R"({ "id": 2, "kind": "statement_return" })", "2, 40"),
    "references unknown statement 40");
}

TEST(IrLoaderTest, EdgeToUnknownBlockFails)
{
  const std::string doc = R"({
    "functions": [ { "id": 1, "name": "f", "kind": "function", "body": [] } ],
    "cfgs": [ { "idx": 0, "name": "f", "function_id": 1, "kind": "function",
                "blocks": [ { "idx": 0 } ], "edges": [ [0, 3] ] } ] })";
  expect_failure(doc, "unknown basic block");
}

TEST(IrLoaderTest, UnknownCalleeCfgFails)
{
  const std::string doc = R"({
    "functions": [ { "id": 1, "name": "f", "kind": "function", "body": [] } ],
    "cfgs": [ { "idx": 0, "name": "f", "function_id": 1, "kind": "function",
                "blocks": [ { "idx": 0, "kind": "call", "callees": [7] } ] } ] })";
  expect_failure(doc, "calls unknown cfg 7");
}

TEST(IrLoaderTest, CfgForUnknownFunctionFails)
{
  const std::string doc = R"({
    "cfgs": [ { "idx": 0, "name": "f", "function_id": 1, "kind": "function",
                "blocks": [ { "idx": 0 } ] } ] })";
  expect_failure(doc, "unknown function 1");
}
