// tests/unit/detectors/test_unprotected_call.cpp - Unit tests for UnprotectedCall
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tactflow/basic/logging.hpp"
#include "tactflow/detectors/unprotected_call.hpp"
#include "tactflow/test_support/ir_helpers.hpp"
#include "tactflow/test_support/lattice_checks.hpp"

using namespace tactflow;
using test_support::UnitBuilder;

// ============================================================================
// Helper Functions
// ============================================================================

static DiagnosticBag run_detector(const CompilationUnit & cu)
{
  DetectorContext ctx;
  ctx.logger = make_null_logger("test");
  UnprotectedCall detector;
  DiagnosticBag diags;
  detector.check(ctx, cu, diags);
  return diags;
}

static std::vector<std::string> messages(const DiagnosticBag & diags)
{
  std::vector<std::string> out;
  for (const auto & d : diags) {
    out.push_back(d.message);
  }
  return out;
}

static ArgTaint taint(AstId id, std::string name, bool unprotected = true)
{
  ArgTaint t;
  t.id = id;
  t.name = std::move(name);
  t.unprotected = unprotected;
  return t;
}

/// Receiver of contract Vault with parameter `amount`
static const FunctionDef * receiver(UnitBuilder & b, StmtList body)
{
  return b.function(
    "deposit", std::move(body), {"amount"}, std::string("Vault"), FunctionKind::Receiver);
}

// ============================================================================
// Lattice
// ============================================================================

TEST(ArgTaintLatticeTest, JoinKeepsUnprotectedVersion)
{
  const ArgTaintLattice lattice{};
  const ArgTaints guarded = ArgTaints().push_front(taint(1, "v", false));
  const ArgTaints open = ArgTaints().push_front(taint(1, "v", true));

  const ArgTaints joined = lattice.join(guarded, open);
  ASSERT_EQ(joined.size(), 1u);
  EXPECT_TRUE(joined.front().unprotected);
  EXPECT_TRUE(lattice.leq(guarded, open));
  EXPECT_FALSE(lattice.leq(open, guarded));
}

TEST(ArgTaintLatticeTest, JoinIsUnionOfOrigins)
{
  const ArgTaintLattice lattice{};
  const ArgTaints a = ArgTaints().push_front(taint(1, "v"));
  const ArgTaints b = ArgTaints().push_front(taint(2, "w"));

  const ArgTaints joined = lattice.join(a, b);
  EXPECT_EQ(joined.size(), 2u);
  EXPECT_TRUE(lattice.leq(a, joined));
  EXPECT_TRUE(lattice.leq(b, joined));
  EXPECT_TRUE(lattice.leq(lattice.bottom(), a));
}

// ============================================================================
// Transfer
// ============================================================================

TEST(UnprotectedCallTransferTest, LetFromParameterCreatesTaint)
{
  UnitBuilder b;
  const Stmt * let = b.let("v", b.bin(BinaryOp::Mul, b.id("amount"), b.num(2)));
  const UnprotectedCallTransfer transfer({taint(100, "amount")});
  const BasicBlock block{0, {let->id}};

  const ArgTaints out = transfer.transfer({}, block, *let);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out.front().name, "v");
  EXPECT_EQ(out.front().id, let->id);
  EXPECT_EQ(out.front().parents, (std::vector<AstId>{100}));
  EXPECT_TRUE(out.front().unprotected);
}

TEST(UnprotectedCallTransferTest, MethodChainCarriesReceiverTaint)
{
  UnitBuilder b;
  const Stmt * let =
    b.let("s", b.method(b.method(b.id("amount"), "loadRef"), "beginParse"));
  const UnprotectedCallTransfer transfer({taint(100, "amount")});
  const BasicBlock block{0, {let->id}};

  EXPECT_EQ(transfer.transfer({}, block, *let).size(), 1u);
}

TEST(UnprotectedCallTransferTest, ConditionProtectsCheckedTaint)
{
  UnitBuilder b;
  const Stmt * let = b.let("v", b.id("amount"));
  const Stmt * check = b.condition(b.bin(BinaryOp::Gt, b.id("v"), b.num(0)));
  const UnprotectedCallTransfer transfer({taint(100, "amount")});
  const BasicBlock block{0, {let->id, check->id}};

  const ArgTaints tainted = transfer.transfer({}, block, *let);
  const ArgTaints checked = transfer.transfer(tainted, block, *check);
  ASSERT_EQ(checked.size(), 1u);
  EXPECT_FALSE(checked.front().unprotected);
}

TEST(UnprotectedCallTransferTest, UnrelatedValuesLeaveStateAlone)
{
  UnitBuilder b;
  const Stmt * let = b.let("v", b.num(5));
  const UnprotectedCallTransfer transfer({taint(100, "amount")});
  const BasicBlock block{0, {let->id}};

  EXPECT_TRUE(transfer.transfer({}, block, *let).empty());
}

TEST(UnprotectedCallTransferTest, IsMonotone)
{
  UnitBuilder b;
  const std::vector<const Stmt *> stmts = {
    b.let("w", b.bin(BinaryOp::Add, b.id("v"), b.id("u"))),
    b.condition(b.bin(BinaryOp::Gt, b.id("v"), b.num(0))),
    b.assign(b.id("v"), b.id("u")),
    b.let("s", b.method(b.id("amount"), "beginParse")),
    b.let("z", b.num(5)),
  };
  const ArgTaints guarded = ArgTaints().push_front(taint(1, "v", false));
  const ArgTaints open_v = ArgTaints().push_front(taint(1, "v"));
  const ArgTaints open_both = open_v.push_front(taint(2, "u"));
  const std::vector<ArgTaints> states = {ArgTaints(), guarded, open_v, open_both};

  const ArgTaintLattice lattice{};
  ASSERT_TRUE(lattice.leq(guarded, open_v));
  ASSERT_TRUE(lattice.leq(open_v, open_both));

  const UnprotectedCallTransfer transfer({taint(100, "amount")});
  const auto violation =
    test_support::find_monotonicity_violation<ArgTaints>(lattice, transfer, states, stmts);
  EXPECT_FALSE(violation.has_value()) << *violation;
}

TEST(UnprotectedCallTransferTest, ParentsDoNotChangeOrigin)
{
  ArgTaint narrow = taint(7, "w");
  narrow.parents = {1};
  ArgTaint wide = taint(7, "w");
  wide.parents = {1, 2};
  EXPECT_TRUE(narrow.same_origin(wide));
  EXPECT_FALSE(narrow.same_origin(taint(8, "w")));
}

// ============================================================================
// Detector
// ============================================================================

TEST(UnprotectedCallTest, ReportsUncheckedSendArgument)
{
  UnitBuilder b;
  const auto * fn = receiver(
    b, {
         b.let("v", b.id("amount")),
         b.expr_stmt(b.call("send", {b.id("v")})),
       });
  b.linear_cfg(*fn);
  const auto cu = b.finish();

  const DiagnosticBag diags = run_detector(*cu);
  ASSERT_EQ(diags.size(), 1u);
  EXPECT_EQ(messages(diags), (std::vector<std::string>{"Unprotected send argument: v"}));
  EXPECT_EQ(diags.begin()->code, "UnprotectedCall");
  EXPECT_EQ(diags.begin()->severity, Severity::Error);
}

TEST(UnprotectedCallTest, StructFieldsOfSendAreChecked)
{
  UnitBuilder b;
  const auto * fn = receiver(
    b, {
         b.let("v", b.id("amount")),
         b.expr_stmt(b.call(
           "send", {b.struct_instance("SendParameters", {StructFieldInit{"value", b.id("v")}})})),
       });
  b.linear_cfg(*fn);
  const auto cu = b.finish();

  EXPECT_EQ(messages(run_detector(*cu)), (std::vector<std::string>{"Unprotected send argument: v"}));
}

TEST(UnprotectedCallTest, CheckedArgumentIsClean)
{
  UnitBuilder b;
  const auto * fn = receiver(
    b, {
         b.let("v", b.id("amount")),
         b.condition(b.bin(BinaryOp::Gt, b.id("v"), b.num(0))),
         b.expr_stmt(b.call("send", {b.id("v")})),
       });
  b.linear_cfg(*fn);
  const auto cu = b.finish();

  EXPECT_EQ(run_detector(*cu).size(), 0u);
}

TEST(UnprotectedCallTest, ReportsUncheckedFieldMutation)
{
  UnitBuilder b;
  const auto * fn = receiver(
    b, {
         b.let("k", b.id("amount")),
         b.expr_stmt(b.method(b.self_field("balances"), "set", {b.id("k"), b.num(1)})),
       });
  b.linear_cfg(*fn);
  const auto cu = b.finish();

  EXPECT_EQ(
    messages(run_detector(*cu)), (std::vector<std::string>{"Unprotected field mutation: k"}));
}

TEST(UnprotectedCallTest, FunctionsWithoutEffectsAreSkipped)
{
  UnitBuilder b;
  const auto * fn = receiver(
    b, {
         b.let("v", b.id("amount")),
         b.expr_stmt(b.call("dump", {b.id("v")})),
       });
  b.linear_cfg(*fn);
  const auto cu = b.finish();

  EXPECT_EQ(run_detector(*cu).size(), 0u);
}
