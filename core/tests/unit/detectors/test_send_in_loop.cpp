// tests/unit/detectors/test_send_in_loop.cpp - Unit tests for SendInLoop and the registry
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tactflow/basic/logging.hpp"
#include "tactflow/detectors/registry.hpp"
#include "tactflow/detectors/send_in_loop.hpp"
#include "tactflow/test_support/ir_helpers.hpp"

using namespace tactflow;
using test_support::UnitBuilder;

// ============================================================================
// Helper Functions
// ============================================================================

static std::vector<std::string> run_detector(const CompilationUnit & cu, bool include_stdlib = false)
{
  DetectorContext ctx;
  ctx.logger = make_null_logger("test");
  ctx.iteration.include_stdlib = include_stdlib;
  SendInLoop detector;
  DiagnosticBag diags;
  detector.check(ctx, cu, diags);

  std::vector<std::string> out;
  for (const auto & d : diags) {
    EXPECT_EQ(d.code, "SendInLoop");
    EXPECT_EQ(d.severity, Severity::Warning);
    out.push_back(d.message);
  }
  return out;
}

// ============================================================================
// SendInLoop
// ============================================================================

TEST(SendInLoopTest, ReportsDirectSend)
{
  UnitBuilder b;
  b.function(
    "payout", {b.while_loop(b.id("more"), {b.expr_stmt(b.call("send", {b.id("p")}))})});
  const auto cu = b.finish();

  EXPECT_EQ(run_detector(*cu), (std::vector<std::string>{"Send function called inside a loop"}));
}

TEST(SendInLoopTest, ReportsSelfReplyInRepeat)
{
  UnitBuilder b;
  b.function(
    "spam",
    {b.repeat_loop(b.num(3), {b.expr_stmt(b.method(b.id("self"), "reply", {b.id("body")}))})},
    {}, std::string("Bot"));
  const auto cu = b.finish();

  EXPECT_EQ(run_detector(*cu), (std::vector<std::string>{"Send function called inside a loop"}));
}

TEST(SendInLoopTest, ReportsCallToSendingFunction)
{
  UnitBuilder b;
  b.function("notifyAll", {b.expr_stmt(b.call("send", {b.id("p")}))});
  b.function("loop", {b.while_loop(b.id("more"), {b.expr_stmt(b.call("notifyAll"))})});
  const auto cu = b.finish();

  EXPECT_EQ(
    run_detector(*cu),
    (std::vector<std::string>{"Call to 'notifyAll' inside a loop sends a message"}));
}

TEST(SendInLoopTest, ReportsTransitiveSender)
{
  UnitBuilder b;
  b.function("deliver", {b.expr_stmt(b.call("send", {b.id("p")}))});
  b.function("relay", {b.expr_stmt(b.call("deliver"))});
  b.function("loop", {b.while_loop(b.id("more"), {b.expr_stmt(b.call("relay"))})});
  const auto cu = b.finish();

  EXPECT_EQ(
    run_detector(*cu), (std::vector<std::string>{"Call to 'relay' inside a loop sends a message"}));
}

TEST(SendInLoopTest, NestedLoopsReportOnce)
{
  UnitBuilder b;
  const Stmt * inner = b.while_loop(b.id("b"), {b.expr_stmt(b.call("send", {b.id("p")}))});
  b.function("nested", {b.while_loop(b.id("a"), {inner})});
  const auto cu = b.finish();

  EXPECT_EQ(run_detector(*cu).size(), 1u);
}

TEST(SendInLoopTest, SendOutsideLoopIsClean)
{
  UnitBuilder b;
  b.function(
    "once", {
              b.expr_stmt(b.call("send", {b.id("p")})),
              b.while_loop(b.id("more"), {b.expr_stmt(b.call("dump", {b.id("x")}))}),
            });
  const auto cu = b.finish();

  EXPECT_TRUE(run_detector(*cu).empty());
}

TEST(SendInLoopTest, StdlibFunctionsNeedOptIn)
{
  UnitBuilder b;
  b.function(
    "batch", {b.while_loop(b.id("more"), {b.expr_stmt(b.call("send", {b.id("p")}))})}, {},
    std::nullopt, FunctionKind::Function, ItemOrigin::Stdlib);
  const auto cu = b.finish();

  EXPECT_TRUE(run_detector(*cu).empty());
  EXPECT_EQ(run_detector(*cu, true).size(), 1u);
}

// ============================================================================
// Detector Base
// ============================================================================

namespace
{

/// Reports one finding per CFG with a hint severity
class CfgCounter final : public Detector
{
public:
  [[nodiscard]] std::string_view id() const noexcept override { return "CfgCounter"; }
  [[nodiscard]] std::string_view description() const noexcept override { return "counts CFGs"; }
  [[nodiscard]] Severity severity() const noexcept override { return Severity::Hint; }

  void check(const DetectorContext & ctx, const CompilationUnit & cu, DiagnosticBag & diags) override
  {
    cu.for_each_cfg(
      [&](const Cfg & cfg) { report(diags, cfg.range(), "CFG " + cfg.name(), "here"); },
      ctx.iteration);
  }
};

}  // namespace

TEST(DetectorTest, ReportKeepsSeverityAndCode)
{
  UnitBuilder b;
  const auto * fn = b.function("tick", {b.ret()});
  b.linear_cfg(*fn);
  const auto cu = b.finish();

  DetectorContext ctx;
  ctx.logger = make_null_logger("test");
  CfgCounter detector;
  DiagnosticBag diags;
  detector.check(ctx, *cu, diags);

  ASSERT_EQ(diags.size(), 1u);
  const Diagnostic & d = *diags.begin();
  EXPECT_EQ(d.severity, Severity::Hint);
  EXPECT_EQ(d.code, "CfgCounter");
  EXPECT_EQ(d.message, "CFG tick");
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "here");
}

// ============================================================================
// Registry
// ============================================================================

TEST(DetectorRegistryTest, BuiltinIds)
{
  EXPECT_EQ(
    builtin_detector_ids(), (std::vector<std::string_view>{
                              "TimestampDependence",
                              "ExitCodeUsage",
                              "UnprotectedCall",
                              "SendInLoop",
                            }));
  EXPECT_TRUE(is_builtin_detector("SendInLoop"));
  EXPECT_FALSE(is_builtin_detector("sendinloop"));
}

TEST(DetectorRegistryTest, MakeDetector)
{
  for (const auto id : builtin_detector_ids()) {
    const auto detector = make_detector(id);
    ASSERT_NE(detector, nullptr) << id;
    EXPECT_EQ(detector->id(), id);
    EXPECT_FALSE(detector->description().empty());
  }
  EXPECT_EQ(make_detector("NoSuchDetector"), nullptr);
  EXPECT_EQ(make_all_detectors().size(), builtin_detector_ids().size());
}
