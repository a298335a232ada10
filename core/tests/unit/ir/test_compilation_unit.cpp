// tests/unit/ir/test_compilation_unit.cpp - Unit tests for CFG ownership and lookup
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tactflow/basic/exceptions.hpp"
#include "tactflow/ir/compilation_unit.hpp"

using namespace tactflow;

TEST(CompilationUnitTest, LookupByIndexAndName)
{
  CompilationUnit cu("vault");
  const Cfg & helper = cu.create_cfg("helper", 1, FunctionKind::Function);
  const Cfg & withdraw =
    cu.create_cfg("withdraw", 2, FunctionKind::Method, ItemOrigin::User, {}, "Vault");

  EXPECT_EQ(cu.project_name(), "vault");
  EXPECT_NE(helper.idx(), withdraw.idx());
  EXPECT_EQ(cu.find_cfg_by_idx(withdraw.idx()), &withdraw);
  EXPECT_EQ(cu.find_function_cfg_by_name("helper"), &helper);
  EXPECT_EQ(cu.find_function_cfg_by_name("withdraw"), nullptr);
  EXPECT_EQ(cu.find_method_cfg_by_name("Vault", "withdraw"), &withdraw);
  EXPECT_EQ(cu.find_method_cfg_by_name("Other", "withdraw"), nullptr);
}

TEST(CompilationUnitTest, NamesAreUniquePerContract)
{
  CompilationUnit cu;
  cu.create_cfg("get", 1, FunctionKind::Method, ItemOrigin::User, {}, "A");
  cu.create_cfg("get", 2, FunctionKind::Method, ItemOrigin::User, {}, "B");
  cu.create_cfg("get", 3, FunctionKind::Function);
  EXPECT_THROW(
    cu.create_cfg("get", 4, FunctionKind::Method, ItemOrigin::User, {}, "A"), InternalError);
  EXPECT_EQ(cu.cfgs().size(), 3u);
}

TEST(CompilationUnitTest, DuplicateIndexThrows)
{
  CompilationUnit cu;
  cu.add_cfg(Cfg(5, "a", 1, FunctionKind::Function));
  EXPECT_THROW(cu.add_cfg(Cfg(5, "b", 2, FunctionKind::Function)), InternalError);

  // Fresh indices skip those added explicitly.
  const Cfg & next = cu.create_cfg("c", 3, FunctionKind::Function);
  EXPECT_GT(next.idx(), 5u);
}

TEST(CompilationUnitTest, IterationSkipsStdlibByDefault)
{
  CompilationUnit cu;
  cu.create_cfg("user_fn", 1, FunctionKind::Function);
  cu.create_cfg("dump", 2, FunctionKind::Function, ItemOrigin::Stdlib);

  std::vector<std::string> names;
  cu.for_each_cfg([&](const Cfg & cfg) { names.push_back(cfg.name()); });
  EXPECT_EQ(names, (std::vector<std::string>{"user_fn"}));

  CfgIterationOptions all;
  all.include_stdlib = true;
  const size_t count = cu.fold_cfgs(size_t{0}, [](size_t acc, const Cfg &) { return acc + 1; }, all);
  EXPECT_EQ(count, 2u);
}

TEST(CompilationUnitTest, IterationFollowsInsertionOrder)
{
  CompilationUnit cu;
  cu.add_cfg(Cfg(9, "late_index", 1, FunctionKind::Function));
  cu.add_cfg(Cfg(2, "early_index", 2, FunctionKind::Function));
  cu.create_cfg("fresh", 3, FunctionKind::Function);

  std::vector<std::string> names;
  cu.for_each_cfg([&](const Cfg & cfg) { names.push_back(cfg.name()); });
  EXPECT_EQ(names, (std::vector<std::string>{"late_index", "early_index", "fresh"}));
  ASSERT_NE(cu.find_cfg_by_idx(2), nullptr);
  EXPECT_EQ(cu.find_cfg_by_idx(2)->name(), "early_index");
}
