// tests/unit/basic/test_source_manager.cpp - Unit tests for SourceRegistry
//
#include <gtest/gtest.h>

#include "tactflow/basic/source_manager.hpp"

using namespace tactflow;

TEST(SourceRegistryTest, FilesAreNumberedInOrder)
{
  SourceRegistry sources;
  const FileId a = sources.add_file("contracts/a.tact", "contract A {}\n");
  const FileId b = sources.add_file("contracts/b.tact", "contract B {}\n");

  EXPECT_EQ(a, FileId(0));
  EXPECT_EQ(b, FileId(1));
  EXPECT_EQ(sources.size(), 2u);
  EXPECT_EQ(sources.get_file(a)->content(), "contract A {}\n");
  EXPECT_EQ(sources.get_file(b)->path(), "contracts/b.tact");
  EXPECT_EQ(sources.get_file(FileId(2)), nullptr);
  EXPECT_EQ(sources.get_file(FileId::invalid()), nullptr);
}

TEST(SourceRegistryTest, ResolveAndSlice)
{
  SourceRegistry sources;
  const FileId f = sources.add_file("t.tact", "fun f() {\n  let x = now();\n}\n");

  const SourceRange call(f, 20, 25);
  EXPECT_EQ(sources.get_slice(call), "now()");

  const FullSourceRange full = sources.resolve(call);
  ASSERT_TRUE(full.is_valid());
  EXPECT_EQ(full.start.line, 2u);
  EXPECT_EQ(full.start.column, 11u);
  EXPECT_EQ(full.end.line, 2u);
  EXPECT_EQ(full.end.column, 16u);

  EXPECT_EQ(sources.get_file(f)->line_count(), 4u);
  EXPECT_EQ(sources.get_file(f)->get_line(1), "  let x = now();");
}

TEST(SourceRegistryTest, OffsetsPastTheEndAreClamped)
{
  SourceRegistry sources;
  const FileId f = sources.add_file("short.tact", "abc\r\ndef");

  EXPECT_EQ(sources.get_slice(SourceRange(f, 5, 100)), "def");
  EXPECT_EQ(sources.get_slice(SourceRange(f, 50, 100)), "");
  EXPECT_EQ(sources.get_file(f)->get_line(0), "abc");

  const LineColumn end = sources.get_file(f)->locate(1000);
  EXPECT_EQ(end.line, 2u);
  EXPECT_EQ(end.column, 4u);
}

TEST(SourceRegistryTest, DescribeGivesPathLineColumn)
{
  SourceRegistry sources;
  const FileId f = sources.add_file("/work/contracts/t.tact", "a\nbc\n");

  EXPECT_EQ(sources.describe(SourceRange(f, 3, 4)), "/work/contracts/t.tact:2:2");
  EXPECT_EQ(sources.describe(SourceRange(f, 3, 4), "/work"), "contracts/t.tact:2:2");
  EXPECT_FALSE(sources.describe(SourceRange(FileId(7), 0, 1)).has_value());
}

TEST(SourceRegistryTest, InvalidRangesHaveNoPosition)
{
  SourceRegistry sources;
  const SourceRange none;
  EXPECT_FALSE(none.is_valid());
  EXPECT_EQ(none.size(), 0u);
  EXPECT_FALSE(sources.resolve(none).is_valid());
  EXPECT_FALSE(sources.describe(none).has_value());
  EXPECT_EQ(sources.get_slice(none), "");
}
