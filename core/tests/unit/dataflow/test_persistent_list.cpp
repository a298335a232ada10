// tests/unit/dataflow/test_persistent_list.cpp - Unit tests for PersistentList
//
#include <gtest/gtest.h>

#include <vector>

#include "tactflow/dataflow/persistent_list.hpp"

using namespace tactflow;

static std::vector<int> to_vector(const PersistentList<int> & list)
{
  return std::vector<int>(list.begin(), list.end());
}

TEST(PersistentListTest, PushFrontLeavesOriginalUntouched)
{
  const PersistentList<int> empty;
  const auto one = empty.push_front(1);
  const auto two = one.push_front(2);

  EXPECT_TRUE(empty.empty());
  EXPECT_EQ(to_vector(one), (std::vector<int>{1}));
  EXPECT_EQ(to_vector(two), (std::vector<int>{2, 1}));
  EXPECT_EQ(two.size(), 2u);
  EXPECT_EQ(two.front(), 2);
  EXPECT_TRUE(two.tail().shares_storage_with(one));
  EXPECT_TRUE(empty.tail().empty());
}

TEST(PersistentListTest, EqualityComparesElements)
{
  const auto a = PersistentList<int>().push_front(1).push_front(2);
  const auto b = PersistentList<int>().push_front(1).push_front(2);
  EXPECT_EQ(a, b);
  EXPECT_FALSE(a.shares_storage_with(b));
  EXPECT_NE(a, b.tail());
}

TEST(PersistentListTest, AnyOf)
{
  const auto list = PersistentList<int>().push_front(3).push_front(8);
  EXPECT_TRUE(list.any_of([](int v) { return v > 5; }));
  EXPECT_FALSE(list.any_of([](int v) { return v < 0; }));
}

TEST(PersistentListTest, RemoveIfSharesUntouchedSuffix)
{
  const auto base = PersistentList<int>().push_front(1).push_front(2);
  const auto list = base.push_front(3).push_front(4);  // 4 3 2 1

  const auto without_three = list.remove_if([](int v) { return v == 3; });
  EXPECT_EQ(to_vector(without_three), (std::vector<int>{4, 2, 1}));
  EXPECT_EQ(without_three.size(), 3u);
  EXPECT_TRUE(without_three.tail().shares_storage_with(base));
  EXPECT_EQ(to_vector(list), (std::vector<int>{4, 3, 2, 1}));

  const auto unchanged = list.remove_if([](int v) { return v > 100; });
  EXPECT_TRUE(unchanged.shares_storage_with(list));

  const auto evens = list.remove_if([](int v) { return v % 2 != 0; });
  EXPECT_EQ(to_vector(evens), (std::vector<int>{4, 2}));
  EXPECT_TRUE(list.remove_if([](int) { return true; }).empty());
}
