// tests/unit/numeric/test_interval.cpp - Unit tests for the interval domain
//
#include <gtest/gtest.h>

#include "tactflow/basic/exceptions.hpp"
#include "tactflow/numeric/interval.hpp"

using namespace tactflow;

static Interval range(long low, long high)
{
  return Interval(Num::integer(low), Num::integer(high));
}

TEST(IntervalTest, Arithmetic)
{
  EXPECT_EQ(Interval::from_num(5).plus(Interval::from_num(3)), Interval::from_num(8));
  EXPECT_EQ(Interval::from_num(-2).times(Interval::from_num(3)), Interval::from_num(-6));
  EXPECT_EQ(range(1, 4).minus(range(0, 2)), range(-1, 4));
  EXPECT_EQ(range(-3, 2).inv(), range(-2, 3));
  EXPECT_EQ(range(-2, 3).times(range(-4, 5)), range(-12, 15));
  EXPECT_EQ(range(10, 20).div(range(2, 5)), range(2, 10));
}

TEST(IntervalTest, DivisionByRangeContainingZeroThrows)
{
  EXPECT_THROW((void)Interval::from_num(10).div(range(-1, 1)), IntervalDomainError);
  EXPECT_THROW((void)Interval::from_num(10).div(Interval::from_num(0)), IntervalDomainError);
  EXPECT_THROW((void)range(1, 2).div(Interval::full()), IntervalDomainError);
}

TEST(IntervalTest, EmptyOperandsYieldEmpty)
{
  EXPECT_TRUE(Interval::empty().plus(range(1, 2)).is_empty());
  EXPECT_TRUE(range(1, 2).times(Interval::empty()).is_empty());
  EXPECT_TRUE(Interval::empty().div(Interval::from_num(0)).is_empty());
  EXPECT_TRUE(Interval::empty().inv().is_empty());
}

TEST(IntervalTest, InfiniteBounds)
{
  const Interval up(Num::integer(0L), Num::pos_inf());
  EXPECT_EQ(up.plus(Interval::from_num(5)), Interval(Num::integer(5L), Num::pos_inf()));
  EXPECT_TRUE(Interval::full().plus(range(1, 2)).is_full());
  EXPECT_EQ(up.times(Interval::from_num(0)), Interval::from_num(0));
}

TEST(IntervalTest, ContainsZeroIsClosed)
{
  EXPECT_TRUE(range(0, 3).contains_zero());
  EXPECT_TRUE(range(-3, 0).contains_zero());
  EXPECT_FALSE(range(1, 3).contains_zero());
  EXPECT_FALSE(Interval::empty().contains_zero());
}

TEST(IntervalTest, AbstractEquality)
{
  EXPECT_TRUE(Interval::full().equals(Interval::from_num(1)).is_full());
  EXPECT_EQ(Interval::from_num(4).equals(Interval::from_num(4)), Interval::from_num(1));
  EXPECT_EQ(range(0, 2).equals(range(5, 6)), range(0, 1));
  EXPECT_EQ(Interval::from_num(4).equals(Interval::from_num(5)), range(0, 1));
  EXPECT_EQ(range(0, 5).equals(range(3, 9)), range(0, 1));
}

TEST(IntervalTest, AbstractGreater)
{
  EXPECT_EQ(range(10, 20).greater(range(0, 5)), Interval::from_num(1));
  EXPECT_EQ(range(0, 5).greater(range(10, 20)), Interval::from_num(0));
  EXPECT_EQ(range(0, 10).greater(range(5, 6)), range(0, 1));
  EXPECT_TRUE(Interval::full().greater(range(0, 1)).is_full());
}

TEST(IntervalTest, HullAndContains)
{
  EXPECT_EQ(range(1, 3).hull(range(7, 9)), range(1, 9));
  EXPECT_EQ(Interval::empty().hull(range(2, 2)), Interval::from_num(2));
  EXPECT_TRUE(range(0, 10).contains(range(2, 3)));
  EXPECT_FALSE(range(2, 3).contains(range(0, 10)));
  EXPECT_TRUE(range(2, 3).contains(Interval::empty()));
}

TEST(IntervalTest, WidenPushesMovingBoundsToInfinity)
{
  EXPECT_EQ(range(0, 1).widen(range(0, 2)), Interval(Num::integer(0L), Num::pos_inf()));
  EXPECT_EQ(range(0, 1).widen(range(-1, 1)), Interval(Num::neg_inf(), Num::integer(1L)));
  EXPECT_EQ(range(0, 5).widen(range(1, 4)), range(0, 5));
  EXPECT_EQ(Interval::empty().widen(range(3, 4)), range(3, 4));
}

TEST(IntervalTest, ToString)
{
  EXPECT_EQ(Interval::full().to_string(), "(-∞, +∞)");
  EXPECT_EQ(Interval::empty().to_string(), "∅");
  EXPECT_EQ(Interval::from_num(7).to_string(), "7");
  EXPECT_EQ(range(1, 9).to_string(), "(1, 9)");
  EXPECT_EQ(Interval(Num::integer(0L), Num::pos_inf()).to_string(), "(0, +inf)");
}

TEST(IntervalTest, InvertedBoundsNormalizeToEmpty)
{
  EXPECT_TRUE(range(5, 1).is_empty());
  EXPECT_EQ(range(5, 1), Interval::empty());
}
