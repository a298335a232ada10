// tactflow/numeric/interval.cpp - Interval arithmetic
#include "tactflow/numeric/interval.hpp"

#include "tactflow/basic/exceptions.hpp"

namespace tactflow
{

Interval::Interval() : low_(Num::neg_inf()), high_(Num::pos_inf()) {}

Interval::Interval(Num low, Num high) : low_(std::move(low)), high_(std::move(high))
{
  if (low_.is_pos_inf() || high_.is_neg_inf() || low_ > high_) {
    low_ = Num::pos_inf();
    high_ = Num::neg_inf();
  }
}

Interval Interval::full() { return Interval(); }

Interval Interval::empty() { return Interval(Num::pos_inf(), Num::neg_inf()); }

Interval Interval::from_num(const Num & n) { return Interval(n, n); }

Interval Interval::from_num(long value) { return from_num(Num::integer(value)); }

bool Interval::is_full() const noexcept { return low_.is_neg_inf() && high_.is_pos_inf(); }

bool Interval::is_empty() const noexcept { return low_.is_pos_inf() && high_.is_neg_inf(); }

bool Interval::is_singleton() const noexcept { return low_.is_integer() && low_ == high_; }

bool Interval::contains_zero() const noexcept
{
  const Num zero;
  return low_ <= zero && high_ >= zero;
}

bool Interval::contains(const Interval & other) const noexcept
{
  if (other.is_empty()) return true;
  if (is_empty()) return false;
  return low_ <= other.low_ && other.high_ <= high_;
}

// ============================================================================
// Arithmetic
// ============================================================================

// Bounds of a non-empty interval are never +inf below or -inf above, so the
// bound-wise sums below never mix opposite infinities.

Interval Interval::plus(const Interval & other) const
{
  if (is_empty() || other.is_empty()) return empty();
  return Interval(low_.add(other.low_), high_.add(other.high_));
}

Interval Interval::inv() const
{
  if (is_empty()) return empty();
  return Interval(high_.negate(), low_.negate());
}

Interval Interval::minus(const Interval & other) const { return plus(other.inv()); }

Interval Interval::times(const Interval & other) const
{
  if (is_empty() || other.is_empty()) return empty();
  const Num a = low_.multiply(other.low_);
  const Num b = low_.multiply(other.high_);
  const Num c = high_.multiply(other.low_);
  const Num d = high_.multiply(other.high_);
  return Interval(Num::min({a, b, c, d}), Num::max({a, b, c, d}));
}

Interval Interval::div(const Interval & other) const
{
  if (is_empty() || other.is_empty()) return empty();
  if (other.contains_zero()) {
    throw IntervalDomainError("division by interval containing zero: " + other.to_string());
  }
  const Num a = low_.divide(other.low_);
  const Num b = low_.divide(other.high_);
  const Num c = high_.divide(other.low_);
  const Num d = high_.divide(other.high_);
  return Interval(Num::min({a, b, c, d}), Num::max({a, b, c, d}));
}

// ============================================================================
// Abstract comparisons
// ============================================================================

namespace
{

Interval k_true() { return Interval::from_num(1); }
Interval k_false() { return Interval::from_num(0); }
Interval k_unknown() { return Interval(Num::integer(0L), Num::integer(1L)); }

}  // namespace

Interval Interval::equals(const Interval & other) const
{
  if (is_full() || other.is_full()) return full();
  if (is_empty() || other.is_empty()) return empty();
  if (is_singleton() && other.is_singleton() && low_ == other.low_) {
    return k_true();
  }
  return k_unknown();
}

Interval Interval::greater(const Interval & other) const
{
  if (is_full() || other.is_full()) return full();
  if (is_empty() || other.is_empty()) return empty();
  if (low_ > other.high_) {
    return k_true();
  }
  if (high_ <= other.low_) {
    return k_false();
  }
  return k_unknown();
}

// ============================================================================
// Lattice helpers
// ============================================================================

Interval Interval::hull(const Interval & other) const
{
  if (is_empty()) return other;
  if (other.is_empty()) return *this;
  return Interval(Num::min({low_, other.low_}), Num::max({high_, other.high_}));
}

Interval Interval::widen(const Interval & next) const
{
  if (is_empty()) return next;
  if (next.is_empty()) return *this;
  Num low = (next.low_ < low_) ? Num::neg_inf() : low_;
  Num high = (next.high_ > high_) ? Num::pos_inf() : high_;
  return Interval(std::move(low), std::move(high));
}

std::string Interval::to_string() const
{
  if (is_full()) return "(-∞, +∞)";
  if (is_empty()) return "∅";
  if (low_ == high_) return low_.to_string();
  return "(" + low_.to_string() + ", " + high_.to_string() + ")";
}

}  // namespace tactflow
