// tactflow/numeric/interval.hpp - Closed integer intervals over extended integers
#pragma once

#include <string>

#include "tactflow/numeric/num.hpp"

namespace tactflow
{

/**
 * A closed range [low, high] of integers with possibly infinite bounds.
 *
 * FULL is (-inf, +inf). EMPTY is (+inf, -inf) and is the only
 * representation of an interval without integers: any bounds with
 * low > high, a lower bound of +inf, or an upper bound of -inf normalize to
 * EMPTY on construction. Arithmetic with an EMPTY operand yields EMPTY.
 *
 * Comparison operators return abstract booleans encoded as intervals:
 * [1, 1] for definitely true, [0, 0] for definitely false, [0, 1] when
 * unknown.
 */
class Interval
{
public:
  /// FULL
  Interval();

  Interval(Num low, Num high);

  [[nodiscard]] static Interval full();
  [[nodiscard]] static Interval empty();
  [[nodiscard]] static Interval from_num(const Num & n);
  [[nodiscard]] static Interval from_num(long value);

  [[nodiscard]] const Num & low() const noexcept { return low_; }
  [[nodiscard]] const Num & high() const noexcept { return high_; }

  [[nodiscard]] bool is_full() const noexcept;
  [[nodiscard]] bool is_empty() const noexcept;
  [[nodiscard]] bool is_singleton() const noexcept;

  /// Closed test: 0 is in [low, high]
  [[nodiscard]] bool contains_zero() const noexcept;

  /// Every integer of `other` is also in this interval
  [[nodiscard]] bool contains(const Interval & other) const noexcept;

  // ===========================================================================
  // Arithmetic
  // ===========================================================================

  [[nodiscard]] Interval plus(const Interval & other) const;
  [[nodiscard]] Interval minus(const Interval & other) const;

  /// Unary negation
  [[nodiscard]] Interval inv() const;

  /// Min and max over the four corner products
  [[nodiscard]] Interval times(const Interval & other) const;

  /// Throws IntervalDomainError when `other` contains zero
  [[nodiscard]] Interval div(const Interval & other) const;

  // ===========================================================================
  // Abstract comparisons
  // ===========================================================================

  /**
   * Abstract `==`. FULL when either side is FULL, [1, 1] when both sides are
   * the same singleton, [0, 1] otherwise.
   */
  [[nodiscard]] Interval equals(const Interval & other) const;

  /// Abstract `>`; [0, 0] when no value of this range exceeds `other`
  [[nodiscard]] Interval greater(const Interval & other) const;

  // ===========================================================================
  // Lattice helpers
  // ===========================================================================

  /// Smallest interval containing both
  [[nodiscard]] Interval hull(const Interval & other) const;

  /**
   * Standard interval widening: a bound that moved outward in `next` jumps
   * to the matching infinity, a bound that did not move is kept.
   */
  [[nodiscard]] Interval widen(const Interval & next) const;

  /// "(-∞, +∞)", "∅", "v" for singletons, "(l, h)" otherwise
  [[nodiscard]] std::string to_string() const;

  /// Structural equality of the bounds
  friend bool operator==(const Interval & a, const Interval & b) noexcept
  {
    return a.low_ == b.low_ && a.high_ == b.high_;
  }
  friend bool operator!=(const Interval & a, const Interval & b) noexcept { return !(a == b); }

private:
  Num low_;
  Num high_;
};

}  // namespace tactflow
