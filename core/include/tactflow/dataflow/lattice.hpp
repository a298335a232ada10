// tactflow/dataflow/lattice.hpp - Lattice interfaces and set lattices
//
// Abstract states of a dataflow analysis form a semilattice. The worklist
// solvers only rely on the interfaces below; analyses pick a stock lattice
// or implement their own.
//
#pragma once

#include <algorithm>
#include <iterator>
#include <optional>
#include <set>

namespace tactflow
{

// ============================================================================
// Interfaces
// ============================================================================

template <typename T>
class Semilattice
{
public:
  virtual ~Semilattice() = default;

  /// Partial order: `a` is at most as informative as `b`
  [[nodiscard]] virtual bool leq(const T & a, const T & b) const = 0;
};

/**
 * Semilattice with a least element and a least upper bound.
 *
 * `join` must be commutative, associative and idempotent, and `leq(a, b)`
 * must hold exactly when `join(a, b) == b`.
 */
template <typename T>
class JoinSemilattice : public Semilattice<T>
{
public:
  [[nodiscard]] virtual T bottom() const = 0;
  [[nodiscard]] virtual T join(const T & a, const T & b) const = 0;
};

/**
 * Semilattice with a greatest element and a greatest lower bound.
 */
template <typename T>
class MeetSemilattice : public Semilattice<T>
{
public:
  [[nodiscard]] virtual T top() const = 0;
  [[nodiscard]] virtual T meet(const T & a, const T & b) const = 0;
};

/**
 * Join semilattice with infinite ascending chains, made to converge by
 * widening.
 *
 * `widen(old, next)` must be an upper bound of both arguments, and any
 * sequence `x1 = widen(x0, y0), x2 = widen(x1, y1), ...` must stabilize.
 */
template <typename T>
class WideningLattice : public JoinSemilattice<T>
{
public:
  [[nodiscard]] virtual T widen(const T & old_state, const T & new_state) const = 0;
};

// ============================================================================
// Set lattices
// ============================================================================

/**
 * Powerset ordered by inclusion; join is union.
 */
template <typename T>
class SetJoinSemilattice final : public JoinSemilattice<std::set<T>>
{
public:
  [[nodiscard]] std::set<T> bottom() const override { return {}; }

  [[nodiscard]] std::set<T> join(const std::set<T> & a, const std::set<T> & b) const override
  {
    std::set<T> out = a;
    out.insert(b.begin(), b.end());
    return out;
  }

  [[nodiscard]] bool leq(const std::set<T> & a, const std::set<T> & b) const override
  {
    return std::includes(b.begin(), b.end(), a.begin(), a.end());
  }
};

/// Element of `SetMeetSemilattice`; `std::nullopt` is the whole universe
template <typename T>
using MeetSet = std::optional<std::set<T>>;

/**
 * Powerset ordered by inclusion; meet is intersection.
 *
 * The universe is not known up front, so top is represented by
 * `std::nullopt` and acts as the identity of `meet`.
 */
template <typename T>
class SetMeetSemilattice final : public MeetSemilattice<MeetSet<T>>
{
public:
  [[nodiscard]] MeetSet<T> top() const override { return std::nullopt; }

  [[nodiscard]] MeetSet<T> meet(const MeetSet<T> & a, const MeetSet<T> & b) const override
  {
    if (!a) return b;
    if (!b) return a;
    std::set<T> out;
    std::set_intersection(
      a->begin(), a->end(), b->begin(), b->end(), std::inserter(out, out.end()));
    return out;
  }

  [[nodiscard]] bool leq(const MeetSet<T> & a, const MeetSet<T> & b) const override
  {
    if (!b) return true;
    if (!a) return false;
    return std::includes(b->begin(), b->end(), a->begin(), a->end());
  }
};

}  // namespace tactflow
