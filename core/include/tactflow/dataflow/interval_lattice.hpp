// tactflow/dataflow/interval_lattice.hpp - Lattices over the interval domain
#pragma once

#include <map>
#include <string>

#include "tactflow/dataflow/lattice.hpp"
#include "tactflow/numeric/interval.hpp"

namespace tactflow
{

/**
 * Intervals ordered by containment. Bottom is EMPTY, join is the hull,
 * widening pushes unstable bounds to infinity.
 */
class IntervalJoinSemilattice final : public WideningLattice<Interval>
{
public:
  [[nodiscard]] Interval bottom() const override { return Interval::empty(); }

  [[nodiscard]] Interval join(const Interval & a, const Interval & b) const override
  {
    return a.hull(b);
  }

  [[nodiscard]] bool leq(const Interval & a, const Interval & b) const override
  {
    return b.contains(a);
  }

  [[nodiscard]] Interval widen(const Interval & old_state, const Interval & new_state) const override
  {
    return old_state.widen(new_state);
  }
};

/// Interval of each local variable; a missing variable is EMPTY
using VariableIntervals = std::map<std::string, Interval>;

/**
 * Pointwise lift of IntervalJoinSemilattice to variable maps.
 */
class VariableIntervalLattice final : public WideningLattice<VariableIntervals>
{
public:
  [[nodiscard]] VariableIntervals bottom() const override { return {}; }

  [[nodiscard]] VariableIntervals join(
    const VariableIntervals & a, const VariableIntervals & b) const override;

  [[nodiscard]] bool leq(const VariableIntervals & a, const VariableIntervals & b) const override;

  [[nodiscard]] VariableIntervals widen(
    const VariableIntervals & old_state, const VariableIntervals & new_state) const override;

private:
  IntervalJoinSemilattice intervals_;
};

}  // namespace tactflow
