// tactflow/dataflow/interval_lattice.cpp - Pointwise interval lattice
#include "tactflow/dataflow/interval_lattice.hpp"

namespace tactflow
{

VariableIntervals VariableIntervalLattice::join(
  const VariableIntervals & a, const VariableIntervals & b) const
{
  VariableIntervals out = a;
  for (const auto & [name, interval] : b) {
    auto it = out.find(name);
    if (it == out.end()) {
      out.emplace(name, interval);
    } else {
      it->second = intervals_.join(it->second, interval);
    }
  }
  return out;
}

bool VariableIntervalLattice::leq(const VariableIntervals & a, const VariableIntervals & b) const
{
  for (const auto & [name, interval] : a) {
    const auto it = b.find(name);
    const Interval other = it != b.end() ? it->second : intervals_.bottom();
    if (!intervals_.leq(interval, other)) {
      return false;
    }
  }
  return true;
}

VariableIntervals VariableIntervalLattice::widen(
  const VariableIntervals & old_state, const VariableIntervals & new_state) const
{
  VariableIntervals out = old_state;
  for (const auto & [name, interval] : new_state) {
    auto it = out.find(name);
    if (it == out.end()) {
      out.emplace(name, interval);
    } else {
      it->second = intervals_.widen(it->second, interval);
    }
  }
  return out;
}

}  // namespace tactflow
