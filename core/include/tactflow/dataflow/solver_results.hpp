// tactflow/dataflow/solver_results.hpp - Per-block states computed by a solver
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "tactflow/basic/indices.hpp"

namespace tactflow
{

/**
 * Fixpoint of a dataflow problem: the state after each block (out-state)
 * and the joined state flowing into it (in-state). For a backward analysis
 * "after" and "into" follow the direction of the analysis.
 */
template <typename S>
class SolverResults
{
public:
  /// Out-state of block `idx`, nullptr if the block was never seen
  [[nodiscard]] const S * get_state(BasicBlockIdx idx) const noexcept
  {
    const auto it = states_.find(idx);
    return it != states_.end() ? &it->second : nullptr;
  }

  /// In-state of block `idx`, nullptr if the block was never visited
  [[nodiscard]] const S * get_in_state(BasicBlockIdx idx) const noexcept
  {
    const auto it = inStates_.find(idx);
    return it != inStates_.end() ? &it->second : nullptr;
  }

  void set_state(BasicBlockIdx idx, S state) { states_[idx] = std::move(state); }
  void set_in_state(BasicBlockIdx idx, S state) { inStates_[idx] = std::move(state); }

  [[nodiscard]] const std::map<BasicBlockIdx, S> & get_states() const noexcept { return states_; }
  [[nodiscard]] const std::map<BasicBlockIdx, S> & get_in_states() const noexcept
  {
    return inStates_;
  }

  /// Number of block visits the solver made
  [[nodiscard]] uint64_t iterations() const noexcept { return iterations_; }
  void set_iterations(uint64_t n) noexcept { iterations_ = n; }

private:
  std::map<BasicBlockIdx, S> states_;
  std::map<BasicBlockIdx, S> inStates_;
  uint64_t iterations_ = 0;
};

/**
 * Result of WorklistSolver::try_solve(). `results` is set only on success.
 */
template <typename S>
struct SolveOutcome
{
  std::optional<SolverResults<S>> results;

  bool success = false;

  /// Error message if solving failed
  std::string error;

  static SolveOutcome ok(SolverResults<S> r)
  {
    SolveOutcome o;
    o.results = std::move(r);
    o.success = true;
    return o;
  }

  static SolveOutcome fail(std::string msg)
  {
    SolveOutcome o;
    o.error = std::move(msg);
    o.success = false;
    return o;
  }
};

}  // namespace tactflow
