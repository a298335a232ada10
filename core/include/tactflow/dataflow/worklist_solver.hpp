// tactflow/dataflow/worklist_solver.hpp - Worklist fixpoint solvers over a CFG
//
// The solvers are generic over the abstract state S. A solver borrows the
// compilation unit, the CFG, the transfer function and the lattice; all of
// them must outlive the solve() call. Each solve() allocates its own queue
// and state maps, so a solver can be run repeatedly.
//
#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "tactflow/basic/exceptions.hpp"
#include "tactflow/dataflow/lattice.hpp"
#include "tactflow/dataflow/solver_results.hpp"
#include "tactflow/dataflow/transfer.hpp"
#include "tactflow/ir/cfg.hpp"
#include "tactflow/ir/compilation_unit.hpp"

namespace tactflow
{

/// Direction information flows in
enum class AnalysisKind : uint8_t {
  Forward,   ///< from the entry towards the exits
  Backward,  ///< from the exits towards the entry
};

struct SolverOptions
{
  /// Maximum number of block visits; unset means unbounded
  std::optional<uint64_t> max_iterations;
};

// ============================================================================
// WorklistSolver
// ============================================================================

/**
 * Classic worklist algorithm.
 *
 * Every block starts at bottom() and is queued once, in CFG construction
 * order. A popped block joins the out-states of its predecessors (forward)
 * or successors (backward), plus the boundary state when it is the entry
 * (forward) or an exit (backward), runs the transfer over its statements (in
 * reverse order for a backward analysis), and, when the result is not
 * below its previous out-state, stores it and queues its successors
 * (forward) or predecessors (backward). A block is never queued twice at
 * the same time.
 *
 * Terminates for lattices without infinite ascending chains. For others use
 * WideningWorklistSolver or set SolverOptions::max_iterations.
 */
template <typename S>
class WorklistSolver
{
public:
  WorklistSolver(
    const CompilationUnit & cu, const Cfg & cfg, const Transfer<S> & transfer,
    const JoinSemilattice<S> & lattice, AnalysisKind kind, SolverOptions options = {})
  : cu_(cu), cfg_(cfg), transfer_(transfer), lattice_(lattice), kind_(kind), options_(options)
  {
  }

  virtual ~WorklistSolver() = default;

  /// State flowing into the entry (forward) or out of the exits (backward)
  void set_boundary_state(S state) { boundary_ = std::move(state); }

  /**
   * Compute the fixpoint.
   *
   * @throws InternalError if the CFG references a missing statement or block
   * @throws NonConvergenceError if the iteration budget is exhausted
   */
  [[nodiscard]] SolverResults<S> solve() const
  {
    SolverResults<S> results;
    std::deque<BasicBlockIdx> worklist;
    std::unordered_set<BasicBlockIdx> queued;
    std::unordered_map<BasicBlockIdx, uint64_t> updates;

    for (const auto & block : cfg_.blocks()) {
      results.set_state(block->idx, lattice_.bottom());
      worklist.push_back(block->idx);
      queued.insert(block->idx);
    }

    uint64_t iterations = 0;
    while (!worklist.empty()) {
      const BasicBlockIdx idx = worklist.front();
      worklist.pop_front();
      queued.erase(idx);

      ++iterations;
      if (options_.max_iterations && iterations > *options_.max_iterations) {
        throw NonConvergenceError(
          "no fixpoint for '" + cfg_.name() + "' within " +
          std::to_string(*options_.max_iterations) + " block visits");
      }

      const BasicBlock * block = cfg_.get_basic_block(idx);
      const auto sources =
        kind_ == AnalysisKind::Forward ? cfg_.get_predecessors(idx) : cfg_.get_successors(idx);

      S in = lattice_.bottom();
      if (boundary_ && is_boundary(idx, sources.empty())) {
        in = lattice_.join(in, *boundary_);
      }
      for (const BasicBlock * source : sources) {
        in = lattice_.join(in, *results.get_state(source->idx));
      }
      S out = apply_block(in, *block);
      results.set_in_state(idx, std::move(in));

      const S & old = *results.get_state(idx);
      if (lattice_.leq(out, old)) {
        continue;
      }
      results.set_state(idx, next_state(old, std::move(out), ++updates[idx]));

      const auto targets =
        kind_ == AnalysisKind::Forward ? cfg_.get_successors(idx) : cfg_.get_predecessors(idx);
      for (const BasicBlock * target : targets) {
        if (queued.insert(target->idx).second) {
          worklist.push_back(target->idx);
        }
      }
    }

    results.set_iterations(iterations);
    return results;
  }

  /// Like solve(), but reports an exhausted iteration budget as a failed outcome
  [[nodiscard]] SolveOutcome<S> try_solve() const
  {
    try {
      return SolveOutcome<S>::ok(solve());
    } catch (const NonConvergenceError & e) {
      return SolveOutcome<S>::fail(e.what());
    }
  }

  [[nodiscard]] AnalysisKind kind() const noexcept { return kind_; }

protected:
  /**
   * State stored for a block whose out-state grew to `computed`. `updates`
   * counts how often the block has grown, including this time.
   */
  virtual S next_state(const S & old_state, S computed, uint64_t updates) const
  {
    (void)old_state;
    (void)updates;
    return computed;
  }

private:
  bool is_boundary(BasicBlockIdx idx, bool no_sources) const
  {
    if (kind_ == AnalysisKind::Forward) {
      return cfg_.entry() == idx;
    }
    return no_sources;
  }

  S apply_block(const S & in, const BasicBlock & block) const
  {
    S state = in;
    const auto apply = [&](AstId id) {
      const Stmt * stmt = cu_.ast().get_stmt(id);
      if (stmt == nullptr) {
        throw InternalError(
          "cannot find statement " + std::to_string(id) + " of block " +
          std::to_string(block.idx) + " in '" + cfg_.name() + "'");
      }
      state = transfer_.transfer(state, block, *stmt);
    };
    if (kind_ == AnalysisKind::Forward) {
      for (const AstId id : block.stmts) apply(id);
    } else {
      for (auto it = block.stmts.rbegin(); it != block.stmts.rend(); ++it) apply(*it);
    }
    return state;
  }

  const CompilationUnit & cu_;
  const Cfg & cfg_;
  const Transfer<S> & transfer_;
  const JoinSemilattice<S> & lattice_;
  AnalysisKind kind_;
  SolverOptions options_;
  std::optional<S> boundary_;
};

// ============================================================================
// WideningWorklistSolver
// ============================================================================

/**
 * Worklist solver for lattices with infinite ascending chains.
 *
 * Once a block's out-state has grown more than `widening_threshold` times,
 * further growth is widened: the stored state becomes
 * `widen(old, join(old, computed))`.
 */
template <typename S>
class WideningWorklistSolver : public WorklistSolver<S>
{
public:
  WideningWorklistSolver(
    const CompilationUnit & cu, const Cfg & cfg, const Transfer<S> & transfer,
    const WideningLattice<S> & lattice, AnalysisKind kind, uint64_t widening_threshold,
    SolverOptions options = {})
  : WorklistSolver<S>(cu, cfg, transfer, lattice, kind, options),
    widening_(lattice),
    threshold_(widening_threshold)
  {
  }

  [[nodiscard]] uint64_t widening_threshold() const noexcept { return threshold_; }

protected:
  S next_state(const S & old_state, S computed, uint64_t updates) const override
  {
    if (updates <= threshold_) {
      return computed;
    }
    return widening_.widen(old_state, widening_.join(old_state, computed));
  }

private:
  const WideningLattice<S> & widening_;
  uint64_t threshold_;
};

}  // namespace tactflow
