// tactflow/test_support/lattice_checks.hpp - order checks for transfers in tests
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "tactflow/dataflow/lattice.hpp"
#include "tactflow/dataflow/transfer.hpp"

namespace tactflow::test_support
{

/**
 * Check that `transfer` preserves the order of `lattice` on `states`: for
 * every pair with `leq(a, b)` and every statement, the transferred states
 * must be ordered too. Returns a description of the first violation.
 */
template <typename S>
std::optional<std::string> find_monotonicity_violation(
  const JoinSemilattice<S> & lattice, const Transfer<S> & transfer, const std::vector<S> & states,
  const std::vector<const Stmt *> & stmts)
{
  const BasicBlock block{0, {}};
  for (size_t i = 0; i < states.size(); ++i) {
    for (size_t j = 0; j < states.size(); ++j) {
      if (!lattice.leq(states[i], states[j])) {
        continue;
      }
      for (const Stmt * stmt : stmts) {
        const S lhs = transfer.transfer(states[i], block, *stmt);
        const S rhs = transfer.transfer(states[j], block, *stmt);
        if (!lattice.leq(lhs, rhs)) {
          return "statement " + std::to_string(stmt->id) + " breaks the order of states " +
                 std::to_string(i) + " <= " + std::to_string(j);
        }
      }
    }
  }
  return std::nullopt;
}

}  // namespace tactflow::test_support
