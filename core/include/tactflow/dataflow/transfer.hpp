// tactflow/dataflow/transfer.hpp - Transfer function interface
#pragma once

#include "tactflow/ast/ast.hpp"
#include "tactflow/ir/cfg.hpp"

namespace tactflow
{

/**
 * Effect of one statement on the abstract state.
 *
 * Implementations must be deterministic and monotone, and return `in`
 * unchanged for statement kinds they do not model.
 */
template <typename S>
class Transfer
{
public:
  virtual ~Transfer() = default;

  [[nodiscard]] virtual S transfer(const S & in, const BasicBlock & block, const Stmt & stmt) const = 0;
};

}  // namespace tactflow
