// tactflow/ir/cfg.cpp - CFG construction and queries
#include "tactflow/ir/cfg.hpp"

#include <algorithm>

#include "tactflow/ast/ast_store.hpp"
#include "tactflow/basic/exceptions.hpp"

namespace tactflow
{

std::string_view to_string(BasicBlockKind kind) noexcept
{
  switch (kind) {
    case BasicBlockKind::Regular:
      return "regular";
    case BasicBlockKind::Branch:
      return "branch";
    case BasicBlockKind::LoopHeader:
      return "loop_header";
    case BasicBlockKind::Call:
      return "call";
    case BasicBlockKind::Exit:
      return "exit";
  }
  return "";
}

std::optional<BasicBlockKind> parse_basic_block_kind(std::string_view text) noexcept
{
  for (const auto kind :
       {BasicBlockKind::Regular, BasicBlockKind::Branch, BasicBlockKind::LoopHeader,
        BasicBlockKind::Call, BasicBlockKind::Exit}) {
    if (to_string(kind) == text) {
      return kind;
    }
  }
  return std::nullopt;
}

Cfg::Cfg(
  CfgIdx idx, std::string name, AstId function_id, FunctionKind kind, ItemOrigin origin,
  SourceRange range, std::optional<std::string> contract_name)
: idx_(idx),
  name_(std::move(name)),
  functionId_(function_id),
  kind_(kind),
  origin_(origin),
  range_(range),
  contractName_(std::move(contract_name))
{
}

// ============================================================================
// Construction
// ============================================================================

BasicBlock & Cfg::add_block(
  std::vector<AstId> stmts, BasicBlockKind kind, std::optional<BasicBlockIdx> idx,
  std::vector<CfgIdx> callees)
{
  BasicBlockIdx block_idx = 0;
  if (idx) {
    if (blockIndex_.count(*idx) != 0) {
      throw InternalError(
        "CFG '" + name_ + "': duplicate basic block index " + std::to_string(*idx));
    }
    block_idx = *idx;
    blockIds_.observe(block_idx);
  } else {
    do {
      block_idx = blockIds_.next();
    } while (blockIndex_.count(block_idx) != 0);
  }

  auto block = std::make_unique<BasicBlock>();
  block->idx = block_idx;
  block->stmts = std::move(stmts);
  block->kind = kind;
  block->callees = std::move(callees);

  blockIndex_.emplace(block_idx, blocks_.size());
  blocks_.push_back(std::move(block));
  return *blocks_.back();
}

void Cfg::add_edge(BasicBlockIdx src, BasicBlockIdx dst)
{
  BasicBlock * src_block = find_block(src);
  BasicBlock * dst_block = find_block(dst);
  if (src_block == nullptr || dst_block == nullptr) {
    throw InternalError(
      "CFG '" + name_ + "': edge " + std::to_string(src) + " -> " + std::to_string(dst) +
      " references an unknown basic block");
  }
  auto & succ = src_block->successors;
  if (std::find(succ.begin(), succ.end(), dst) != succ.end()) {
    return;
  }
  succ.push_back(dst);
  dst_block->predecessors.push_back(src);
}

void Cfg::set_entry(BasicBlockIdx idx)
{
  if (find_block(idx) == nullptr) {
    throw InternalError(
      "CFG '" + name_ + "': entry " + std::to_string(idx) + " is not a basic block");
  }
  entry_ = idx;
}

std::optional<BasicBlockIdx> Cfg::entry() const noexcept
{
  if (entry_) {
    return entry_;
  }
  if (blocks_.empty()) {
    return std::nullopt;
  }
  return blocks_.front()->idx;
}

// ============================================================================
// Blocks
// ============================================================================

BasicBlock * Cfg::find_block(BasicBlockIdx idx) noexcept
{
  const auto it = blockIndex_.find(idx);
  return it != blockIndex_.end() ? blocks_[it->second].get() : nullptr;
}

const BasicBlock * Cfg::get_basic_block(BasicBlockIdx idx) const noexcept
{
  const auto it = blockIndex_.find(idx);
  return it != blockIndex_.end() ? blocks_[it->second].get() : nullptr;
}

std::vector<const BasicBlock *> Cfg::get_successors(BasicBlockIdx idx) const
{
  const BasicBlock * block = get_basic_block(idx);
  if (block == nullptr) {
    throw InternalError("CFG '" + name_ + "': unknown basic block " + std::to_string(idx));
  }
  std::vector<const BasicBlock *> out;
  out.reserve(block->successors.size());
  for (const BasicBlockIdx s : block->successors) {
    const BasicBlock * succ = get_basic_block(s);
    if (succ == nullptr) {
      throw InternalError(
        "CFG '" + name_ + "': block " + std::to_string(idx) + " has unknown successor " +
        std::to_string(s));
    }
    out.push_back(succ);
  }
  return out;
}

std::vector<const BasicBlock *> Cfg::get_predecessors(BasicBlockIdx idx) const
{
  const BasicBlock * block = get_basic_block(idx);
  if (block == nullptr) {
    throw InternalError("CFG '" + name_ + "': unknown basic block " + std::to_string(idx));
  }
  std::vector<const BasicBlock *> out;
  out.reserve(block->predecessors.size());
  for (const BasicBlockIdx p : block->predecessors) {
    const BasicBlock * pred = get_basic_block(p);
    if (pred == nullptr) {
      throw InternalError(
        "CFG '" + name_ + "': block " + std::to_string(idx) + " has unknown predecessor " +
        std::to_string(p));
    }
    out.push_back(pred);
  }
  return out;
}

std::vector<const BasicBlock *> Cfg::get_exit_nodes() const
{
  std::vector<const BasicBlock *> out;
  for (const auto & b : blocks_) {
    if (b->is_exit()) {
      out.push_back(b.get());
    }
  }
  return out;
}

// ============================================================================
// Iteration
// ============================================================================

void Cfg::for_each_basic_block(
  const AstStore & ast, const std::function<void(const Stmt &, const BasicBlock &)> & fn) const
{
  for (const auto & block : blocks_) {
    for (const AstId id : block->stmts) {
      const Stmt * stmt = ast.get_stmt(id);
      if (stmt == nullptr) {
        throw InternalError(
          "CFG '" + name_ + "': block " + std::to_string(block->idx) +
          " references unknown statement " + std::to_string(id));
      }
      fn(*stmt, *block);
    }
  }
}

void Cfg::for_each_edge(
  const std::function<void(const BasicBlock &, const BasicBlock &)> & fn) const
{
  for (const auto & block : blocks_) {
    for (const auto * succ : get_successors(block->idx)) {
      fn(*block, *succ);
    }
  }
}

std::vector<std::string> Cfg::validate() const
{
  std::vector<std::string> problems;
  const std::string prefix = "CFG '" + name_ + "': ";

  if (blocks_.empty()) {
    problems.push_back(prefix + "has no basic blocks");
    return problems;
  }

  for (const auto & block : blocks_) {
    const std::string where = "block " + std::to_string(block->idx);
    for (const BasicBlockIdx s : block->successors) {
      const BasicBlock * succ = get_basic_block(s);
      if (succ == nullptr) {
        problems.push_back(prefix + where + " has unknown successor " + std::to_string(s));
        continue;
      }
      const auto & preds = succ->predecessors;
      if (std::find(preds.begin(), preds.end(), block->idx) == preds.end()) {
        problems.push_back(
          prefix + where + " -> " + std::to_string(s) + " is missing from the predecessors");
      }
    }
    for (const BasicBlockIdx p : block->predecessors) {
      if (get_basic_block(p) == nullptr) {
        problems.push_back(prefix + where + " has unknown predecessor " + std::to_string(p));
      }
    }
    if (block->kind == BasicBlockKind::Call && block->callees.empty()) {
      problems.push_back(prefix + where + " is a call block without callees");
    }
  }

  if (entry_ && get_basic_block(*entry_) == nullptr) {
    problems.push_back(prefix + "entry block does not exist");
  }

  // A function without exits is legal only if it diverges in a loop.
  const bool any_exit = std::any_of(
    blocks_.begin(), blocks_.end(), [](const auto & b) { return b->is_exit(); });
  if (!any_exit) {
    const bool has_cycle = std::any_of(blocks_.begin(), blocks_.end(), [](const auto & b) {
      return !b->predecessors.empty();
    });
    if (!has_cycle) {
      problems.push_back(prefix + "has no exit block");
    }
  }

  return problems;
}

}  // namespace tactflow
