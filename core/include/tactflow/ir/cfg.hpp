// tactflow/ir/cfg.hpp - Control Flow Graph of one function
//
// CFGs are supplied by the frontend (through the IR loader) and are
// read-only once built. A block lists the ids of the statements it executes
// in order; compound statements such as `if` appear in the block that
// evaluates their condition, their bodies live in other blocks.
//
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "tactflow/ast/ast.hpp"
#include "tactflow/ast/ast_enums.hpp"
#include "tactflow/basic/indices.hpp"
#include "tactflow/basic/source_manager.hpp"

namespace tactflow
{

class AstStore;

// ============================================================================
// Basic Block
// ============================================================================

enum class BasicBlockKind : uint8_t {
  Regular,     ///< straight-line statements
  Branch,      ///< ends with a two-way branch
  LoopHeader,  ///< evaluates a loop condition
  Call,        ///< contains calls to other CFGs (see callees)
  Exit,        ///< leaves the function
};

[[nodiscard]] std::string_view to_string(BasicBlockKind kind) noexcept;
[[nodiscard]] std::optional<BasicBlockKind> parse_basic_block_kind(std::string_view text) noexcept;

/**
 * A sequence of statements executed without branching.
 */
struct BasicBlock
{
  BasicBlockIdx idx = 0;

  /// Statements in execution order
  std::vector<AstId> stmts;

  BasicBlockKind kind = BasicBlockKind::Regular;

  /// CFGs called from this block (Call blocks only)
  std::vector<CfgIdx> callees;

  std::vector<BasicBlockIdx> successors;
  std::vector<BasicBlockIdx> predecessors;

  /// Exit block, or a block control cannot leave through an edge
  [[nodiscard]] bool is_exit() const noexcept
  {
    return kind == BasicBlockKind::Exit || successors.empty();
  }
};

// ============================================================================
// Control Flow Graph
// ============================================================================

/**
 * Control Flow Graph for a single function, method, receiver or
 * initializer.
 *
 * Blocks are kept in construction order, which is also the order the
 * worklist solver seeds them in. Block indices come from the IR and need not
 * be contiguous.
 */
class Cfg
{
public:
  Cfg(
    CfgIdx idx, std::string name, AstId function_id, FunctionKind kind,
    ItemOrigin origin = ItemOrigin::User, SourceRange range = {},
    std::optional<std::string> contract_name = std::nullopt);

  // Non-copyable, movable
  Cfg(const Cfg &) = delete;
  Cfg & operator=(const Cfg &) = delete;
  Cfg(Cfg &&) = default;
  Cfg & operator=(Cfg &&) = default;

  // ===========================================================================
  // Construction
  // ===========================================================================

  /**
   * Append a block. The index defaults to one past the largest index in
   * use; an explicit index that is already taken throws InternalError.
   */
  BasicBlock & add_block(
    std::vector<AstId> stmts, BasicBlockKind kind = BasicBlockKind::Regular,
    std::optional<BasicBlockIdx> idx = std::nullopt, std::vector<CfgIdx> callees = {});

  /// Connect two blocks; throws InternalError if either does not exist. Duplicates are ignored.
  void add_edge(BasicBlockIdx src, BasicBlockIdx dst);

  /// Throws InternalError if the block does not exist
  void set_entry(BasicBlockIdx idx);

  // ===========================================================================
  // Metadata
  // ===========================================================================

  [[nodiscard]] CfgIdx idx() const noexcept { return idx_; }
  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] AstId function_id() const noexcept { return functionId_; }
  [[nodiscard]] FunctionKind function_kind() const noexcept { return kind_; }
  [[nodiscard]] ItemOrigin origin() const noexcept { return origin_; }
  [[nodiscard]] SourceRange range() const noexcept { return range_; }
  [[nodiscard]] const std::optional<std::string> & contract_name() const noexcept
  {
    return contractName_;
  }

  /// Explicit entry, or the first block added
  [[nodiscard]] std::optional<BasicBlockIdx> entry() const noexcept;

  // ===========================================================================
  // Blocks
  // ===========================================================================

  [[nodiscard]] const BasicBlock * get_basic_block(BasicBlockIdx idx) const noexcept;

  /// Throws InternalError if `idx` or one of its successors does not exist
  [[nodiscard]] std::vector<const BasicBlock *> get_successors(BasicBlockIdx idx) const;

  /// Throws InternalError if `idx` or one of its predecessors does not exist
  [[nodiscard]] std::vector<const BasicBlock *> get_predecessors(BasicBlockIdx idx) const;

  [[nodiscard]] std::vector<const BasicBlock *> get_exit_nodes() const;

  [[nodiscard]] const std::vector<std::unique_ptr<BasicBlock>> & blocks() const noexcept
  {
    return blocks_;
  }

  [[nodiscard]] size_t size() const noexcept { return blocks_.size(); }
  [[nodiscard]] bool empty() const noexcept { return blocks_.empty(); }

  // ===========================================================================
  // Iteration
  // ===========================================================================

  /**
   * Call `fn` for every statement, blocks in construction order and
   * statements in block order. Throws InternalError when a statement id is
   * missing from `ast`.
   */
  void for_each_basic_block(
    const AstStore & ast, const std::function<void(const Stmt &, const BasicBlock &)> & fn) const;

  void for_each_edge(const std::function<void(const BasicBlock &, const BasicBlock &)> & fn) const;

  /**
   * Check structural invariants: edges point at existing blocks and are
   * mirrored by predecessor lists, there is an entry block, and, unless
   * every block has successors, at least one exit. Returns one message per
   * violation.
   */
  [[nodiscard]] std::vector<std::string> validate() const;

private:
  BasicBlock * find_block(BasicBlockIdx idx) noexcept;

  CfgIdx idx_;
  std::string name_;
  AstId functionId_;
  FunctionKind kind_;
  ItemOrigin origin_;
  SourceRange range_;
  std::optional<std::string> contractName_;

  std::optional<BasicBlockIdx> entry_;
  std::vector<std::unique_ptr<BasicBlock>> blocks_;
  std::unordered_map<BasicBlockIdx, size_t> blockIndex_;
  IdxGenerator<BasicBlockIdx> blockIds_;
};

}  // namespace tactflow
