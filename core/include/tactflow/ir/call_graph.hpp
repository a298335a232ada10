// tactflow/ir/call_graph.hpp - Call graph with effect summaries
//
// Nodes are functions, methods, receivers and initializers (plus nodes for
// callees that have no definition, such as stdlib builtins). Edges are call
// sites. Cycles are allowed.
//
#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tactflow/basic/indices.hpp"
#include "tactflow/basic/source_manager.hpp"

namespace tactflow
{

// ============================================================================
// Effects
// ============================================================================

/**
 * Observable behavior of a function, as bit flags.
 */
enum class Effect : uint8_t {
  Send = 1U << 0,            ///< sends a message
  StateRead = 1U << 1,       ///< reads a contract field
  StateWrite = 1U << 2,      ///< writes a contract field
  AccessDatetime = 1U << 3,  ///< reads the block time
  PrgUse = 1U << 4,          ///< draws from the pseudo-random generator
  PrgSeedInit = 1U << 5,     ///< seeds the pseudo-random generator
};

inline constexpr std::array<Effect, 6> k_all_effects = {
  Effect::Send,           Effect::StateRead, Effect::StateWrite,
  Effect::AccessDatetime, Effect::PrgUse,    Effect::PrgSeedInit,
};

[[nodiscard]] std::string_view to_string(Effect effect) noexcept;

/**
 * Set of effects.
 */
class EffectSet
{
public:
  constexpr EffectSet() noexcept = default;
  constexpr EffectSet(std::initializer_list<Effect> effects) noexcept
  {
    for (const Effect e : effects) add(e);
  }

  constexpr void add(Effect e) noexcept { bits_ |= static_cast<uint8_t>(e); }
  constexpr void merge(EffectSet other) noexcept { bits_ |= other.bits_; }

  [[nodiscard]] constexpr bool has(Effect e) const noexcept
  {
    return (bits_ & static_cast<uint8_t>(e)) != 0;
  }
  [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }
  [[nodiscard]] constexpr uint8_t bits() const noexcept { return bits_; }

  /// True when every effect of `other` is in this set
  [[nodiscard]] constexpr bool includes(EffectSet other) const noexcept
  {
    return (bits_ & other.bits_) == other.bits_;
  }

  [[nodiscard]] constexpr bool operator==(EffectSet other) const noexcept
  {
    return bits_ == other.bits_;
  }
  [[nodiscard]] constexpr bool operator!=(EffectSet other) const noexcept
  {
    return bits_ != other.bits_;
  }

private:
  uint8_t bits_ = 0;
};

// ============================================================================
// Nodes and edges
// ============================================================================

struct CGEdge
{
  CGEdgeId idx = 0;
  CGNodeId src = 0;
  CGNodeId dst = 0;
  SourceRange call_site;
};

class CGNode
{
public:
  CGNode(CGNodeId idx, std::string name, std::optional<AstId> ast_id, SourceRange range);

  [[nodiscard]] CGNodeId idx() const noexcept { return idx_; }
  [[nodiscard]] const std::string & name() const noexcept { return name_; }

  /// Definition of the function; nullopt for callees without a definition
  [[nodiscard]] std::optional<AstId> ast_id() const noexcept { return astId_; }
  [[nodiscard]] SourceRange range() const noexcept { return range_; }

  /**
   * Whether this function or anything it transitively calls has `effect`.
   * Summaries are complete once CallGraph::propagate_effects() ran; before
   * that they equal the direct effects.
   */
  [[nodiscard]] bool has_effect(Effect effect) const noexcept { return effects_.has(effect); }
  [[nodiscard]] bool has_any_effect(std::initializer_list<Effect> effects) const noexcept;

  /// Whether the function's own body has `effect`
  [[nodiscard]] bool has_direct_effect(Effect effect) const noexcept
  {
    return directEffects_.has(effect);
  }

  [[nodiscard]] EffectSet effects() const noexcept { return effects_; }
  [[nodiscard]] EffectSet direct_effects() const noexcept { return directEffects_; }

  /// Contract fields read / written by the function's own body
  [[nodiscard]] const std::set<std::string> & state_reads() const noexcept { return stateReads_; }
  [[nodiscard]] const std::set<std::string> & state_writes() const noexcept
  {
    return stateWrites_;
  }

  [[nodiscard]] const std::vector<CGEdgeId> & in_edges() const noexcept { return inEdges_; }
  [[nodiscard]] const std::vector<CGEdgeId> & out_edges() const noexcept { return outEdges_; }

private:
  friend class CallGraph;

  CGNodeId idx_;
  std::string name_;
  std::optional<AstId> astId_;
  SourceRange range_;
  EffectSet directEffects_;
  EffectSet effects_;
  std::set<std::string> stateReads_;
  std::set<std::string> stateWrites_;
  std::vector<CGEdgeId> inEdges_;
  std::vector<CGEdgeId> outEdges_;
};

// ============================================================================
// CallGraph
// ============================================================================

class CallGraph
{
public:
  CallGraph() = default;

  // ===========================================================================
  // Construction
  // ===========================================================================

  /// Throws InternalError when the name or AST id is already registered
  CGNodeId add_node(
    std::string name, std::optional<AstId> ast_id = std::nullopt, SourceRange range = {});

  /// Node named `name`, created without a definition if missing
  CGNodeId find_or_add_node(const std::string & name);

  /// Throws InternalError for unknown endpoints
  CGEdgeId add_edge(CGNodeId src, CGNodeId dst, SourceRange call_site = {});

  /// Record a direct effect; StateRead/StateWrite may name the field accessed
  void add_effect(CGNodeId node, Effect effect, std::optional<std::string> field = std::nullopt);

  /**
   * Extend every node's summary with the effects of all nodes reachable
   * from it. Runs a worklist over reversed edges, so cycles terminate.
   */
  void propagate_effects();

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] std::optional<CGNodeId> get_node_id_by_name(std::string_view name) const;
  [[nodiscard]] std::optional<CGNodeId> get_node_id_by_ast_id(AstId ast_id) const;
  [[nodiscard]] const CGNode * get_node(CGNodeId id) const noexcept;
  [[nodiscard]] const CGEdge * get_edge(CGEdgeId id) const noexcept;

  [[nodiscard]] const std::map<CGNodeId, CGNode> & get_nodes() const noexcept { return nodes_; }
  [[nodiscard]] const std::map<CGEdgeId, CGEdge> & get_edges() const noexcept { return edges_; }

  /// Direct callees, each listed once, in call order
  [[nodiscard]] std::vector<CGNodeId> callees(CGNodeId id) const;
  [[nodiscard]] std::vector<CGNodeId> callers(CGNodeId id) const;

  /**
   * Whether a path of call edges leads from `src` to `dst`. A node is
   * connected to itself. Unknown ids are never connected.
   */
  [[nodiscard]] bool are_connected(CGNodeId src, CGNodeId dst) const;

  /// Nodes reachable from `src`, including `src`
  [[nodiscard]] std::set<CGNodeId> reachable_from(CGNodeId src) const;

  /**
   * Whether `src` or a node reachable from it directly has `effect`.
   * Independent of propagate_effects().
   */
  [[nodiscard]] bool reaches_effect(CGNodeId src, Effect effect) const;

  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

private:
  CGNode * find_node(CGNodeId id) noexcept;

  IdxGenerator<CGNodeId> nodeIds_;
  IdxGenerator<CGEdgeId> edgeIds_;

  std::map<CGNodeId, CGNode> nodes_;
  std::map<CGEdgeId, CGEdge> edges_;
  std::unordered_map<std::string, CGNodeId> nameToNode_;
  std::unordered_map<AstId, CGNodeId> astIdToNode_;
};

}  // namespace tactflow
