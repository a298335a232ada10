// tactflow/ir/call_graph.cpp - Call graph queries and effect propagation
#include "tactflow/ir/call_graph.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>

#include "tactflow/basic/exceptions.hpp"

namespace tactflow
{

std::string_view to_string(Effect effect) noexcept
{
  switch (effect) {
    case Effect::Send:
      return "Send";
    case Effect::StateRead:
      return "StateRead";
    case Effect::StateWrite:
      return "StateWrite";
    case Effect::AccessDatetime:
      return "AccessDatetime";
    case Effect::PrgUse:
      return "PrgUse";
    case Effect::PrgSeedInit:
      return "PrgSeedInit";
  }
  return "";
}

// ============================================================================
// CGNode
// ============================================================================

CGNode::CGNode(CGNodeId idx, std::string name, std::optional<AstId> ast_id, SourceRange range)
: idx_(idx), name_(std::move(name)), astId_(ast_id), range_(range)
{
}

bool CGNode::has_any_effect(std::initializer_list<Effect> effects) const noexcept
{
  return std::any_of(effects.begin(), effects.end(), [this](Effect e) { return has_effect(e); });
}

// ============================================================================
// Construction
// ============================================================================

CGNodeId CallGraph::add_node(std::string name, std::optional<AstId> ast_id, SourceRange range)
{
  if (nameToNode_.count(name) != 0) {
    throw InternalError("call graph node '" + name + "' already exists");
  }
  if (ast_id && astIdToNode_.count(*ast_id) != 0) {
    throw InternalError(
      "call graph already has a node for AST id " + std::to_string(*ast_id));
  }

  const CGNodeId id = nodeIds_.next();
  nameToNode_.emplace(name, id);
  if (ast_id) {
    astIdToNode_.emplace(*ast_id, id);
  }
  nodes_.emplace(id, CGNode(id, std::move(name), ast_id, range));
  return id;
}

CGNodeId CallGraph::find_or_add_node(const std::string & name)
{
  if (const auto it = nameToNode_.find(name); it != nameToNode_.end()) {
    return it->second;
  }
  return add_node(name);
}

CGEdgeId CallGraph::add_edge(CGNodeId src, CGNodeId dst, SourceRange call_site)
{
  CGNode * src_node = find_node(src);
  CGNode * dst_node = find_node(dst);
  if (src_node == nullptr || dst_node == nullptr) {
    throw InternalError(
      "cannot add call edge " + std::to_string(src) + " -> " + std::to_string(dst) +
      ": unknown node");
  }

  const CGEdgeId id = edgeIds_.next();
  edges_.emplace(id, CGEdge{id, src, dst, call_site});
  src_node->outEdges_.push_back(id);
  dst_node->inEdges_.push_back(id);
  return id;
}

void CallGraph::add_effect(CGNodeId node, Effect effect, std::optional<std::string> field)
{
  CGNode * n = find_node(node);
  if (n == nullptr) {
    throw InternalError("cannot add effect to unknown call graph node " + std::to_string(node));
  }
  n->directEffects_.add(effect);
  n->effects_.add(effect);

  if (!field) {
    return;
  }
  switch (effect) {
    case Effect::StateRead:
      n->stateReads_.insert(std::move(*field));
      break;
    case Effect::StateWrite:
      n->stateWrites_.insert(std::move(*field));
      break;
    default:
      throw InternalError(
        "effect " + std::string(to_string(effect)) + " does not take a field name");
  }
}

void CallGraph::propagate_effects()
{
  for (auto & [id, node] : nodes_) {
    node.effects_ = node.directEffects_;
  }

  // A node whose summary grew may extend the summaries of its callers.
  std::deque<CGNodeId> worklist;
  std::unordered_set<CGNodeId> queued;
  for (const auto & [id, node] : nodes_) {
    worklist.push_back(id);
    queued.insert(id);
  }

  while (!worklist.empty()) {
    const CGNodeId current = worklist.front();
    worklist.pop_front();
    queued.erase(current);

    const EffectSet summary = nodes_.at(current).effects_;
    for (const CGEdgeId edge_id : nodes_.at(current).inEdges_) {
      CGNode & caller = nodes_.at(edges_.at(edge_id).src);
      if (caller.effects_.includes(summary)) {
        continue;
      }
      caller.effects_.merge(summary);
      if (queued.insert(caller.idx_).second) {
        worklist.push_back(caller.idx_);
      }
    }
  }
}

// ============================================================================
// Queries
// ============================================================================

CGNode * CallGraph::find_node(CGNodeId id) noexcept
{
  const auto it = nodes_.find(id);
  return it != nodes_.end() ? &it->second : nullptr;
}

std::optional<CGNodeId> CallGraph::get_node_id_by_name(std::string_view name) const
{
  const auto it = nameToNode_.find(std::string(name));
  if (it == nameToNode_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<CGNodeId> CallGraph::get_node_id_by_ast_id(AstId ast_id) const
{
  const auto it = astIdToNode_.find(ast_id);
  if (it == astIdToNode_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const CGNode * CallGraph::get_node(CGNodeId id) const noexcept
{
  const auto it = nodes_.find(id);
  return it != nodes_.end() ? &it->second : nullptr;
}

const CGEdge * CallGraph::get_edge(CGEdgeId id) const noexcept
{
  const auto it = edges_.find(id);
  return it != edges_.end() ? &it->second : nullptr;
}

std::vector<CGNodeId> CallGraph::callees(CGNodeId id) const
{
  std::vector<CGNodeId> out;
  const CGNode * node = get_node(id);
  if (node == nullptr) {
    return out;
  }
  for (const CGEdgeId e : node->out_edges()) {
    const CGNodeId dst = edges_.at(e).dst;
    if (std::find(out.begin(), out.end(), dst) == out.end()) {
      out.push_back(dst);
    }
  }
  return out;
}

std::vector<CGNodeId> CallGraph::callers(CGNodeId id) const
{
  std::vector<CGNodeId> out;
  const CGNode * node = get_node(id);
  if (node == nullptr) {
    return out;
  }
  for (const CGEdgeId e : node->in_edges()) {
    const CGNodeId src = edges_.at(e).src;
    if (std::find(out.begin(), out.end(), src) == out.end()) {
      out.push_back(src);
    }
  }
  return out;
}

std::set<CGNodeId> CallGraph::reachable_from(CGNodeId src) const
{
  std::set<CGNodeId> visited;
  if (get_node(src) == nullptr) {
    return visited;
  }

  std::deque<CGNodeId> queue{src};
  visited.insert(src);
  while (!queue.empty()) {
    const CGNodeId current = queue.front();
    queue.pop_front();
    for (const CGEdgeId e : nodes_.at(current).out_edges()) {
      const CGNodeId dst = edges_.at(e).dst;
      if (visited.insert(dst).second) {
        queue.push_back(dst);
      }
    }
  }
  return visited;
}

bool CallGraph::are_connected(CGNodeId src, CGNodeId dst) const
{
  if (get_node(src) == nullptr || get_node(dst) == nullptr) {
    return false;
  }

  std::deque<CGNodeId> queue{src};
  std::unordered_set<CGNodeId> visited{src};
  while (!queue.empty()) {
    const CGNodeId current = queue.front();
    queue.pop_front();
    if (current == dst) {
      return true;
    }
    for (const CGEdgeId e : nodes_.at(current).out_edges()) {
      const CGNodeId next = edges_.at(e).dst;
      if (visited.insert(next).second) {
        queue.push_back(next);
      }
    }
  }
  return false;
}

bool CallGraph::reaches_effect(CGNodeId src, Effect effect) const
{
  for (const CGNodeId id : reachable_from(src)) {
    if (nodes_.at(id).has_direct_effect(effect)) {
      return true;
    }
  }
  return false;
}

}  // namespace tactflow
