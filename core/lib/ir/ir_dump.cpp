// tactflow/ir/ir_dump.cpp - DOT and JSON output for the IR
#include "tactflow/ir/ir_dump.hpp"

#include <fmt/core.h>

#include <iterator>
#include <string_view>

#include "tactflow/ast/ast_enums.hpp"

namespace tactflow
{
namespace
{

using nlohmann::json;

std::string dot_escape(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c == '"' || c == '\\') {
      out += '\\';
    }
    out += c;
  }
  return out;
}

std::string effect_list(EffectSet effects)
{
  std::string out;
  for (const Effect e : k_all_effects) {
    if (!effects.has(e)) {
      continue;
    }
    if (!out.empty()) {
      out += ", ";
    }
    out += to_string(e);
  }
  return out;
}

json effects_to_json(EffectSet effects)
{
  json arr = json::array();
  for (const Effect e : k_all_effects) {
    if (effects.has(e)) {
      arr.push_back(std::string(to_string(e)));
    }
  }
  return arr;
}

}  // namespace

// ============================================================================
// CFG
// ============================================================================

std::string dump_cfg_dot(const CompilationUnit & cu, const Cfg & cfg)
{
  const std::string name = cfg.contract_name() ? *cfg.contract_name() + "::" + cfg.name()
                                               : cfg.name();
  std::string out = fmt::format("digraph \"{}\" {{\n  node [shape=box];\n", dot_escape(name));

  const auto entry = cfg.entry();
  for (const auto & block : cfg.blocks()) {
    std::string label = fmt::format("{}: {}", block->idx, to_string(block->kind));
    for (const AstId id : block->stmts) {
      const Stmt * stmt = cu.ast().get_stmt(id);
      label += "\\n";
      label += stmt != nullptr ? std::string(to_string(stmt->kind())) : "<missing>";
    }
    const bool is_entry = entry && *entry == block->idx;
    fmt::format_to(
      std::back_inserter(out), "  bb{} [label=\"{}\"{}];\n", block->idx, label,
      is_entry ? ", style=bold" : "");
  }
  for (const auto & block : cfg.blocks()) {
    for (const BasicBlockIdx succ : block->successors) {
      fmt::format_to(std::back_inserter(out), "  bb{} -> bb{};\n", block->idx, succ);
    }
  }
  out += "}\n";
  return out;
}

json cfg_to_json(const Cfg & cfg)
{
  json j{
    {"idx", cfg.idx()},
    {"name", cfg.name()},
    {"function_id", cfg.function_id()},
    {"kind", std::string(to_string(cfg.function_kind()))},
    {"origin", std::string(to_string(cfg.origin()))},
  };
  if (cfg.contract_name()) {
    j["contract"] = *cfg.contract_name();
  }
  if (const auto entry = cfg.entry()) {
    j["entry"] = *entry;
  }

  json blocks = json::array();
  json edges = json::array();
  for (const auto & block : cfg.blocks()) {
    json b{
      {"idx", block->idx},
      {"kind", std::string(to_string(block->kind))},
      {"stmts", block->stmts},
      {"successors", block->successors},
      {"predecessors", block->predecessors},
    };
    if (!block->callees.empty()) {
      b["callees"] = block->callees;
    }
    blocks.push_back(std::move(b));
    for (const BasicBlockIdx succ : block->successors) {
      edges.push_back(json::array({block->idx, succ}));
    }
  }
  j["blocks"] = std::move(blocks);
  j["edges"] = std::move(edges);
  return j;
}

std::string dump_cfg_json(const Cfg & cfg) { return cfg_to_json(cfg).dump(2); }

// ============================================================================
// Call graph
// ============================================================================

std::string dump_call_graph_dot(const CallGraph & graph)
{
  std::string out = "digraph \"callgraph\" {\n  node [shape=ellipse];\n";
  for (const auto & [id, node] : graph.get_nodes()) {
    std::string label = dot_escape(node.name());
    if (!node.effects().empty()) {
      label += "\\n[" + effect_list(node.effects()) + "]";
    }
    fmt::format_to(
      std::back_inserter(out), "  n{} [label=\"{}\"{}];\n", id, label,
      node.ast_id() ? "" : ", style=dashed");
  }
  for (const auto & [id, edge] : graph.get_edges()) {
    fmt::format_to(std::back_inserter(out), "  n{} -> n{};\n", edge.src, edge.dst);
  }
  out += "}\n";
  return out;
}

json call_graph_to_json(const CallGraph & graph)
{
  json nodes = json::array();
  for (const auto & [id, node] : graph.get_nodes()) {
    json n{
      {"id", id},
      {"name", node.name()},
      {"effects", effects_to_json(node.effects())},
      {"direct_effects", effects_to_json(node.direct_effects())},
      {"state_reads", node.state_reads()},
      {"state_writes", node.state_writes()},
    };
    n["ast_id"] = node.ast_id() ? json(*node.ast_id()) : json(nullptr);
    nodes.push_back(std::move(n));
  }

  json edges = json::array();
  for (const auto & [id, edge] : graph.get_edges()) {
    edges.push_back(json{{"id", id}, {"src", edge.src}, {"dst", edge.dst}});
  }
  return json{{"nodes", std::move(nodes)}, {"edges", std::move(edges)}};
}

std::string dump_call_graph_json(const CallGraph & graph)
{
  return call_graph_to_json(graph).dump(2);
}

}  // namespace tactflow
