// tactflow/ir/ir_dump.hpp - Graphviz and JSON renderings of CFGs and the call graph
#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "tactflow/ir/call_graph.hpp"
#include "tactflow/ir/cfg.hpp"
#include "tactflow/ir/compilation_unit.hpp"

namespace tactflow
{

/// `digraph` with one box per block labeled by its index and statement kinds
[[nodiscard]] std::string dump_cfg_dot(const CompilationUnit & cu, const Cfg & cfg);

[[nodiscard]] nlohmann::json cfg_to_json(const Cfg & cfg);
[[nodiscard]] std::string dump_cfg_json(const Cfg & cfg);

/// `digraph` with one node per function; nodes list their summary effects
[[nodiscard]] std::string dump_call_graph_dot(const CallGraph & graph);

[[nodiscard]] nlohmann::json call_graph_to_json(const CallGraph & graph);
[[nodiscard]] std::string dump_call_graph_json(const CallGraph & graph);

}  // namespace tactflow
