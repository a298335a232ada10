// tactflow/ir/compilation_unit.hpp - Everything the detectors analyze
//
// A CompilationUnit owns the AST, the CFGs and the call graph of one
// project. It is built once (by the IR loader or by tests) and then shared
// read-only by every detector.
//
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tactflow/ast/ast_store.hpp"
#include "tactflow/basic/indices.hpp"
#include "tactflow/basic/source_manager.hpp"
#include "tactflow/ir/call_graph.hpp"
#include "tactflow/ir/cfg.hpp"

namespace tactflow
{

struct CfgIterationOptions
{
  /// Also visit CFGs whose origin is the standard library
  bool include_stdlib = false;
};

class CompilationUnit
{
public:
  explicit CompilationUnit(std::string project_name = "");

  CompilationUnit(const CompilationUnit &) = delete;
  CompilationUnit & operator=(const CompilationUnit &) = delete;
  CompilationUnit(CompilationUnit &&) = default;
  CompilationUnit & operator=(CompilationUnit &&) = default;

  // ===========================================================================
  // Construction
  // ===========================================================================

  /**
   * Create an empty CFG with a fresh index. Throws InternalError if a CFG
   * with the same name exists.
   */
  Cfg & create_cfg(
    std::string name, AstId function_id, FunctionKind kind, ItemOrigin origin = ItemOrigin::User,
    SourceRange range = {}, std::optional<std::string> contract_name = std::nullopt);

  /// Take ownership of a CFG built elsewhere; duplicate index or name throws InternalError
  Cfg & add_cfg(Cfg cfg);

  void set_call_graph(CallGraph graph) { callGraph_ = std::move(graph); }

  // ===========================================================================
  // Access
  // ===========================================================================

  [[nodiscard]] const std::string & project_name() const noexcept { return projectName_; }

  [[nodiscard]] AstStore & ast() noexcept { return ast_; }
  [[nodiscard]] const AstStore & ast() const noexcept { return ast_; }

  [[nodiscard]] SourceRegistry & sources() noexcept { return sources_; }
  [[nodiscard]] const SourceRegistry & sources() const noexcept { return sources_; }

  [[nodiscard]] CallGraph & call_graph() noexcept { return callGraph_; }
  [[nodiscard]] const CallGraph & call_graph() const noexcept { return callGraph_; }

  /// CFGs in the order they were added
  [[nodiscard]] const std::vector<std::unique_ptr<Cfg>> & cfgs() const noexcept
  {
    return cfgs_;
  }

  // ===========================================================================
  // Lookup
  // ===========================================================================

  [[nodiscard]] const Cfg * find_cfg_by_idx(CfgIdx idx) const noexcept;

  /// CFG of a free function (no enclosing contract) named `name`
  [[nodiscard]] const Cfg * find_function_cfg_by_name(std::string_view name) const noexcept;

  /// CFG named `method` declared in contract or trait `contract`
  [[nodiscard]] const Cfg * find_method_cfg_by_name(
    std::string_view contract, std::string_view method) const noexcept;

  // ===========================================================================
  // Iteration
  // ===========================================================================

  void for_each_cfg(
    const std::function<void(const Cfg &)> & fn, CfgIterationOptions options = {}) const;

  /// Left fold over the CFGs visited by for_each_cfg()
  template <typename Acc, typename Fn>
  Acc fold_cfgs(Acc init, Fn && fn, CfgIterationOptions options = {}) const
  {
    Acc acc = std::move(init);
    for_each_cfg([&](const Cfg & cfg) { acc = fn(std::move(acc), cfg); }, options);
    return acc;
  }

private:
  std::string projectName_;
  SourceRegistry sources_;
  AstStore ast_;
  CallGraph callGraph_;
  std::vector<std::unique_ptr<Cfg>> cfgs_;
  std::unordered_map<CfgIdx, const Cfg *> cfgsByIdx_;
  IdxGenerator<CfgIdx> cfgIds_;
};

}  // namespace tactflow
