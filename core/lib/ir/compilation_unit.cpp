// tactflow/ir/compilation_unit.cpp - CFG ownership and lookup
#include "tactflow/ir/compilation_unit.hpp"

#include "tactflow/basic/exceptions.hpp"

namespace tactflow
{

namespace
{

std::string display_name(const std::optional<std::string> & contract, const std::string & name)
{
  return contract ? *contract + "::" + name : name;
}

}  // namespace

CompilationUnit::CompilationUnit(std::string project_name) : projectName_(std::move(project_name))
{
}

Cfg & CompilationUnit::create_cfg(
  std::string name, AstId function_id, FunctionKind kind, ItemOrigin origin, SourceRange range,
  std::optional<std::string> contract_name)
{
  const CfgIdx idx = cfgIds_.next();
  return add_cfg(
    Cfg(idx, std::move(name), function_id, kind, origin, range, std::move(contract_name)));
}

Cfg & CompilationUnit::add_cfg(Cfg cfg)
{
  if (cfgsByIdx_.count(cfg.idx()) != 0) {
    throw InternalError("duplicate CFG index " + std::to_string(cfg.idx()));
  }
  // Names are unique per enclosing contract.
  for (const auto & existing : cfgs_) {
    if (existing->name() == cfg.name() && existing->contract_name() == cfg.contract_name()) {
      throw InternalError(
        "duplicate CFG '" + display_name(cfg.contract_name(), cfg.name()) + "'");
    }
  }

  cfgIds_.observe(cfg.idx());
  cfgs_.push_back(std::make_unique<Cfg>(std::move(cfg)));
  Cfg & added = *cfgs_.back();
  cfgsByIdx_.emplace(added.idx(), &added);
  return added;
}

const Cfg * CompilationUnit::find_cfg_by_idx(CfgIdx idx) const noexcept
{
  const auto it = cfgsByIdx_.find(idx);
  return it != cfgsByIdx_.end() ? it->second : nullptr;
}

const Cfg * CompilationUnit::find_function_cfg_by_name(std::string_view name) const noexcept
{
  for (const auto & cfg : cfgs_) {
    if (!cfg->contract_name() && cfg->name() == name) {
      return cfg.get();
    }
  }
  return nullptr;
}

const Cfg * CompilationUnit::find_method_cfg_by_name(
  std::string_view contract, std::string_view method) const noexcept
{
  for (const auto & cfg : cfgs_) {
    if (cfg->contract_name() && *cfg->contract_name() == contract && cfg->name() == method) {
      return cfg.get();
    }
  }
  return nullptr;
}

void CompilationUnit::for_each_cfg(
  const std::function<void(const Cfg &)> & fn, CfgIterationOptions options) const
{
  for (const auto & cfg : cfgs_) {
    if (cfg->origin() == ItemOrigin::Stdlib && !options.include_stdlib) {
      continue;
    }
    fn(*cfg);
  }
}

}  // namespace tactflow
