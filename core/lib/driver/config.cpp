// tactflow/driver/config.cpp - Analyzer configuration
//
#include "tactflow/driver/config.hpp"

#include <yaml-cpp/yaml.h>

#include "tactflow/detectors/registry.hpp"

namespace tactflow
{

namespace
{

/// Read a positive integer setting; `error` is set on failure
std::optional<uint64_t> parse_positive(
  const YAML::Node & node, const std::string & key, std::string & error)
{
  long long value = 0;
  try {
    value = node.as<long long>();
  } catch (const YAML::Exception &) {
    error = key + " must be an integer";
    return std::nullopt;
  }
  if (value <= 0) {
    error = key + " must be positive, got " + std::to_string(value);
    return std::nullopt;
  }
  return static_cast<uint64_t>(value);
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  Config config;
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration must be a map");
  }

  // 'detectors'
  if (root["detectors"]) {
    if (!root["detectors"].IsSequence()) {
      return ConfigLoadResult::fail("detectors must be a list");
    }
    for (const auto & d : root["detectors"]) {
      const auto id = d.as<std::string>();
      if (!is_builtin_detector(id)) {
        return ConfigLoadResult::fail("unknown detector: '" + id + "'");
      }
      config.detectors.push_back(id);
    }
  }

  if (root["include_stdlib"]) {
    config.include_stdlib = root["include_stdlib"].as<bool>();
  }

  if (root["verbosity"]) {
    const auto text = root["verbosity"].as<std::string>();
    const auto verbosity = parse_verbosity(text);
    if (!verbosity) {
      return ConfigLoadResult::fail(
        "invalid verbosity: '" + text + "' (must be 'quiet', 'default' or 'debug')");
    }
    config.verbosity = *verbosity;
  }

  // 'solver'
  if (root["solver"]) {
    const auto & solver = root["solver"];
    if (!solver.IsMap()) {
      return ConfigLoadResult::fail("solver must be a map");
    }
    std::string error;
    if (solver["max_iterations"]) {
      config.solver.max_iterations =
        parse_positive(solver["max_iterations"], "solver.max_iterations", error);
      if (!config.solver.max_iterations) {
        return ConfigLoadResult::fail(error);
      }
    }
    if (solver["widening_threshold"]) {
      const auto threshold =
        parse_positive(solver["widening_threshold"], "solver.widening_threshold", error);
      if (!threshold) {
        return ConfigLoadResult::fail(error);
      }
      config.solver.widening_threshold = *threshold;
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ConfigLoadResult result;
  try {
    result = parse_root(YAML::LoadFile(config_path.string()));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail(config_path.string() + ": " + e.what());
  }
  if (!result.success) {
    result.error = config_path.string() + ": " + result.error;
    return result;
  }
  result.config.config_root = fs::absolute(config_path).parent_path();
  return result;
}

ConfigLoadResult parse_config(const std::string & yaml_text)
{
  try {
    return parse_root(YAML::Load(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }
    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }
  return std::nullopt;
}

}  // namespace tactflow
