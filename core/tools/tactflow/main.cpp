// tactflow - Dataflow analyzer Command Line Interface
//
// Usage:
//   tactflow check <ir.json> [--config FILE] [-d ID]... [--all-detectors]
//   tactflow dump-cfg <ir.json> [--format dot|json] [--function NAME]
//   tactflow dump-callgraph <ir.json> [--format dot|json]
//   tactflow list-detectors
//
#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "tactflow/basic/diagnostic_printer.hpp"
#include "tactflow/basic/logging.hpp"
#include "tactflow/detectors/registry.hpp"
#include "tactflow/driver/analyzer.hpp"
#include "tactflow/driver/config.hpp"
#include "tactflow/ir/ir_dump.hpp"
#include "tactflow/ir/ir_loader.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_clean = 0;
constexpr int k_exit_findings = 1;
constexpr int k_exit_error = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "tactflow v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check <ir.json>          Run detectors over a compilation unit\n"
            << "  dump-cfg <ir.json>       Print control flow graphs\n"
            << "  dump-callgraph <ir.json> Print the call graph\n"
            << "  list-detectors           List the built-in detectors\n\n"
            << "Options:\n"
            << "  --config <file>          Configuration file (default: search for "
            << tactflow::k_config_file_name << ")\n"
            << "  -d, --detector <id>      Run only this detector (repeatable)\n"
            << "  --all-detectors          Run every built-in detector\n"
            << "  --include-stdlib         Also analyze standard library functions\n"
            << "  --format <dot|json>      Dump format (default: dot)\n"
            << "  --function <name>        Dump only this function's CFG\n"
            << "  --no-color               Disable colored output\n"
            << "  -v, --verbose            Debug output\n"
            << "  -q, --quiet              Errors only\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string config_file;
  std::vector<std::string> detectors;
  std::string format = "dot";
  std::string function;
  bool all_detectors = false;
  bool include_stdlib = false;
  bool no_color = false;
  bool verbose = false;
  bool quiet = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  const auto value_of = [&](int & i, const std::string & flag) -> std::string {
    if (i + 1 < argc) {
      return argv[++i];
    }
    args.error = "missing value for " + flag;
    return {};
  };

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config") {
      args.config_file = value_of(i, arg);
    } else if (arg == "-d" || arg == "--detector") {
      std::string id = value_of(i, arg);
      if (!id.empty()) {
        args.detectors.push_back(std::move(id));
      }
    } else if (arg == "--all-detectors") {
      args.all_detectors = true;
    } else if (arg == "--include-stdlib") {
      args.include_stdlib = true;
    } else if (arg == "--format") {
      args.format = value_of(i, arg);
    } else if (arg == "--function") {
      args.function = value_of(i, arg);
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-q" || arg == "--quiet") {
      args.quiet = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  if (args.error.empty() && args.format != "dot" && args.format != "json") {
    args.error = "invalid --format '" + args.format + "' (must be 'dot' or 'json')";
  }

  return args;
}

bool use_color(const CommandArgs & args)
{
  return !args.no_color && isatty(fileno(stderr)) != 0;
}

/// Configuration from --config, a tactflow.yaml next to the input, or the defaults
std::optional<tactflow::Config> resolve_config(const CommandArgs & args)
{
  std::optional<fs::path> path;
  if (!args.config_file.empty()) {
    path = args.config_file;
  } else {
    const fs::path start = args.input_file.empty()
                             ? fs::current_path()
                             : fs::absolute(args.input_file).parent_path();
    path = tactflow::find_config(start);
  }
  if (!path) {
    return tactflow::Config{};
  }

  auto result = tactflow::load_config(*path);
  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return std::nullopt;
  }
  return std::move(result.config);
}

tactflow::Verbosity effective_verbosity(const CommandArgs & args, tactflow::Verbosity configured)
{
  if (args.verbose) return tactflow::Verbosity::Debug;
  if (args.quiet) return tactflow::Verbosity::Quiet;
  return configured;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: check requires an IR file\n";
    return k_exit_error;
  }

  auto config = resolve_config(args);
  if (!config) {
    return k_exit_error;
  }
  const auto logger =
    tactflow::make_logger("tactflow", effective_verbosity(args, config->verbosity));

  tactflow::AnalyzeOptions options;
  options.detectors = args.detectors;
  options.all_detectors = args.all_detectors;
  if (args.include_stdlib) {
    options.include_stdlib = true;
  }

  const tactflow::Analyzer analyzer(std::move(*config), logger);
  const auto result = analyzer.analyze_file(args.input_file, options);

  tactflow::DiagnosticPrinter printer(std::cerr, use_color(args));
  if (result.unit) {
    printer.print_all(result.diagnostics, result.unit->sources());
  } else {
    printer.print_all(result.diagnostics, tactflow::SourceRegistry{});
  }

  if (!result.success) {
    return k_exit_error;
  }
  const size_t findings = result.finding_count();
  logger->info(
    "{} detectors ran, {} finding{}", result.detectors_run.size(), findings,
    findings == 1 ? "" : "s");
  return findings > 0 ? k_exit_findings : k_exit_clean;
}

/// Load the IR named on the command line, printing the error on failure
std::unique_ptr<tactflow::CompilationUnit> load_unit(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: " << args.command << " requires an IR file\n";
    return nullptr;
  }
  const auto logger = tactflow::make_logger(
    "tactflow", effective_verbosity(args, tactflow::Verbosity::Default));
  const tactflow::IrLoader loader(logger);
  auto loaded = loader.load_file(args.input_file);
  if (!loaded.success) {
    std::cerr << "error: " << loaded.error << "\n";
    return nullptr;
  }
  return std::move(loaded.unit);
}

bool matches_function(const tactflow::Cfg & cfg, const std::string & name)
{
  if (cfg.name() == name) {
    return true;
  }
  return cfg.contract_name() && *cfg.contract_name() + "::" + cfg.name() == name;
}

int cmd_dump_cfg(const CommandArgs & args)
{
  const auto cu = load_unit(args);
  if (!cu) {
    return k_exit_error;
  }

  tactflow::CfgIterationOptions iteration;
  iteration.include_stdlib = args.include_stdlib;

  std::vector<const tactflow::Cfg *> selected;
  cu->for_each_cfg(
    [&](const tactflow::Cfg & cfg) {
      if (args.function.empty() || matches_function(cfg, args.function)) {
        selected.push_back(&cfg);
      }
    },
    iteration);

  if (selected.empty()) {
    if (!args.function.empty()) {
      std::cerr << "error: no function named '" << args.function << "'\n";
      return k_exit_error;
    }
    return k_exit_clean;
  }

  if (args.format == "json") {
    nlohmann::json out = nlohmann::json::array();
    for (const auto * cfg : selected) {
      out.push_back(tactflow::cfg_to_json(*cfg));
    }
    std::cout << out.dump(2) << "\n";
  } else {
    for (const auto * cfg : selected) {
      std::cout << tactflow::dump_cfg_dot(*cu, *cfg);
    }
  }
  return k_exit_clean;
}

int cmd_dump_callgraph(const CommandArgs & args)
{
  const auto cu = load_unit(args);
  if (!cu) {
    return k_exit_error;
  }
  if (args.format == "json") {
    std::cout << tactflow::dump_call_graph_json(cu->call_graph()) << "\n";
  } else {
    std::cout << tactflow::dump_call_graph_dot(cu->call_graph());
  }
  return k_exit_clean;
}

int cmd_list_detectors()
{
  for (const auto id : tactflow::builtin_detector_ids()) {
    const auto detector = tactflow::make_detector(id);
    std::cout << id << " [" << tactflow::to_string(detector->severity()) << "]: "
              << detector->description() << "\n";
  }
  return k_exit_clean;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_clean;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return k_exit_error;
  }

  try {
    if (args.command == "check") {
      return cmd_check(args);
    }
    if (args.command == "dump-cfg") {
      return cmd_dump_cfg(args);
    }
    if (args.command == "dump-callgraph") {
      return cmd_dump_callgraph(args);
    }
    if (args.command == "list-detectors") {
      return cmd_list_detectors();
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return k_exit_error;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return k_exit_error;
}
