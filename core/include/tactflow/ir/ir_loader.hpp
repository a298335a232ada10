// tactflow/ir/ir_loader.hpp - Load a CompilationUnit from the frontend's JSON IR
//
// Layout of the document:
//
//   {
//     "project": "name",
//     "files":     [ { "id": 0, "path": "a.tact", "content": "..." } ],
//     "contracts": [ { "id": 1, "name": "C", "fields": ["f"], "origin": "user",
//                      "loc": { "file": 0, "start": 0, "end": 10 } } ],
//     "functions": [ { "id": 2, "name": "foo", "kind": "function", "contract": "C",
//                      "params": [ { "name": "x", "type": "Int" } ],
//                      "origin": "user", "asm": false, "loc": {...},
//                      "body": [ <statement>... ] } ],
//     "cfgs":      [ { "idx": 0, "name": "foo", "function_id": 2, "kind": "function",
//                      "origin": "user", "contract": "C", "entry": 0,
//                      "blocks": [ { "idx": 0, "stmts": [3], "kind": "regular",
//                                    "callees": [] } ],
//                      "edges": [ [0, 1] ] } ]
//   }
//
// Statements and expressions carry "id", "kind" (the names of
// ast_enums.hpp) and an optional "loc", plus the fields of their node type.
//
#pragma once

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <string>

#include "tactflow/ir/compilation_unit.hpp"

namespace tactflow
{

// ============================================================================
// Load Result
// ============================================================================

/**
 * Result of loading an IR document. A failed load never carries a
 * partially built unit.
 */
struct IrLoadResult
{
  std::unique_ptr<CompilationUnit> unit;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static IrLoadResult ok(std::unique_ptr<CompilationUnit> cu)
  {
    IrLoadResult r;
    r.unit = std::move(cu);
    r.success = true;
    return r;
  }

  static IrLoadResult fail(std::string msg)
  {
    IrLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Loader
// ============================================================================

class IrLoader
{
public:
  explicit IrLoader(std::shared_ptr<spdlog::logger> logger);

  [[nodiscard]] IrLoadResult load_file(const std::filesystem::path & path) const;

  /// `origin` names the document in error messages
  [[nodiscard]] IrLoadResult load_string(
    const std::string & text, const std::string & origin = "<memory>") const;

private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tactflow
