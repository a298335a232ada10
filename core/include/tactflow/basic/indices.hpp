// tactflow/basic/indices.hpp - Index types and explicit index generators
#pragma once

#include <cstdint>
#include <limits>

#include "tactflow/basic/exceptions.hpp"

namespace tactflow
{

/// Identifier of an AST node, unique within one AstStore
using AstId = uint32_t;

/// Index of a CFG within a CompilationUnit
using CfgIdx = uint32_t;

/// Index of a basic block within one CFG
using BasicBlockIdx = uint32_t;

using CGNodeId = uint32_t;
using CGEdgeId = uint32_t;

/**
 * Hands out fresh indices.
 *
 * Every store or graph owns its generator, so two compilation units never
 * share a counter and tests can reset numbering.
 */
template <typename T>
class IdxGenerator
{
public:
  constexpr explicit IdxGenerator(T start = 0) noexcept : next_(start) {}

  /// Returns an index that has not been handed out or observed
  T next()
  {
    if (next_ == std::numeric_limits<T>::max()) {
      throw InternalError("index space exhausted");
    }
    return next_++;
  }

  /// Records an index assigned externally (e.g. read from the IR)
  void observe(T used) noexcept
  {
    if (used >= next_ && used != std::numeric_limits<T>::max()) {
      next_ = used + 1;
    }
  }

  void reset(T start = 0) noexcept { next_ = start; }

  [[nodiscard]] T peek() const noexcept { return next_; }

private:
  T next_;
};

}  // namespace tactflow
