// tactflow/basic/exceptions.hpp - Exceptions thrown by the analysis core
//
// Findings are never exceptions; they go to a DiagnosticBag. Exceptions are
// reserved for inconsistent input and for arithmetic the domain cannot
// represent.
//
#pragma once

#include <stdexcept>
#include <string>

namespace tactflow
{

/**
 * Base class of every exception raised by the analysis core.
 *
 * The driver catches this type per detector so that one failing analysis
 * does not stop the others.
 */
class AnalysisError : public std::runtime_error
{
public:
  explicit AnalysisError(const std::string & message) : std::runtime_error(message) {}
};

/**
 * The IR violates a structural invariant (dangling block index, missing
 * statement, unknown CFG). Indicates a bug in the frontend or loader.
 */
class InternalError : public AnalysisError
{
public:
  explicit InternalError(const std::string & message)
  : AnalysisError("internal error: " + message)
  {
  }
};

/**
 * An operation has no defined result, e.g. (+inf) + (-inf) or a division
 * by zero.
 */
class ExecutionError : public AnalysisError
{
public:
  explicit ExecutionError(const std::string & message) : AnalysisError(message) {}
};

/**
 * Division by an interval that contains zero.
 */
class IntervalDomainError : public ExecutionError
{
public:
  explicit IntervalDomainError(const std::string & message) : ExecutionError(message) {}
};

/**
 * A worklist solver exhausted its iteration budget before reaching a
 * fixpoint.
 */
class NonConvergenceError : public AnalysisError
{
public:
  explicit NonConvergenceError(const std::string & message) : AnalysisError(message) {}
};

}  // namespace tactflow
