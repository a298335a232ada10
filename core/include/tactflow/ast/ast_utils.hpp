// tactflow/ast/ast_utils.hpp - Language-specific queries over the AST
//
// Knowledge about the contract language's standard library: which calls
// send messages, read the clock, use the PRG, or mutate a value in place.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tactflow/ast/ast.hpp"

namespace tactflow
{

// ============================================================================
// Standard library names
// ============================================================================

[[nodiscard]] bool is_datetime_function(std::string_view name) noexcept;
[[nodiscard]] bool is_prg_init_function(std::string_view name) noexcept;
[[nodiscard]] bool is_prg_use_function(std::string_view name) noexcept;
[[nodiscard]] bool is_send_function(std::string_view name) noexcept;
[[nodiscard]] bool is_send_method(std::string_view name) noexcept;
[[nodiscard]] bool is_throw_function(std::string_view name) noexcept;

/// Map `set`/`del`/`replace`, String `append` and Builder `store*`/`skipBits`
[[nodiscard]] bool is_mutating_method(std::string_view name) noexcept;

// ============================================================================
// Expression queries
// ============================================================================

/// `self`
[[nodiscard]] bool is_self(const Expr & expr) noexcept;

/// `send(...)`, `nativeSendMessage(...)` or `self.reply|forward|notify|emit(...)`
[[nodiscard]] bool is_send_call(const Expr & expr) noexcept;

/// A static call to `name`
[[nodiscard]] bool is_static_call(const Expr & expr, std::string_view name) noexcept;

/**
 * Identifier path of a field access chain: `a.b.c` gives {"a", "b", "c"}.
 * nullopt when the chain does not start at an identifier.
 */
[[nodiscard]] std::optional<std::vector<std::string>> try_extract_path(const Expr & expr);

/// Field name `f` if `expr` is `self.f` or `self.f.<...>`
[[nodiscard]] std::optional<std::string> find_state_read(const Expr & expr);

/**
 * Fields of the contract written by `stmt`: the target of an assignment
 * to `self.f...`, or the receiver of a mutating method call on `self.f...`
 * anywhere in the statement's own expressions.
 */
[[nodiscard]] std::vector<std::string> find_state_writes(const Stmt & stmt);

/// Identifier names read anywhere in `expr`
[[nodiscard]] std::vector<std::string> collect_identifiers(const Expr & expr);

/// Name of the assigned variable for `x = ...` / `x op= ...`, nullopt for paths
[[nodiscard]] std::optional<std::string> assigned_variable(const Stmt & stmt);

}  // namespace tactflow
