// tactflow/ast/ast_utils.cpp - Language-specific queries over the AST
#include "tactflow/ast/ast_utils.hpp"

#include <algorithm>
#include <array>

#include "tactflow/ast/iterators.hpp"

namespace tactflow
{

namespace
{

template <size_t N>
bool contains(const std::array<std::string_view, N> & names, std::string_view name) noexcept
{
  return std::find(names.begin(), names.end(), name) != names.end();
}

constexpr std::array<std::string_view, 2> k_datetime_functions = {"now", "timestamp"};

constexpr std::array<std::string_view, 3> k_prg_init_functions = {
  "nativePrepareRandom", "nativeRandomize", "nativeRandomizeLt"};

constexpr std::array<std::string_view, 4> k_prg_use_functions = {
  "nativeRandom", "nativeRandomInterval", "random", "randomInt"};

constexpr std::array<std::string_view, 2> k_send_functions = {"send", "nativeSendMessage"};

constexpr std::array<std::string_view, 4> k_send_methods = {"reply", "forward", "notify", "emit"};

constexpr std::array<std::string_view, 4> k_throw_functions = {
  "throw", "nativeThrow", "nativeThrowIf", "nativeThrowUnless"};

constexpr std::array<std::string_view, 13> k_mutating_methods = {
  // Map
  "set", "del", "replace",
  // String
  "append",
  // Builder
  "storeRef", "storeBits", "storeInt", "storeUint", "storeBool", "storeBit", "storeCoins",
  "storeAddress", "skipBits"};

/// Innermost receiver of a method call chain `x.a().b()` and whether any call mutates
const Expr * method_chain_root(const Expr & expr, bool & mutates)
{
  const Expr * current = &expr;
  while (const auto * call = current->as<MethodCallExpr>()) {
    if (is_mutating_method(call->method)) {
      mutates = true;
    }
    if (call->self == nullptr) {
      return nullptr;
    }
    current = call->self;
  }
  return current;
}

}  // namespace

bool is_datetime_function(std::string_view name) noexcept
{
  return contains(k_datetime_functions, name);
}

bool is_prg_init_function(std::string_view name) noexcept
{
  return contains(k_prg_init_functions, name);
}

bool is_prg_use_function(std::string_view name) noexcept
{
  return contains(k_prg_use_functions, name);
}

bool is_send_function(std::string_view name) noexcept { return contains(k_send_functions, name); }

bool is_send_method(std::string_view name) noexcept { return contains(k_send_methods, name); }

bool is_throw_function(std::string_view name) noexcept
{
  return contains(k_throw_functions, name);
}

bool is_mutating_method(std::string_view name) noexcept
{
  return contains(k_mutating_methods, name);
}

bool is_self(const Expr & expr) noexcept
{
  const auto * id = expr.as<IdExpr>();
  return id != nullptr && id->name == "self";
}

bool is_send_call(const Expr & expr) noexcept
{
  if (const auto * call = expr.as<StaticCallExpr>()) {
    return is_send_function(call->function);
  }
  if (const auto * call = expr.as<MethodCallExpr>()) {
    return call->self != nullptr && is_self(*call->self) && is_send_method(call->method);
  }
  return false;
}

bool is_static_call(const Expr & expr, std::string_view name) noexcept
{
  const auto * call = expr.as<StaticCallExpr>();
  return call != nullptr && call->function == name;
}

std::optional<std::vector<std::string>> try_extract_path(const Expr & expr)
{
  std::vector<std::string> reversed;
  const Expr * current = &expr;
  while (const auto * access = current->as<FieldAccessExpr>()) {
    if (access->aggregate == nullptr) {
      return std::nullopt;
    }
    reversed.push_back(access->field);
    current = access->aggregate;
  }
  const auto * root = current->as<IdExpr>();
  if (root == nullptr) {
    return std::nullopt;
  }
  reversed.push_back(root->name);
  return std::vector<std::string>(reversed.rbegin(), reversed.rend());
}

std::optional<std::string> find_state_read(const Expr & expr)
{
  if (expr.as<FieldAccessExpr>() == nullptr) {
    return std::nullopt;
  }
  const auto path = try_extract_path(expr);
  if (!path || path->size() < 2 || path->front() != "self") {
    return std::nullopt;
  }
  return (*path)[1];
}

std::vector<std::string> find_state_writes(const Stmt & stmt)
{
  std::vector<std::string> fields;
  auto add_field = [&](std::string name) {
    if (std::find(fields.begin(), fields.end(), name) == fields.end()) {
      fields.push_back(std::move(name));
    }
  };

  const Expr * target = nullptr;
  if (const auto * s = stmt.as<AssignStmt>()) {
    target = s->path;
  } else if (const auto * s = stmt.as<AugmentedAssignStmt>()) {
    target = s->path;
  }
  if (target != nullptr) {
    if (auto name = find_state_read(*target)) {
      add_field(std::move(*name));
    }
    return fields;
  }

  for_each_expression(stmt, [&](const Expr & e) {
    if (e.as<MethodCallExpr>() == nullptr) {
      return;
    }
    bool mutates = false;
    const Expr * root = method_chain_root(e, mutates);
    if (!mutates || root == nullptr) {
      return;
    }
    if (auto name = find_state_read(*root)) {
      add_field(std::move(*name));
    }
  });
  return fields;
}

std::vector<std::string> collect_identifiers(const Expr & expr)
{
  std::vector<std::string> names;
  for_each_subexpression(expr, [&](const Expr & e) {
    if (const auto * id = e.as<IdExpr>()) {
      names.push_back(id->name);
    }
  });
  return names;
}

std::optional<std::string> assigned_variable(const Stmt & stmt)
{
  const Expr * target = nullptr;
  if (const auto * s = stmt.as<AssignStmt>()) {
    target = s->path;
  } else if (const auto * s = stmt.as<AugmentedAssignStmt>()) {
    target = s->path;
  }
  if (target == nullptr) {
    return std::nullopt;
  }
  if (const auto * id = target->as<IdExpr>()) {
    return id->name;
  }
  return std::nullopt;
}

}  // namespace tactflow
