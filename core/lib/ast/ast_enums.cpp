// tactflow/ast/ast_enums.cpp - Parsing of IR spellings
#include "tactflow/ast/ast_enums.hpp"

namespace tactflow
{

namespace
{

// Linear search over an enum's to_string() spellings; the enums are small.
template <typename Enum, Enum Last>
std::optional<Enum> parse_by_name(std::string_view text) noexcept
{
  for (auto i = 0U; i <= static_cast<unsigned>(Last); ++i) {
    const auto candidate = static_cast<Enum>(i);
    if (to_string(candidate) == text) {
      return candidate;
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<ExprKind> parse_expr_kind(std::string_view text) noexcept
{
  return parse_by_name<ExprKind, ExprKind::InitOf>(text);
}

std::optional<StmtKind> parse_stmt_kind(std::string_view text) noexcept
{
  return parse_by_name<StmtKind, StmtKind::Foreach>(text);
}

std::optional<BinaryOp> parse_binary_op(std::string_view text) noexcept
{
  return parse_by_name<BinaryOp, BinaryOp::BitOr>(text);
}

std::optional<UnaryOp> parse_unary_op(std::string_view text) noexcept
{
  return parse_by_name<UnaryOp, UnaryOp::NonNull>(text);
}

std::optional<FunctionKind> parse_function_kind(std::string_view text) noexcept
{
  return parse_by_name<FunctionKind, FunctionKind::Init>(text);
}

std::optional<ItemOrigin> parse_item_origin(std::string_view text) noexcept
{
  return parse_by_name<ItemOrigin, ItemOrigin::Stdlib>(text);
}

}  // namespace tactflow
