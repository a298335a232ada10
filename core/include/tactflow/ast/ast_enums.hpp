// tactflow/ast/ast_enums.hpp - AST enumeration definitions
//
// Operators, node kinds and item attributes, with the spellings used by the
// JSON IR.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace tactflow
{

// ============================================================================
// Node Kinds
// ============================================================================

/**
 * Expression kinds. The order matches the alternatives of ExprNode.
 */
enum class ExprKind : uint8_t {
  Id,
  Number,
  Boolean,
  String,
  Null,
  OpBinary,
  OpUnary,
  Conditional,
  StaticCall,
  MethodCall,
  FieldAccess,
  StructInstance,
  InitOf,
};

/**
 * Statement kinds. The order matches the alternatives of StmtNode.
 */
enum class StmtKind : uint8_t {
  Let,
  Return,
  Expression,
  Assign,
  AugmentedAssign,
  Condition,
  While,
  Until,
  Repeat,
  Try,
  Foreach,
};

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  Shl,  ///< <<
  Shr,  ///< >>
  // Comparison
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Logical
  And,  ///< &&
  Or,   ///< ||
  // Bitwise
  BitAnd,  ///< &
  BitXor,  ///< ^
  BitOr,   ///< |
};

enum class UnaryOp : uint8_t {
  Plus,     ///< +
  Neg,      ///< -
  Not,      ///< !
  BitNot,   ///< ~
  NonNull,  ///< !! (postfix)
};

// ============================================================================
// Items
// ============================================================================

enum class FunctionKind : uint8_t {
  Function,  ///< free function
  Method,    ///< contract or trait method
  Receiver,  ///< message receiver
  Init,      ///< contract initializer
};

/**
 * Whether an item comes from user code or from the bundled standard library.
 */
enum class ItemOrigin : uint8_t {
  User,
  Stdlib,
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(ExprKind kind) noexcept
{
  switch (kind) {
    case ExprKind::Id:
      return "id";
    case ExprKind::Number:
      return "number";
    case ExprKind::Boolean:
      return "boolean";
    case ExprKind::String:
      return "string";
    case ExprKind::Null:
      return "null";
    case ExprKind::OpBinary:
      return "op_binary";
    case ExprKind::OpUnary:
      return "op_unary";
    case ExprKind::Conditional:
      return "conditional";
    case ExprKind::StaticCall:
      return "static_call";
    case ExprKind::MethodCall:
      return "method_call";
    case ExprKind::FieldAccess:
      return "field_access";
    case ExprKind::StructInstance:
      return "struct_instance";
    case ExprKind::InitOf:
      return "init_of";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(StmtKind kind) noexcept
{
  switch (kind) {
    case StmtKind::Let:
      return "statement_let";
    case StmtKind::Return:
      return "statement_return";
    case StmtKind::Expression:
      return "statement_expression";
    case StmtKind::Assign:
      return "statement_assign";
    case StmtKind::AugmentedAssign:
      return "statement_augmentedassign";
    case StmtKind::Condition:
      return "statement_condition";
    case StmtKind::While:
      return "statement_while";
    case StmtKind::Until:
      return "statement_until";
    case StmtKind::Repeat:
      return "statement_repeat";
    case StmtKind::Try:
      return "statement_try";
    case StmtKind::Foreach:
      return "statement_foreach";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Shl:
      return "<<";
    case BinaryOp::Shr:
      return ">>";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
    case BinaryOp::BitAnd:
      return "&";
    case BinaryOp::BitXor:
      return "^";
    case BinaryOp::BitOr:
      return "|";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Plus:
      return "+";
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::Not:
      return "!";
    case UnaryOp::BitNot:
      return "~";
    case UnaryOp::NonNull:
      return "!!";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(FunctionKind kind) noexcept
{
  switch (kind) {
    case FunctionKind::Function:
      return "function";
    case FunctionKind::Method:
      return "method";
    case FunctionKind::Receiver:
      return "receive";
    case FunctionKind::Init:
      return "init";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(ItemOrigin origin) noexcept
{
  switch (origin) {
    case ItemOrigin::User:
      return "user";
    case ItemOrigin::Stdlib:
      return "stdlib";
  }
  return "";
}

// ============================================================================
// Parsing (JSON IR spellings)
// ============================================================================

[[nodiscard]] std::optional<ExprKind> parse_expr_kind(std::string_view text) noexcept;
[[nodiscard]] std::optional<StmtKind> parse_stmt_kind(std::string_view text) noexcept;
[[nodiscard]] std::optional<BinaryOp> parse_binary_op(std::string_view text) noexcept;
[[nodiscard]] std::optional<UnaryOp> parse_unary_op(std::string_view text) noexcept;
[[nodiscard]] std::optional<FunctionKind> parse_function_kind(std::string_view text) noexcept;
[[nodiscard]] std::optional<ItemOrigin> parse_item_origin(std::string_view text) noexcept;

}  // namespace tactflow
