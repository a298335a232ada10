// tactflow/ast/ast.cpp - AST item helpers
#include "tactflow/ast/ast.hpp"

namespace tactflow
{

std::string FunctionDef::qualified_name() const
{
  std::string base;
  switch (kind) {
    case FunctionKind::Function:
    case FunctionKind::Method:
      base = name;
      break;
    case FunctionKind::Init:
      base = "contract_init_" + std::to_string(id);
      break;
    case FunctionKind::Receiver:
      base = "receiver_" + std::to_string(id);
      break;
  }

  std::string qualified = contract ? *contract + "::" + base : base;
  if (is_asm) {
    qualified = "asm_" + qualified;
  }
  return qualified;
}

}  // namespace tactflow
