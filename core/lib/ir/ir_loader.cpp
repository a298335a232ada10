// tactflow/ir/ir_loader.cpp - JSON IR deserialization
#include "tactflow/ir/ir_loader.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include "tactflow/ast/ast_enums.hpp"
#include "tactflow/basic/exceptions.hpp"
#include "tactflow/ir/call_graph_builder.hpp"

namespace tactflow
{
namespace
{

using nlohmann::json;

class MalformedIr : public std::runtime_error
{
public:
  explicit MalformedIr(const std::string & message) : std::runtime_error(message) {}
};

// ============================================================================
// Field access helpers
// ============================================================================

const json & field(const json & j, const char * key, const std::string & where)
{
  if (!j.is_object()) {
    throw MalformedIr(where + ": expected an object");
  }
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    throw MalformedIr(where + ": missing '" + key + "'");
  }
  return *it;
}

const json * optional_field(const json & j, const char * key)
{
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::string string_field(const json & j, const char * key, const std::string & where)
{
  return field(j, key, where).get<std::string>();
}

std::optional<std::string> optional_string(const json & j, const char * key)
{
  if (const json * v = optional_field(j, key)) {
    return v->get<std::string>();
  }
  return std::nullopt;
}

const json & array_field(const json & j, const char * key, const std::string & where)
{
  const json & v = field(j, key, where);
  if (!v.is_array()) {
    throw MalformedIr(where + ": '" + key + "' must be an array");
  }
  return v;
}

/// Empty array for a missing key
const json & optional_array(const json & j, const char * key, const std::string & where)
{
  static const json k_empty = json::array();
  const json * v = optional_field(j, key);
  if (v == nullptr) {
    return k_empty;
  }
  if (!v->is_array()) {
    throw MalformedIr(where + ": '" + key + "' must be an array");
  }
  return *v;
}

/// Non-negative integer that fits in T; ids, indices and offsets
template <typename T>
T index_value(const json & v, const std::string & where)
{
  if (!v.is_number_unsigned() || v.get<uint64_t>() > std::numeric_limits<T>::max()) {
    throw MalformedIr(
      where + ": expected an integer in [0, " + std::to_string(std::numeric_limits<T>::max()) +
      "], got " + v.dump());
  }
  return static_cast<T>(v.get<uint64_t>());
}

template <typename T>
T index_field(const json & j, const char * key, const std::string & where)
{
  return index_value<T>(field(j, key, where), where + ": '" + key + "'");
}

/// Exact value of a number literal: a JSON integer or a Tact literal string
Num number_value(const json & v, const std::string & where)
{
  if (v.is_string()) {
    return Num::parse(v.get<std::string>());
  }
  if (v.is_number_unsigned()) {
    return Num::parse(std::to_string(v.get<uint64_t>()));
  }
  if (v.is_number_integer()) {
    return Num::integer(static_cast<long>(v.get<int64_t>()));
  }
  throw MalformedIr(where + ": number literal must be an integer, got " + v.dump());
}

template <typename T, typename Parse>
T enum_field(const json & j, const char * key, const std::string & where, Parse parse)
{
  const std::string text = string_field(j, key, where);
  const auto value = parse(text);
  if (!value) {
    throw MalformedIr(where + ": unknown " + key + " '" + text + "'");
  }
  return *value;
}

// ============================================================================
// Reader
// ============================================================================

class Reader
{
public:
  explicit Reader(CompilationUnit & cu) : cu_(cu) {}

  void read(const json & doc)
  {
    if (!doc.is_object()) {
      throw MalformedIr("document: expected an object");
    }
    for (const json & f : optional_array(doc, "files", "document")) {
      read_file(f);
    }
    for (const json & c : optional_array(doc, "contracts", "document")) {
      read_contract(c);
    }
    for (const json & f : optional_array(doc, "functions", "document")) {
      read_function(f);
    }
    for (const json & c : optional_array(doc, "cfgs", "document")) {
      read_cfg(c);
    }
    check_callees();
  }

private:
  void read_file(const json & j)
  {
    const auto ext_id = index_field<uint16_t>(j, "id", "file");
    const std::string path = string_field(j, "path", "file");
    std::string content;
    if (const json * c = optional_field(j, "content")) {
      content = c->get<std::string>();
    }
    if (files_.count(ext_id) != 0) {
      throw MalformedIr("file: duplicate id " + std::to_string(ext_id));
    }
    const FileId id = cu_.sources().add_file(path, std::move(content));
    if (!id.is_valid()) {
      throw MalformedIr("file: too many source files");
    }
    files_.emplace(ext_id, id);
  }

  SourceRange read_loc(const json & node)
  {
    const json * loc = optional_field(node, "loc");
    if (loc == nullptr) {
      return {};
    }
    const auto ext_id = index_field<uint16_t>(*loc, "file", "loc");
    const auto it = files_.find(ext_id);
    if (it == files_.end()) {
      throw MalformedIr("loc: unknown file " + std::to_string(ext_id));
    }
    return {
      it->second, index_field<uint32_t>(*loc, "start", "loc"),
      index_field<uint32_t>(*loc, "end", "loc")};
  }

  // --------------------------------------------------------------------------
  // Expressions
  // --------------------------------------------------------------------------

  const Expr * read_optional_expr(const json & j, const char * key)
  {
    const json * v = optional_field(j, key);
    return v != nullptr ? read_expr(*v) : nullptr;
  }

  std::vector<const Expr *> read_args(const json & j, const std::string & where)
  {
    std::vector<const Expr *> args;
    for (const json & a : optional_array(j, "args", where)) {
      args.push_back(read_expr(a));
    }
    return args;
  }

  const Expr * read_expr(const json & j)
  {
    const auto id = index_field<AstId>(j, "id", "expression");
    const std::string where = "expression " + std::to_string(id);
    const auto kind = enum_field<ExprKind>(j, "kind", where, parse_expr_kind);

    ExprNode node;
    switch (kind) {
      case ExprKind::Id:
        node = IdExpr{string_field(j, "text", where)};
        break;
      case ExprKind::Number: {
        node = NumberExpr{number_value(field(j, "value", where), where)};
        break;
      }
      case ExprKind::Boolean:
        node = BoolExpr{field(j, "value", where).get<bool>()};
        break;
      case ExprKind::String:
        node = StringExpr{string_field(j, "value", where)};
        break;
      case ExprKind::Null:
        node = NullExpr{};
        break;
      case ExprKind::OpBinary: {
        const auto op = enum_field<BinaryOp>(j, "op", where, parse_binary_op);
        const Expr * left = read_expr(field(j, "left", where));
        const Expr * right = read_expr(field(j, "right", where));
        node = BinaryExpr{op, left, right};
        break;
      }
      case ExprKind::OpUnary: {
        const auto op = enum_field<UnaryOp>(j, "op", where, parse_unary_op);
        node = UnaryExpr{op, read_expr(field(j, "operand", where))};
        break;
      }
      case ExprKind::Conditional: {
        const Expr * cond = read_expr(field(j, "condition", where));
        const Expr * then_branch = read_expr(field(j, "then_branch", where));
        const Expr * else_branch = read_expr(field(j, "else_branch", where));
        node = ConditionalExpr{cond, then_branch, else_branch};
        break;
      }
      case ExprKind::StaticCall: {
        std::string function = string_field(j, "function", where);
        node = StaticCallExpr{std::move(function), read_args(j, where)};
        break;
      }
      case ExprKind::MethodCall: {
        const Expr * self = read_expr(field(j, "self", where));
        std::string method = string_field(j, "method", where);
        node = MethodCallExpr{self, std::move(method), read_args(j, where)};
        break;
      }
      case ExprKind::FieldAccess: {
        const Expr * aggregate = read_expr(field(j, "aggregate", where));
        node = FieldAccessExpr{aggregate, string_field(j, "field", where)};
        break;
      }
      case ExprKind::StructInstance: {
        StructInstanceExpr inst;
        inst.type = string_field(j, "type", where);
        for (const json & f : optional_array(j, "fields", where)) {
          std::string name = string_field(f, "field", where);
          inst.fields.push_back({std::move(name), read_expr(field(f, "initializer", where))});
        }
        node = std::move(inst);
        break;
      }
      case ExprKind::InitOf: {
        std::string contract = string_field(j, "contract", where);
        node = InitOfExpr{std::move(contract), read_args(j, where)};
        break;
      }
    }
    return cu_.ast().add_expr(std::move(node), read_loc(j), id);
  }

  // --------------------------------------------------------------------------
  // Statements
  // --------------------------------------------------------------------------

  StmtList read_body(const json & j, const char * key, const std::string & where)
  {
    StmtList body;
    for (const json & s : optional_array(j, key, where)) {
      body.push_back(read_stmt(s));
    }
    return body;
  }

  const Stmt * read_stmt(const json & j)
  {
    const auto id = index_field<AstId>(j, "id", "statement");
    const std::string where = "statement " + std::to_string(id);
    const auto kind = enum_field<StmtKind>(j, "kind", where, parse_stmt_kind);

    StmtNode node;
    switch (kind) {
      case StmtKind::Let: {
        std::string name = string_field(j, "name", where);
        auto type = optional_string(j, "type");
        node = LetStmt{std::move(name), std::move(type), read_expr(field(j, "expression", where))};
        break;
      }
      case StmtKind::Return:
        node = ReturnStmt{read_optional_expr(j, "expression")};
        break;
      case StmtKind::Expression:
        node = ExpressionStmt{read_expr(field(j, "expression", where))};
        break;
      case StmtKind::Assign: {
        const Expr * path = read_expr(field(j, "path", where));
        node = AssignStmt{path, read_expr(field(j, "expression", where))};
        break;
      }
      case StmtKind::AugmentedAssign: {
        const auto op = enum_field<BinaryOp>(j, "op", where, parse_binary_op);
        const Expr * path = read_expr(field(j, "path", where));
        node = AugmentedAssignStmt{op, path, read_expr(field(j, "expression", where))};
        break;
      }
      case StmtKind::Condition: {
        ConditionStmt s;
        s.condition = read_expr(field(j, "condition", where));
        s.true_branch = read_body(j, "true_statements", where);
        s.false_branch = read_body(j, "false_statements", where);
        node = std::move(s);
        break;
      }
      case StmtKind::While: {
        const Expr * cond = read_expr(field(j, "condition", where));
        node = WhileStmt{cond, read_body(j, "statements", where)};
        break;
      }
      case StmtKind::Until: {
        const Expr * cond = read_expr(field(j, "condition", where));
        node = UntilStmt{cond, read_body(j, "statements", where)};
        break;
      }
      case StmtKind::Repeat: {
        const Expr * count = read_expr(field(j, "iterations", where));
        node = RepeatStmt{count, read_body(j, "statements", where)};
        break;
      }
      case StmtKind::Try: {
        TryStmt s;
        s.body = read_body(j, "statements", where);
        s.catch_name = optional_string(j, "catch_name");
        s.catch_body = read_body(j, "catch_statements", where);
        node = std::move(s);
        break;
      }
      case StmtKind::Foreach: {
        ForeachStmt s;
        s.key_name = string_field(j, "key_name", where);
        s.value_name = string_field(j, "value_name", where);
        s.map = read_expr(field(j, "map", where));
        s.body = read_body(j, "statements", where);
        node = std::move(s);
        break;
      }
    }
    return cu_.ast().add_stmt(std::move(node), read_loc(j), id);
  }

  // --------------------------------------------------------------------------
  // Items
  // --------------------------------------------------------------------------

  ItemOrigin read_origin(const json & j, const std::string & where)
  {
    if (optional_field(j, "origin") == nullptr) {
      return ItemOrigin::User;
    }
    return enum_field<ItemOrigin>(j, "origin", where, parse_item_origin);
  }

  void read_contract(const json & j)
  {
    const auto id = index_field<AstId>(j, "id", "contract");
    ContractDef def;
    def.name = string_field(j, "name", "contract " + std::to_string(id));
    for (const json & f : optional_array(j, "fields", def.name)) {
      def.fields.push_back(f.get<std::string>());
    }
    def.origin = read_origin(j, def.name);
    def.range = read_loc(j);
    cu_.ast().add_contract(std::move(def), id);
  }

  void read_function(const json & j)
  {
    const auto id = index_field<AstId>(j, "id", "function");
    const std::string where = "function " + std::to_string(id);

    FunctionDef def;
    def.name = string_field(j, "name", where);
    def.kind = enum_field<FunctionKind>(j, "kind", where, parse_function_kind);
    def.contract = optional_string(j, "contract");
    for (const json & p : optional_array(j, "params", where)) {
      def.params.push_back({string_field(p, "name", where), optional_string(p, "type")});
    }
    def.body = read_body(j, "body", where);
    def.origin = read_origin(j, where);
    if (const json * a = optional_field(j, "asm")) {
      def.is_asm = a->get<bool>();
    }
    def.range = read_loc(j);
    cu_.ast().add_function(std::move(def), id);
  }

  // --------------------------------------------------------------------------
  // CFGs
  // --------------------------------------------------------------------------

  void read_cfg(const json & j)
  {
    const auto idx = index_field<CfgIdx>(j, "idx", "cfg");
    const std::string where = "cfg " + std::to_string(idx);

    Cfg cfg(
      idx, string_field(j, "name", where), index_field<AstId>(j, "function_id", where),
      enum_field<FunctionKind>(j, "kind", where, parse_function_kind), read_origin(j, where),
      read_loc(j), optional_string(j, "contract"));

    if (cu_.ast().get_function(cfg.function_id()) == nullptr) {
      throw MalformedIr(where + ": unknown function " + std::to_string(cfg.function_id()));
    }

    for (const json & b : array_field(j, "blocks", where)) {
      const auto block_idx = index_field<BasicBlockIdx>(b, "idx", where);
      BasicBlockKind kind = BasicBlockKind::Regular;
      if (optional_field(b, "kind") != nullptr) {
        kind = enum_field<BasicBlockKind>(b, "kind", where, parse_basic_block_kind);
      }
      std::vector<AstId> stmts;
      for (const json & s : optional_array(b, "stmts", where)) {
        const auto stmt_id = index_value<AstId>(s, where + ": block statement");
        if (cu_.ast().get_stmt(stmt_id) == nullptr) {
          throw MalformedIr(
            where + ": block " + std::to_string(block_idx) + " references unknown statement " +
            std::to_string(stmt_id));
        }
        stmts.push_back(stmt_id);
      }
      std::vector<CfgIdx> callees;
      for (const json & c : optional_array(b, "callees", where)) {
        callees.push_back(index_value<CfgIdx>(c, where + ": callee"));
      }
      cfg.add_block(std::move(stmts), kind, block_idx, std::move(callees));
    }

    for (const json & e : optional_array(j, "edges", where)) {
      if (!e.is_array() || e.size() != 2) {
        throw MalformedIr(where + ": an edge must be a [src, dst] pair");
      }
      cfg.add_edge(
        index_value<BasicBlockIdx>(e[0], where + ": edge"),
        index_value<BasicBlockIdx>(e[1], where + ": edge"));
    }

    if (const json * entry = optional_field(j, "entry")) {
      cfg.set_entry(index_value<BasicBlockIdx>(*entry, where + ": 'entry'"));
    }

    const auto problems = cfg.validate();
    if (!problems.empty()) {
      std::string message = problems.front();
      for (size_t i = 1; i < problems.size(); ++i) {
        message += "; " + problems[i];
      }
      throw MalformedIr(message);
    }

    cu_.add_cfg(std::move(cfg));
  }

  void check_callees() const
  {
    for (const auto & cfg : cu_.cfgs()) {
      for (const auto & block : cfg->blocks()) {
        for (const CfgIdx callee : block->callees) {
          if (cu_.find_cfg_by_idx(callee) == nullptr) {
            throw MalformedIr(
              "cfg " + std::to_string(cfg->idx()) + ": block " + std::to_string(block->idx) +
              " calls unknown cfg " + std::to_string(callee));
          }
        }
      }
    }
  }

  CompilationUnit & cu_;
  std::unordered_map<uint16_t, FileId> files_;
};

}  // namespace

// ============================================================================
// IrLoader
// ============================================================================

IrLoader::IrLoader(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

IrLoadResult IrLoader::load_file(const std::filesystem::path & path) const
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return IrLoadResult::fail("cannot open '" + path.string() + "'");
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return load_string(ss.str(), path.string());
}

IrLoadResult IrLoader::load_string(const std::string & text, const std::string & origin) const
{
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error & e) {
    return IrLoadResult::fail(origin + ": invalid JSON: " + e.what());
  }

  std::string project;
  if (doc.is_object()) {
    if (const auto it = doc.find("project"); it != doc.end() && it->is_string()) {
      project = it->get<std::string>();
    }
  }
  auto cu = std::make_unique<CompilationUnit>(project);

  try {
    Reader(*cu).read(doc);
  } catch (const MalformedIr & e) {
    return IrLoadResult::fail(origin + ": " + e.what());
  } catch (const json::exception & e) {
    return IrLoadResult::fail(origin + ": malformed IR: " + e.what());
  } catch (const AnalysisError & e) {
    return IrLoadResult::fail(origin + ": " + e.what());
  }

  CallGraphBuilder builder(logger_);
  cu->set_call_graph(builder.build(cu->ast()));

  logger_->info(
    "loaded '{}': {} functions, {} CFGs", origin, cu->ast().functions().size(), cu->cfgs().size());
  return IrLoadResult::ok(std::move(cu));
}

}  // namespace tactflow
