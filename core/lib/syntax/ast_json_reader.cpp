// lola/syntax/ast_json_reader.cpp - JSON interchange format to AST
#include "lola/syntax/ast_json_reader.hpp"

#include <cctype>
#include <fstream>
#include <optional>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>
#include <vector>

namespace lola
{

namespace
{

using json = nlohmann::json;

/// Split "1.5e3ms" into {"1.5e3", "ms"}.
std::pair<std::string_view, std::string_view> split_quantity(std::string_view text)
{
  size_t i = 0;
  while (i < text.size() && (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == '.')) {
    ++i;
  }
  // Exponent only when digits follow; otherwise 'e' starts no unit we know.
  if (i + 1 < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    size_t j = i + 1;
    if (j < text.size() && (text[j] == '+' || text[j] == '-')) ++j;
    if (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j]))) {
      while (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j]))) ++j;
      i = j;
    }
  }
  std::string_view unit = text.substr(i);
  while (!unit.empty() && unit.front() == ' ') unit.remove_prefix(1);
  return {text.substr(0, i), unit};
}

/**
 * Recursive builder over one JSON document.
 *
 * `path_` tracks the JSON location ("decls[2].expr.lhs") for messages.
 */
class Builder
{
public:
  Builder(AstContext & ast, AstJsonReader & reader) : ast_(ast), reader_(reader) {}

  Program * build_program(const json & root)
  {
    if (!root.is_object() || !root.contains("decls") || !root["decls"].is_array()) {
      reader_.report_error(
        DiagnosticKind::InvalidAst, {}, "AST document must be an object with a \"decls\" array");
      return nullptr;
    }

    std::vector<Decl *> decls;
    const json & list = root["decls"];
    for (size_t i = 0; i < list.size(); ++i) {
      Scope scope(*this, "decls[" + std::to_string(i) + "]");
      if (Decl * d = build_decl(list[i])) {
        decls.push_back(d);
      }
    }

    auto * program = ast_.create<Program>(range_of(root));
    program->decls = ast_.copy_to_arena(decls);
    return program;
  }

private:
  /// RAII path segment
  class Scope
  {
  public:
    Scope(Builder & b, const std::string & segment) : b_(b), saved_(b.path_.size())
    {
      if (!b_.path_.empty() && segment.front() != '[') b_.path_ += '.';
      b_.path_ += segment;
    }
    ~Scope() { b_.path_.resize(saved_); }

    Scope(const Scope &) = delete;
    Scope & operator=(const Scope &) = delete;

  private:
    Builder & b_;
    size_t saved_;
  };

  // ===========================================================================
  // Helpers
  // ===========================================================================

  void error(const json & node, const std::string & message)
  {
    reader_.report_error(
      DiagnosticKind::InvalidAst, range_of(node),
      path_.empty() ? message : path_ + ": " + message);
  }

  static SourceRange range_of(const json & node, const char * key = "range")
  {
    if (!node.is_object()) return {};
    const auto it = node.find(key);
    if (it == node.end() || !it->is_array() || it->size() != 2) return {};
    const json & r = *it;
    if (!r[0].is_number_unsigned() || !r[1].is_number_unsigned()) return {};
    return SourceRange(r[0].get<uint32_t>(), r[1].get<uint32_t>());
  }

  const json * field(const json & node, const char * key)
  {
    const auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
      error(node, std::string("missing field '") + key + "'");
      return nullptr;
    }
    return &*it;
  }

  std::optional<std::string_view> string_field(const json & node, const char * key)
  {
    const json * f = field(node, key);
    if (!f) return std::nullopt;
    if (!f->is_string()) {
      error(node, std::string("field '") + key + "' must be a string");
      return std::nullopt;
    }
    return ast_.intern(f->get_ref<const std::string &>());
  }

  std::optional<std::string_view> kind_of(const json & node)
  {
    if (!node.is_object()) {
      error(node, "expected an object");
      return std::nullopt;
    }
    return string_field(node, "kind");
  }

  // ===========================================================================
  // Declarations
  // ===========================================================================

  Decl * build_decl(const json & node)
  {
    const auto kind = kind_of(node);
    if (!kind) return nullptr;

    const SourceRange range = range_of(node);
    Decl * decl = nullptr;

    if (*kind == "input") {
      const auto name = string_field(node, "name");
      if (!name) return nullptr;
      TypeNode * type = nullptr;
      {
        Scope scope(*this, "type");
        const json * t = field(node, "type");
        if (!t || !(type = build_type(*t))) return nullptr;
      }
      auto * in = ast_.create<InputDecl>(*name, type, range);
      in->pacing = optional_pacing(node);
      decl = in;
    } else if (*kind == "output") {
      const auto name = string_field(node, "name");
      if (!name) return nullptr;
      Expr * expr = required_expr(node, "expr");
      if (!expr) return nullptr;
      auto * out = ast_.create<OutputDecl>(*name, expr, range);
      if (node.contains("type") && !node["type"].is_null()) {
        Scope scope(*this, "type");
        out->type = build_type(node["type"]);
        if (!out->type) return nullptr;
      }
      out->pacing = optional_pacing(node);
      decl = out;
    } else if (*kind == "trigger") {
      Expr * condition = required_expr(node, "condition");
      if (!condition) return nullptr;
      std::string_view message;
      if (node.contains("message") && node["message"].is_string()) {
        message = ast_.intern(node["message"].get_ref<const std::string &>());
      }
      auto * trig = ast_.create<TriggerDecl>(condition, message, range);
      trig->pacing = optional_pacing(node);
      decl = trig;
    } else {
      error(node, "unknown declaration kind '" + std::string(*kind) + "'");
      return nullptr;
    }

    decl->nameRange = range_of(node, "nameRange");
    return decl;
  }

  PacingNode * optional_pacing(const json & node)
  {
    const auto it = node.find("pacing");
    if (it == node.end() || it->is_null()) return nullptr;
    Scope scope(*this, "pacing");
    return build_pacing(*it);
  }

  PacingNode * build_pacing(const json & node)
  {
    // Shorthand: "10Hz"
    if (node.is_string()) {
      auto * value = quantity_from_string(node, node.get_ref<const std::string &>());
      return value ? ast_.create<FrequencyPacing>(value, value->get_range()) : nullptr;
    }

    const auto kind = kind_of(node);
    if (!kind) return nullptr;

    if (*kind == "frequency") {
      Scope scope(*this, "value");
      const json * v = field(node, "value");
      if (!v) return nullptr;
      QuantityLiteralExpr * value = nullptr;
      if (v->is_string()) {
        value = quantity_from_string(node, v->get_ref<const std::string &>());
      } else {
        error(node, "frequency value must be a string such as \"10Hz\"");
      }
      return value ? ast_.create<FrequencyPacing>(value, range_of(node)) : nullptr;
    }
    if (*kind == "event") {
      Expr * condition = required_expr(node, "condition");
      return condition ? ast_.create<EventPacing>(condition, range_of(node)) : nullptr;
    }

    error(node, "unknown pacing kind '" + std::string(*kind) + "'");
    return nullptr;
  }

  // ===========================================================================
  // Types
  // ===========================================================================

  TypeNode * build_type(const json & node)
  {
    // Shorthand: "Float64"
    if (node.is_string()) {
      return ast_.create<NamedType>(ast_.intern(node.get_ref<const std::string &>()));
    }

    const auto kind = kind_of(node);
    if (!kind) return nullptr;
    const SourceRange range = range_of(node);

    if (*kind == "named") {
      const auto name = string_field(node, "name");
      if (!name) return nullptr;
      std::string_view unit;
      if (node.contains("unit") && node["unit"].is_string()) {
        unit = ast_.intern(node["unit"].get_ref<const std::string &>());
      }
      return ast_.create<NamedType>(*name, unit, range);
    }
    if (*kind == "option") {
      Scope scope(*this, "inner");
      const json * inner = field(node, "inner");
      TypeNode * t = inner ? build_type(*inner) : nullptr;
      return t ? ast_.create<OptionType>(t, range) : nullptr;
    }
    if (*kind == "tuple") {
      const json * list = field(node, "elements");
      if (!list || !list->is_array()) {
        if (list) error(node, "field 'elements' must be an array");
        return nullptr;
      }
      std::vector<TypeNode *> elements;
      for (size_t i = 0; i < list->size(); ++i) {
        Scope scope(*this, "elements[" + std::to_string(i) + "]");
        TypeNode * t = build_type((*list)[i]);
        if (!t) return nullptr;
        elements.push_back(t);
      }
      return ast_.create<TupleType>(ast_.copy_to_arena(elements), range);
    }

    error(node, "unknown type kind '" + std::string(*kind) + "'");
    return nullptr;
  }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  Expr * required_expr(const json & node, const char * key)
  {
    Scope scope(*this, key);
    const json * e = field(node, key);
    return e ? build_expr(*e) : nullptr;
  }

  StreamRefExpr * stream_operand(const json & node)
  {
    const auto name = string_field(node, "stream");
    if (!name) return nullptr;
    return ast_.create<StreamRefExpr>(*name, range_of(node, "streamRange"));
  }

  QuantityLiteralExpr * quantity_from_string(const json & node, const std::string & text)
  {
    const auto [magnitude, unit] = split_quantity(text);
    if (magnitude.empty()) {
      error(node, "malformed quantity '" + text + "'");
      return nullptr;
    }
    return ast_.create<QuantityLiteralExpr>(
      ast_.intern(magnitude), ast_.intern(unit), range_of(node));
  }

  Expr * build_expr(const json & node)
  {
    const auto kind = kind_of(node);
    if (!kind) return nullptr;
    const SourceRange range = range_of(node);

    if (*kind == "int") {
      const json * v = field(node, "value");
      if (!v) return nullptr;
      if (!v->is_number_integer()) {
        error(node, "int literal needs an integer value");
        return nullptr;
      }
      return ast_.create<IntLiteralExpr>(v->get<int64_t>(), range);
    }
    if (*kind == "float") {
      const json * v = field(node, "value");
      if (!v) return nullptr;
      if (v->is_string()) {
        return ast_.create<FloatLiteralExpr>(ast_.intern(v->get_ref<const std::string &>()), range);
      }
      if (v->is_number()) {
        return ast_.create<FloatLiteralExpr>(ast_.intern(v->dump()), range);
      }
      error(node, "float literal needs a numeric value");
      return nullptr;
    }
    if (*kind == "bool") {
      const json * v = field(node, "value");
      if (!v) return nullptr;
      if (!v->is_boolean()) {
        error(node, "bool literal needs true or false");
        return nullptr;
      }
      return ast_.create<BoolLiteralExpr>(v->get<bool>(), range);
    }
    if (*kind == "string") {
      const auto v = string_field(node, "value");
      return v ? ast_.create<StringLiteralExpr>(*v, range) : nullptr;
    }
    if (*kind == "quantity") {
      const json * v = field(node, "value");
      if (!v) return nullptr;
      if (!v->is_string()) {
        error(node, "quantity needs a string value such as \"5s\"");
        return nullptr;
      }
      return quantity_from_string(node, v->get_ref<const std::string &>());
    }
    if (*kind == "stream") {
      const auto name = string_field(node, "name");
      return name ? ast_.create<StreamRefExpr>(*name, range) : nullptr;
    }
    if (*kind == "offset") {
      StreamRefExpr * stream = stream_operand(node);
      const json * by = field(node, "by");
      if (!stream || !by) return nullptr;
      if (!by->is_number_integer()) {
        error(node, "offset 'by' must be an integer");
        return nullptr;
      }
      return ast_.create<OffsetExpr>(stream, by->get<int64_t>(), range);
    }
    if (*kind == "hold") {
      StreamRefExpr * stream = stream_operand(node);
      return stream ? ast_.create<HoldExpr>(stream, range) : nullptr;
    }
    if (*kind == "window") {
      StreamRefExpr * stream = stream_operand(node);
      const auto duration = string_field(node, "duration");
      const auto op_name = string_field(node, "op");
      if (!stream || !duration || !op_name) return nullptr;
      const auto op = parse_window_op(*op_name);
      if (!op) {
        error(node, "unknown window operation '" + std::string(*op_name) + "'");
        return nullptr;
      }
      auto * d = quantity_from_string(node, std::string(*duration));
      return d ? ast_.create<WindowExpr>(stream, d, *op, range) : nullptr;
    }
    if (*kind == "default") {
      Expr * value = required_expr(node, "value");
      Expr * fallback = required_expr(node, "fallback");
      return value && fallback ? ast_.create<DefaultExpr>(value, fallback, range) : nullptr;
    }
    if (*kind == "binary") {
      const auto op_name = string_field(node, "op");
      Expr * lhs = required_expr(node, "lhs");
      Expr * rhs = required_expr(node, "rhs");
      if (!op_name || !lhs || !rhs) return nullptr;
      auto op = parse_binary_op(*op_name);
      // Activation conditions are often written with single '&' and '|'.
      if (!op && *op_name == "&") op = BinaryOp::And;
      if (!op && *op_name == "|") op = BinaryOp::Or;
      if (!op) {
        error(node, "unknown binary operator '" + std::string(*op_name) + "'");
        return nullptr;
      }
      return ast_.create<BinaryExpr>(lhs, *op, rhs, range);
    }
    if (*kind == "unary") {
      const auto op_name = string_field(node, "op");
      Expr * operand = required_expr(node, "operand");
      if (!op_name || !operand) return nullptr;
      const auto op = parse_unary_op(*op_name);
      if (!op) {
        error(node, "unknown unary operator '" + std::string(*op_name) + "'");
        return nullptr;
      }
      return ast_.create<UnaryExpr>(*op, operand, range);
    }
    if (*kind == "if") {
      Expr * cond = required_expr(node, "condition");
      Expr * then_expr = required_expr(node, "then");
      Expr * else_expr = required_expr(node, "else");
      return cond && then_expr && else_expr ? ast_.create<IfExpr>(cond, then_expr, else_expr, range)
                                            : nullptr;
    }
    if (*kind == "tuple") {
      std::vector<Expr *> elements;
      if (!expr_list(node, "elements", elements)) return nullptr;
      return ast_.create<TupleExpr>(ast_.copy_to_arena(elements), range);
    }
    if (*kind == "access") {
      Expr * tuple = required_expr(node, "tuple");
      const json * index = field(node, "index");
      if (!tuple || !index) return nullptr;
      if (!index->is_number_unsigned()) {
        error(node, "tuple index must be a non-negative integer");
        return nullptr;
      }
      return ast_.create<TupleAccessExpr>(tuple, index->get<uint32_t>(), range);
    }
    if (*kind == "cast") {
      Expr * operand = required_expr(node, "expr");
      TypeNode * type = nullptr;
      {
        Scope scope(*this, "type");
        const json * t = field(node, "type");
        type = t ? build_type(*t) : nullptr;
      }
      return operand && type ? ast_.create<CastExpr>(operand, type, range) : nullptr;
    }
    if (*kind == "call") {
      const auto callee = string_field(node, "callee");
      std::vector<Expr *> args;
      if (!callee || !expr_list(node, "args", args)) return nullptr;
      return ast_.create<CallExpr>(*callee, ast_.copy_to_arena(args), range);
    }

    error(node, "unknown expression kind '" + std::string(*kind) + "'");
    return nullptr;
  }

  bool expr_list(const json & node, const char * key, std::vector<Expr *> & out)
  {
    const json * list = field(node, key);
    if (!list) return false;
    if (!list->is_array()) {
      error(node, std::string("field '") + key + "' must be an array");
      return false;
    }
    for (size_t i = 0; i < list->size(); ++i) {
      Scope scope(*this, std::string(key) + "[" + std::to_string(i) + "]");
      Expr * e = build_expr((*list)[i]);
      if (!e) return false;
      out.push_back(e);
    }
    return true;
  }

  AstContext & ast_;
  AstJsonReader & reader_;
  std::string path_;
};

}  // namespace

Program * AstJsonReader::read(std::string_view text)
{
  has_errors_ = false;
  error_count_ = 0;

  const json root = json::parse(text.begin(), text.end(), nullptr, false);
  if (root.is_discarded()) {
    report_error(DiagnosticKind::InvalidAst, {}, "input is not valid JSON");
    return nullptr;
  }

  Builder builder(ast_, *this);
  return builder.build_program(root);
}

Program * AstJsonReader::read_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    has_errors_ = false;
    error_count_ = 0;
    report_error(DiagnosticKind::IoError, {}, "cannot read '" + path.string() + "'");
    return nullptr;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return read(buffer.str());
}

void AstJsonReader::report_error(DiagnosticKind kind, SourceRange range, std::string message)
{
  has_errors_ = true;
  ++error_count_;
  if (diags_) {
    diags_->report_error(kind, range, std::move(message));
  }
}

}  // namespace lola
