// lola/sema/types/type_checker.cpp - Unification-based type inference
#include "lola/sema/types/type_checker.hpp"

#include "lola/basic/casting.hpp"
#include "lola/basic/quantity.hpp"

namespace lola
{

namespace
{

constexpr int k_max_type_depth = 64;

std::string quote_name(std::string_view s) { return "'" + std::string(s) + "'"; }

/// Shallow state used to detect progress in the fixpoint
struct TermKey
{
  TermKind kind;
  TypeKind concrete;
  std::optional<Unit> unit;

  bool operator==(const TermKey & o) const
  {
    return kind == o.kind && concrete == o.concrete && unit == o.unit;
  }
};

}  // namespace

TypeChecker::TypeChecker(
  TypeContext & types, StreamGraph & graph, const FunctionRegistry & functions,
  DiagnosticBag * diags, TypeCheckOptions options)
: types_(types), graph_(graph), functions_(functions), diags_(diags), options_(options)
{
}

// ============================================================================
// Entry Point
// ============================================================================

bool TypeChecker::check()
{
  has_errors_ = false;
  error_count_ = 0;
  exprVars_.assign(graph_.stream_count(), {});
  unitRelations_.clear();
  projections_.clear();

  // Stream variables first: expressions may access streams declared later.
  for (auto & stream : graph_.streams()) {
    current_ = stream.id;
    if (stream.declared_type) {
      stream.type_var = term_of_type_node(stream.declared_type);
    } else if (stream.is_trigger()) {
      stream.type_var = fresh(TypeTerm::primitive(TypeKind::Bool));
    } else {
      stream.type_var = fresh();
    }
  }

  for (auto & stream : graph_.streams()) {
    check_stream(stream);
  }

  current_ = k_invalid_stream;
  solve_deferred();

  for (auto & stream : graph_.streams()) {
    finalize_stream(stream);
  }
  current_ = k_invalid_stream;

  return !has_errors_;
}

const Type * TypeChecker::resolve_type_node(const TypeNode * node)
{
  const VarId var = term_of_type_node(node);
  const Type * type = resolve(var);
  return type ? type : types_.error_type();
}

void TypeChecker::check_stream(Stream & stream)
{
  if (!stream.expr) return;
  current_ = stream.id;

  const VarId value = infer(stream.expr);
  const SourceRange range = stream.expr->get_range();

  if (stream.is_trigger()) {
    unify(stream.type_var, value, range, "trigger condition must be Bool");
  } else if (stream.declared_type) {
    unify(
      stream.type_var, value, range,
      "expression does not match the declared type of " + quote_name(stream.name));
  } else {
    unify(stream.type_var, value, range);
  }
}

// ============================================================================
// Expressions
// ============================================================================

VarId TypeChecker::infer(Expr * expr)
{
  if (!expr) return fresh(TypeTerm::error());

  VarId var = k_no_var;
  switch (expr->get_kind()) {
    case NodeKind::IntLiteral:
      var = fresh(TypeTerm::integer());
      break;
    case NodeKind::FloatLiteral:
      var = fresh(TypeTerm::floating());
      break;
    case NodeKind::BoolLiteral:
      var = fresh(TypeTerm::primitive(TypeKind::Bool));
      break;
    case NodeKind::StringLiteral:
      var = fresh(TypeTerm::primitive(TypeKind::String));
      break;
    case NodeKind::QuantityLiteral:
      var = infer_quantity_literal(cast<QuantityLiteralExpr>(expr));
      break;
    case NodeKind::StreamRef:
      var = infer_stream_ref(cast<StreamRefExpr>(expr));
      break;
    case NodeKind::Offset:
      var = fresh(TypeTerm::option(infer(cast<OffsetExpr>(expr)->stream)));
      break;
    case NodeKind::Hold:
      var = fresh(TypeTerm::option(infer(cast<HoldExpr>(expr)->stream)));
      break;
    case NodeKind::Window:
      var = infer_window(cast<WindowExpr>(expr));
      break;
    case NodeKind::Default:
      var = infer_default(cast<DefaultExpr>(expr));
      break;
    case NodeKind::BinaryExpr:
      var = infer_binary(cast<BinaryExpr>(expr));
      break;
    case NodeKind::UnaryExpr:
      var = infer_unary(cast<UnaryExpr>(expr));
      break;
    case NodeKind::IfExpr:
      var = infer_if(cast<IfExpr>(expr));
      break;
    case NodeKind::TupleExpr:
      var = infer_tuple(cast<TupleExpr>(expr));
      break;
    case NodeKind::TupleAccess:
      var = infer_tuple_access(cast<TupleAccessExpr>(expr));
      break;
    case NodeKind::CastExpr:
      var = infer_cast(cast<CastExpr>(expr));
      break;
    case NodeKind::CallExpr:
      var = infer_call(cast<CallExpr>(expr));
      break;
    default:
      var = fresh(TypeTerm::error());
      break;
  }

  if (current_ < exprVars_.size()) {
    exprVars_[current_].emplace_back(expr, var);
  }
  return var;
}

VarId TypeChecker::infer_quantity_literal(QuantityLiteralExpr * node)
{
  const auto q = Quantity::from_literal(node->magnitude, node->unit);
  if (!q) {
    report_error(
      DiagnosticKind::InvalidAst, node->get_range(),
      "invalid quantity literal " +
        quote_name(std::string(node->magnitude) + std::string(node->unit)));
    return fresh(TypeTerm::error());
  }
  return fresh(TypeTerm::floating(q->unit()));
}

VarId TypeChecker::infer_stream_ref(StreamRefExpr * node)
{
  // Unresolved names were reported by the graph builder.
  if (node->resolvedStream == k_unresolved_stream) {
    return fresh(TypeTerm::error());
  }
  return graph_.stream(node->resolvedStream).type_var;
}

VarId TypeChecker::infer_window(WindowExpr * node)
{
  const VarId stream = infer(node->stream);
  const SourceRange range = node->get_range();
  const std::string op_name(to_string(node->op));

  if (node->op == WindowOp::Count) {
    return fresh(TypeTerm::primitive(TypeKind::UInt64, Unit::dimensionless()));
  }

  if (node->op == WindowOp::Product) {
    if (!unify_with(
          stream, TypeTerm::numeric(Unit::dimensionless()), range,
          "window aggregation 'product' needs a dimensionless numeric stream")) {
      return fresh(TypeTerm::error());
    }
    return stream;
  }

  if (!unify_with(
        stream, TypeTerm::numeric(), range,
        "window aggregation " + quote_name(op_name) + " needs a numeric stream")) {
    return fresh(TypeTerm::error());
  }

  switch (node->op) {
    case WindowOp::Sum:
      return stream;
    case WindowOp::Min:
    case WindowOp::Max:
      return fresh(TypeTerm::option(stream));
    case WindowOp::Average:
    case WindowOp::Integral: {
      const VarId inner = fresh(TypeTerm::primitive(TypeKind::Float64));
      UnitRelation rel;
      rel.op = UnitRelation::Op::Scale;
      rel.result = inner;
      rel.lhs = stream;
      rel.factor = node->op == WindowOp::Integral ? Unit::seconds() : Unit::dimensionless();
      rel.range = range;
      unitRelations_.push_back(rel);
      return fresh(TypeTerm::option(inner));
    }
    default:
      return fresh(TypeTerm::error());
  }
}

VarId TypeChecker::infer_default(DefaultExpr * node)
{
  const VarId value = infer(node->value);
  const VarId fallback = infer(node->fallback);

  const VarId inner = fresh();
  if (!unify_with(
        value, TypeTerm::option(inner), node->value->get_range(),
        "defaults(to:) needs an optional value")) {
    return fresh(TypeTerm::error());
  }
  unify(inner, fallback, node->fallback->get_range(), "fallback does not match the value");
  return inner;
}

VarId TypeChecker::infer_binary(BinaryExpr * node)
{
  const VarId lhs = infer(node->lhs);
  const VarId rhs = infer(node->rhs);
  const SourceRange range = node->get_range();
  const std::string op = quote_name(to_string(node->op));

  switch (node->op) {
    case BinaryOp::Add:
    case BinaryOp::Sub:
    case BinaryOp::Mod:
      if (!unify_with(lhs, TypeTerm::numeric(), node->lhs->get_range(),
                      "operator " + op + " needs numeric operands")) {
        return fresh(TypeTerm::error());
      }
      if (!unify(lhs, rhs, range, "operands of " + op + " differ")) {
        return fresh(TypeTerm::error());
      }
      return lhs;

    case BinaryOp::Mul:
    case BinaryOp::Div: {
      if (!unify_with(lhs, TypeTerm::numeric(), node->lhs->get_range(),
                      "operator " + op + " needs numeric operands") ||
          !unify_with(rhs, TypeTerm::numeric(), node->rhs->get_range(),
                      "operator " + op + " needs numeric operands")) {
        return fresh(TypeTerm::error());
      }
      if (!unify_kinds(lhs, rhs, range)) {
        return fresh(TypeTerm::error());
      }
      const VarId result = fresh(TypeTerm::numeric());
      UnitRelation rel;
      rel.op = node->op == BinaryOp::Mul ? UnitRelation::Op::Product : UnitRelation::Op::Quotient;
      rel.result = result;
      rel.lhs = lhs;
      rel.rhs = rhs;
      rel.range = range;
      unitRelations_.push_back(rel);
      return result;
    }

    case BinaryOp::Pow:
      if (!unify_with(lhs, TypeTerm::numeric(Unit::dimensionless()), node->lhs->get_range(),
                      "base of '**' must be a dimensionless number") ||
          !unify_with(rhs, TypeTerm::numeric(Unit::dimensionless()), node->rhs->get_range(),
                      "exponent of '**' must be a dimensionless number")) {
        return fresh(TypeTerm::error());
      }
      return lhs;

    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
      if (!unify_with(lhs, TypeTerm::numeric(), node->lhs->get_range(),
                      "operator " + op + " needs numeric operands")) {
        return fresh(TypeTerm::error());
      }
      [[fallthrough]];
    case BinaryOp::Eq:
    case BinaryOp::Ne:
      unify(lhs, rhs, range, "operands of " + op + " differ");
      return fresh(TypeTerm::primitive(TypeKind::Bool));

    case BinaryOp::And:
    case BinaryOp::Or:
      unify_with(lhs, TypeTerm::primitive(TypeKind::Bool), node->lhs->get_range(),
                 "operator " + op + " needs Bool operands");
      unify_with(rhs, TypeTerm::primitive(TypeKind::Bool), node->rhs->get_range(),
                 "operator " + op + " needs Bool operands");
      return fresh(TypeTerm::primitive(TypeKind::Bool));
  }
  return fresh(TypeTerm::error());
}

VarId TypeChecker::infer_unary(UnaryExpr * node)
{
  const VarId operand = infer(node->operand);
  if (node->op == UnaryOp::Not) {
    if (!unify_with(operand, TypeTerm::primitive(TypeKind::Bool), node->get_range(),
                    "operator '!' needs a Bool operand")) {
      return fresh(TypeTerm::error());
    }
    return operand;
  }
  if (!unify_with(operand, TypeTerm::numeric(), node->get_range(),
                  "operator '-' needs a numeric operand")) {
    return fresh(TypeTerm::error());
  }
  return operand;
}

VarId TypeChecker::infer_if(IfExpr * node)
{
  const VarId cond = infer(node->condition);
  unify_with(cond, TypeTerm::primitive(TypeKind::Bool), node->condition->get_range(),
             "condition must be Bool");

  const VarId then_var = infer(node->thenExpr);
  const VarId else_var = infer(node->elseExpr);
  if (!unify(then_var, else_var, node->elseExpr->get_range(), "branches have different types")) {
    return fresh(TypeTerm::error());
  }
  return then_var;
}

VarId TypeChecker::infer_tuple(TupleExpr * node)
{
  std::vector<VarId> elements;
  elements.reserve(node->elements.size());
  for (auto * e : node->elements) {
    elements.push_back(infer(e));
  }
  return fresh(TypeTerm::tuple(std::move(elements)));
}

VarId TypeChecker::infer_tuple_access(TupleAccessExpr * node)
{
  const VarId tuple = infer(node->tuple);
  const VarId result = fresh();
  projections_.push_back(Projection{result, tuple, node->index, node->get_range()});
  return result;
}

VarId TypeChecker::infer_cast(CastExpr * node)
{
  const VarId operand = infer(node->expr);
  if (!unify_with(operand, TypeTerm::numeric(), node->expr->get_range(),
                  "cast needs a numeric operand")) {
    return fresh(TypeTerm::error());
  }

  const auto * target = dyn_cast<NamedType>(node->targetType);
  const auto kind = target ? lookup_primitive(target->name) : std::nullopt;
  if (!kind || !is_numeric_kind(*kind)) {
    report_error(
      DiagnosticKind::TypeMismatch,
      node->targetType ? node->targetType->get_range() : node->get_range(),
      "can only cast to numeric types");
    return fresh(TypeTerm::error());
  }

  if (!target->unit.empty()) {
    return term_of_type_node(target);
  }

  // No unit given: the cast keeps the operand's unit.
  const VarId result = fresh(TypeTerm::primitive(*kind));
  UnitRelation rel;
  rel.op = UnitRelation::Op::Scale;
  rel.result = result;
  rel.lhs = operand;
  rel.factor = Unit::dimensionless();
  rel.range = node->get_range();
  unitRelations_.push_back(rel);
  return result;
}

VarId TypeChecker::infer_call(CallExpr * node)
{
  std::vector<VarId> args;
  args.reserve(node->args.size());
  for (auto * a : node->args) {
    args.push_back(infer(a));
  }

  // Unknown functions were reported by the graph builder.
  const FunctionSignature * sig = functions_.lookup(node->callee);
  if (!sig) {
    return fresh(TypeTerm::error());
  }

  if (args.size() != sig->arity) {
    report_error(
      DiagnosticKind::TypeMismatch, node->get_range(),
      "function " + quote_name(sig->name) + " takes " + std::to_string(sig->arity) +
        " argument(s) but " + std::to_string(args.size()) + " were supplied");
    return fresh(TypeTerm::error());
  }

  const std::optional<Unit> unit =
    sig->dimensionless ? std::optional<Unit>(Unit::dimensionless()) : std::nullopt;
  const VarId result = fresh(
    sig->constraint == TypeConstraint::FloatingPoint ? TypeTerm::floating(unit)
                                                     : TypeTerm::numeric(unit));

  const std::string context = "argument of " + quote_name(sig->name);
  for (size_t i = 0; i < args.size(); ++i) {
    if (!unify(result, args[i], node->args[i]->get_range(), context)) {
      return fresh(TypeTerm::error());
    }
  }
  return result;
}

// ============================================================================
// Unification
// ============================================================================

VarId TypeChecker::fresh(TypeTerm term) { return unifier_.new_var(std::move(term)); }

bool TypeChecker::unify(VarId a, VarId b, SourceRange range, std::string_view context)
{
  const auto conflict = try_unify(a, b);
  if (!conflict) return true;
  report_conflict(*conflict, a, b, range, context);
  return false;
}

bool TypeChecker::unify_with(VarId a, TypeTerm term, SourceRange range, std::string_view context)
{
  const VarId expected = fresh(std::move(term));
  return unify(expected, a, range, context);
}

std::optional<Conflict<TypeTerm>> TypeChecker::try_unify(VarId a, VarId b)
{
  if (unifier_.unioned(a, b)) return std::nullopt;

  const TypeTerm ta = unifier_.probe(a);
  const TypeTerm tb = unifier_.probe(b);

  // Reject infinite types such as T = Option<T>.
  if ((ta.is_unknown() && tb.is_structured() && occurs(a, b)) ||
      (tb.is_unknown() && ta.is_structured() && occurs(b, a))) {
    return Conflict<TypeTerm>{ta, tb};
  }

  if (ta.is_structured() && ta.kind == tb.kind && ta.children.size() == tb.children.size()) {
    for (size_t i = 0; i < ta.children.size(); ++i) {
      if (auto inner = try_unify(ta.children[i], tb.children[i])) {
        return inner;
      }
    }
  }

  const auto result = unifier_.unify_var_var(a, b);
  if (!result) {
    return result.get_conflict();
  }
  return std::nullopt;
}

bool TypeChecker::occurs(VarId var, VarId in)
{
  const TypeTerm t = unifier_.probe(in);
  for (const VarId child : t.children) {
    if (unifier_.unioned(var, child) || occurs(var, child)) {
      return true;
    }
  }
  return false;
}

bool TypeChecker::unify_kinds(VarId a, VarId b, SourceRange range)
{
  const TypeTerm tb = unifier_.probe(b);
  if (!unify_with(a, tb.without_unit(), range, "operands have different numeric types")) {
    return false;
  }
  const TypeTerm ta = unifier_.probe(a);
  return unify_with(b, ta.without_unit(), range, "operands have different numeric types");
}

void TypeChecker::report_conflict(
  const Conflict<TypeTerm> & conflict, VarId expected, VarId found, SourceRange range,
  std::string_view context)
{
  const std::string expected_str = describe(expected);
  const std::string found_str = describe(found);

  const bool unit_conflict = is_unit_conflict(conflict.left, conflict.right);
  std::string message;
  if (!context.empty()) {
    message = std::string(context) + ": ";
  }
  message += unit_conflict ? "incompatible units" : "type mismatch";
  message += ", expected '" + expected_str + "', found '" + found_str + "'";

  report_error(
    unit_conflict ? DiagnosticKind::UnitMismatch : DiagnosticKind::TypeMismatch, range,
    std::move(message), "found '" + found_str + "'");

  poison(expected);
  poison(found);
}

void TypeChecker::poison(VarId var)
{
  for (const auto & stream : graph_.streams()) {
    if (stream.type_var != k_no_var && unifier_.unioned(var, stream.type_var)) {
      return;
    }
  }
  unifier_.unify_var_value(var, TypeTerm::error());
}

// ============================================================================
// Solving
// ============================================================================

void TypeChecker::solve_deferred()
{
  std::vector<bool> done(projections_.size(), false);

  for (;;) {
    bool changed = true;
    while (changed) {
      changed = false;
      for (auto & rel : unitRelations_) {
        changed = step_unit_relation(rel) || changed;
      }
      for (size_t i = 0; i < projections_.size(); ++i) {
        if (!done[i] && step_projection(projections_[i])) {
          done[i] = true;
          changed = true;
        }
      }
    }
    if (!default_open_operand_unit()) {
      break;
    }
  }
}

bool TypeChecker::step_unit_relation(UnitRelation & rel)
{
  if (rel.failed) return false;

  const auto key = [this](VarId v) {
    if (v == k_no_var) return TermKey{TermKind::Unknown, TypeKind::Error, std::nullopt};
    const TypeTerm & t = unifier_.probe(v);
    return TermKey{t.kind, t.concrete, t.unit};
  };
  const TermKey before[3] = {key(rel.result), key(rel.lhs), key(rel.rhs)};
  for (const auto & k : before) {
    if (k.kind == TermKind::Error) return false;
  }

  if (rel.op != UnitRelation::Op::Scale) {
    if (!unify_kinds(rel.lhs, rel.rhs, rel.range) ||
        !unify_kinds(rel.result, rel.lhs, rel.range)) {
      rel.failed = true;
      return true;
    }
  }

  const std::optional<Unit> res = unifier_.probe(rel.result).unit;
  const std::optional<Unit> lhs = unifier_.probe(rel.lhs).unit;
  const std::optional<Unit> rhs =
    rel.rhs == k_no_var ? std::optional<Unit>(rel.factor) : unifier_.probe(rel.rhs).unit;
  const std::string context = "unit of this expression";
  bool ok = true;

  switch (rel.op) {
    case UnitRelation::Op::Product:
    case UnitRelation::Op::Scale:
      if (lhs && rhs) {
        ok = unify_with(rel.result, TypeTerm::numeric(*lhs * *rhs), rel.range, context);
      } else if (res && lhs && rel.rhs != k_no_var) {
        ok = unify_with(rel.rhs, TypeTerm::numeric(*res / *lhs), rel.range, context);
      } else if (res && rhs) {
        ok = unify_with(rel.lhs, TypeTerm::numeric(*res / *rhs), rel.range, context);
      }
      break;
    case UnitRelation::Op::Quotient:
      if (lhs && rhs) {
        ok = unify_with(rel.result, TypeTerm::numeric(*lhs / *rhs), rel.range, context);
      } else if (res && lhs) {
        ok = unify_with(rel.rhs, TypeTerm::numeric(*lhs / *res), rel.range, context);
      } else if (res && rhs) {
        ok = unify_with(rel.lhs, TypeTerm::numeric(*res * *rhs), rel.range, context);
      }
      break;
  }
  if (!ok) {
    rel.failed = true;
    return true;
  }

  const TermKey after[3] = {key(rel.result), key(rel.lhs), key(rel.rhs)};
  for (int i = 0; i < 3; ++i) {
    if (!(before[i] == after[i])) return true;
  }
  return false;
}

bool TypeChecker::step_projection(const Projection & proj)
{
  const TypeTerm t = unifier_.probe(proj.tuple);
  switch (t.kind) {
    case TermKind::Unknown:
      return false;
    case TermKind::Error:
      unifier_.unify_var_value(proj.result, TypeTerm::error());
      return true;
    case TermKind::Tuple:
      if (proj.index < t.children.size()) {
        unify(t.children[proj.index], proj.result, proj.range, "tuple element");
      } else {
        report_error(
          DiagnosticKind::TypeMismatch, proj.range,
          "tuple '" + describe(proj.tuple) + "' has no element " + std::to_string(proj.index));
        unifier_.unify_var_value(proj.result, TypeTerm::error());
      }
      return true;
    default:
      report_error(
        DiagnosticKind::TypeMismatch, proj.range,
        "cannot access element " + std::to_string(proj.index) + " of non-tuple type '" +
          describe(proj.tuple) + "'");
      unifier_.unify_var_value(proj.result, TypeTerm::error());
      return true;
  }
}

bool TypeChecker::default_open_operand_unit()
{
  for (const auto & rel : unitRelations_) {
    if (rel.failed) continue;
    for (const VarId v : {rel.lhs, rel.rhs}) {
      if (v == k_no_var) continue;
      const TypeTerm & t = unifier_.probe(v);
      if (t.is_numeric_like() && !t.unit) {
        unifier_.unify_var_value(v, TypeTerm::numeric(Unit::dimensionless()));
        return true;
      }
    }
  }
  return false;
}

const Type * TypeChecker::resolve(VarId var, int depth)
{
  if (depth > k_max_type_depth) return types_.error_type();

  const TypeTerm t = unifier_.probe(var);
  const Unit unit = t.unit.value_or(Unit::dimensionless());

  switch (t.kind) {
    case TermKind::Unknown:
      return nullptr;
    case TermKind::Error:
      return types_.error_type();
    case TermKind::Numeric:
      return options_.default_literals ? types_.get_primitive(TypeKind::Float64, unit) : nullptr;
    case TermKind::Integer:
      return options_.default_literals ? types_.get_primitive(TypeKind::Int64, unit) : nullptr;
    case TermKind::Float:
      return options_.default_literals ? types_.get_primitive(TypeKind::Float64, unit) : nullptr;
    case TermKind::Concrete:
      return types_.get_primitive(t.concrete, unit);
    case TermKind::Option: {
      const Type * inner = resolve(t.children.front(), depth + 1);
      return inner ? types_.get_option(inner) : nullptr;
    }
    case TermKind::Tuple: {
      std::vector<const Type *> elements;
      for (const VarId child : t.children) {
        const Type * e = resolve(child, depth + 1);
        if (!e) return nullptr;
        elements.push_back(e);
      }
      return types_.get_tuple(elements);
    }
  }
  return nullptr;
}

std::string TypeChecker::describe(VarId var, int depth)
{
  if (depth > k_max_type_depth) return "...";

  const TypeTerm t = unifier_.probe(var);
  if (t.kind == TermKind::Option) {
    return "Option<" + describe(t.children.front(), depth + 1) + ">";
  }
  if (t.kind == TermKind::Tuple) {
    std::string s = "(";
    for (size_t i = 0; i < t.children.size(); ++i) {
      if (i > 0) s += ", ";
      s += describe(t.children[i], depth + 1);
    }
    return s + ")";
  }
  return t.to_string();
}

// ============================================================================
// Declarations
// ============================================================================

VarId TypeChecker::term_of_type_node(const TypeNode * node)
{
  if (!node) return fresh();

  if (const auto * opt = dyn_cast<OptionType>(node)) {
    return fresh(TypeTerm::option(term_of_type_node(opt->inner)));
  }

  if (const auto * tup = dyn_cast<TupleType>(node)) {
    std::vector<VarId> elements;
    for (const auto * e : tup->elements) {
      elements.push_back(term_of_type_node(e));
    }
    return fresh(TypeTerm::tuple(std::move(elements)));
  }

  const auto * named = dyn_cast<NamedType>(node);
  if (!named) {
    return fresh(TypeTerm::error());
  }

  const auto kind = lookup_primitive(named->name);
  if (!kind) {
    report_error(
      DiagnosticKind::TypeMismatch, named->get_range(), "unknown type " + quote_name(named->name));
    return fresh(TypeTerm::error());
  }

  if (named->unit.empty()) {
    return fresh(TypeTerm::primitive(*kind, Unit::dimensionless()));
  }
  if (!is_numeric_kind(*kind)) {
    report_error(
      DiagnosticKind::UnitMismatch, named->get_range(),
      "type " + quote_name(named->name) + " cannot carry a unit");
    return fresh(TypeTerm::error());
  }

  const auto q = Quantity::from_literal("1", named->unit);
  if (!q) {
    report_error(
      DiagnosticKind::UnitMismatch, named->get_range(), "unknown unit " + quote_name(named->unit));
    return fresh(TypeTerm::error());
  }
  return fresh(TypeTerm::primitive(*kind, q->unit()));
}

void TypeChecker::finalize_stream(Stream & stream)
{
  current_ = stream.id;
  bool reported = false;

  stream.type = resolve(stream.type_var);
  if (!stream.type) {
    if (diags_) {
      diags_
        ->report_error(
          DiagnosticKind::AmbiguousType, get_name_range(stream.decl),
          "cannot infer the type of stream " + quote_name(stream.name))
        .with_stream(stream.id)
        .with_help("add a type annotation");
    }
    has_errors_ = true;
    ++error_count_;
    reported = true;
    stream.type = types_.error_type();
  }

  for (auto & [expr, var] : exprVars_[stream.id]) {
    const Type * type = resolve(var);
    if (!type) {
      if (!reported) {
        report_error(
          DiagnosticKind::AmbiguousType, expr->get_range(),
          "cannot infer the type of this expression");
        reported = true;
      }
      type = types_.error_type();
    }
    expr->resolvedType = type;
  }
}

void TypeChecker::report_error(
  DiagnosticKind kind, SourceRange range, std::string message, std::string label)
{
  has_errors_ = true;
  ++error_count_;
  if (!diags_) return;

  auto builder = diags_->report_error(kind, range, std::move(message), std::move(label));
  if (current_ != k_invalid_stream) {
    builder.with_stream(current_);
  }
}

}  // namespace lola
