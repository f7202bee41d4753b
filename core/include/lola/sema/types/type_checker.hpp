// lola/sema/types/type_checker.hpp - Unification-based type inference
//
// Runs after the StreamGraphBuilder: relies on StreamRefExpr::resolvedStream
// to find the type variable of an accessed stream.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lola/ast/ast.hpp"
#include "lola/basic/diagnostic.hpp"
#include "lola/sema/graph/stream_graph.hpp"
#include "lola/sema/resolution/function_registry.hpp"
#include "lola/sema/types/type.hpp"
#include "lola/sema/types/type_term.hpp"

namespace lola
{

struct TypeCheckOptions
{
  /// Resolve leftover literal placeholders: {integer} -> Int64, {float} and
  /// {numeric} -> Float64. When off they are reported as AmbiguousType.
  bool default_literals = true;
};

/**
 * Type checker for stream specifications.
 *
 * ## Algorithm
 *
 * 1. Every stream gets a type variable; declared types are posted first.
 * 2. Each stream expression is walked bottom-up. Every sub-expression gets a
 *    variable that is unified with its operands according to the operator.
 * 3. Unit arithmetic of `*`, `/`, average, integral and cast depends on
 *    operand units that may not be known yet. These relations are solved by
 *    a fixpoint after the walk; operand units that stay open are taken to be
 *    dimensionless.
 * 4. Every variable is resolved to a Type. Open variables are AmbiguousType.
 *
 * A conflict is reported once and the expression variables involved are
 * bound to Error, which absorbs later constraints. Stream variables keep
 * their type so other streams still see it.
 *
 * After check(), Stream::type and Expr::resolvedType are set.
 */
class TypeChecker
{
public:
  TypeChecker(
    TypeContext & types, StreamGraph & graph, const FunctionRegistry & functions,
    DiagnosticBag * diags = nullptr, TypeCheckOptions options = {});

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /**
   * Type check all streams of the graph.
   *
   * @return true if no errors occurred
   */
  bool check();

  /// Semantic type of a type annotation; reports unknown names.
  const Type * resolve_type_node(const TypeNode * node);

  // ===========================================================================
  // Error State
  // ===========================================================================

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  struct UnitRelation
  {
    enum class Op : uint8_t {
      Product,   ///< unit(result) = unit(lhs) * unit(rhs)
      Quotient,  ///< unit(result) = unit(lhs) / unit(rhs)
      Scale,     ///< unit(result) = unit(lhs) * factor
    };
    Op op;
    VarId result;
    VarId lhs;
    VarId rhs = k_no_var;
    Unit factor;
    SourceRange range;
    bool failed = false;  ///< conflict reported; no further steps
  };

  struct Projection
  {
    VarId result;
    VarId tuple;
    uint32_t index;
    SourceRange range;
  };

  // ===========================================================================
  // Expressions
  // ===========================================================================

  VarId infer(Expr * expr);
  VarId infer_quantity_literal(QuantityLiteralExpr * node);
  VarId infer_stream_ref(StreamRefExpr * node);
  VarId infer_window(WindowExpr * node);
  VarId infer_default(DefaultExpr * node);
  VarId infer_binary(BinaryExpr * node);
  VarId infer_unary(UnaryExpr * node);
  VarId infer_if(IfExpr * node);
  VarId infer_tuple(TupleExpr * node);
  VarId infer_tuple_access(TupleAccessExpr * node);
  VarId infer_cast(CastExpr * node);
  VarId infer_call(CallExpr * node);

  // ===========================================================================
  // Unification
  // ===========================================================================

  VarId fresh(TypeTerm term = TypeTerm::unknown());

  /// Structural unification; reports a conflict at `range`.
  bool unify(VarId a, VarId b, SourceRange range, std::string_view context = {});
  bool unify_with(VarId a, TypeTerm term, SourceRange range, std::string_view context = {});

  /// Unify without reporting; returns the conflicting values on failure.
  std::optional<Conflict<TypeTerm>> try_unify(VarId a, VarId b);

  /// `var` occurs inside the term of `in`
  bool occurs(VarId var, VarId in);

  /// Unify numeric kinds of `a` and `b` but not their units.
  bool unify_kinds(VarId a, VarId b, SourceRange range);

  void report_conflict(
    const Conflict<TypeTerm> & conflict, VarId expected, VarId found, SourceRange range,
    std::string_view context);

  /// Bind `var` to Error unless its class holds a stream's type.
  void poison(VarId var);

  // ===========================================================================
  // Solving
  // ===========================================================================

  void solve_deferred();
  bool step_unit_relation(UnitRelation & rel);
  bool step_projection(const Projection & proj);
  bool default_open_operand_unit();

  /// Term-to-type conversion; nullptr when still ambiguous.
  const Type * resolve(VarId var, int depth = 0);

  /// Full rendering for messages ("Option<Float64<s>>")
  std::string describe(VarId var, int depth = 0);

  // ===========================================================================
  // Declarations
  // ===========================================================================

  VarId term_of_type_node(const TypeNode * node);
  void check_stream(Stream & stream);
  void finalize_stream(Stream & stream);

  void report_error(
    DiagnosticKind kind, SourceRange range, std::string message, std::string label = "");

  // ===========================================================================
  // Member Variables
  // ===========================================================================

  TypeContext & types_;
  StreamGraph & graph_;
  const FunctionRegistry & functions_;
  DiagnosticBag * diags_;
  TypeCheckOptions options_;

  TypeUnifier unifier_;

  /// Stream being walked
  StreamId current_ = k_invalid_stream;

  /// (expression, variable) pairs per stream, in walk order
  std::vector<std::vector<std::pair<Expr *, VarId>>> exprVars_;

  std::vector<UnitRelation> unitRelations_;
  std::vector<Projection> projections_;

  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace lola
