// lola/ast/ast.hpp - AST node class definitions
//
// The AST is produced by an external parser (or the JSON interchange reader)
// and consumed by the analysis pipeline. Node classes follow the LLVM/Clang
// style with classof() for RTTI support and are allocated in an AstContext.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "lola/ast/ast_enums.hpp"
#include "lola/basic/casting.hpp"
#include "lola/basic/source_manager.hpp"

namespace lola
{

struct Type;  // Semantic type, set by the type checker

/// Value of `resolvedStream` before name resolution (or when it failed)
inline constexpr uint32_t k_unresolved_stream = UINT32_MAX;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Nodes are non-copyable and owned by an AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  /// Resolved semantic type (set by the type checker)
  const Type * resolvedType = nullptr;

  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class TypeNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Pacing annotation attached to a declaration (`@ ...`).
class PacingNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_pacing_kind(node->kind); }

protected:
  explicit PacingNode(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public AstNode
{
public:
  /// Range of the declared name; invalid for triggers
  SourceRange nameRange;

  /// Stream created for this declaration by the graph builder
  uint32_t resolvedStream = k_unresolved_stream;

  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Literal Expressions
// ============================================================================

class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  explicit IntLiteralExpr(int64_t v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Float literal; the decimal text is kept so it can be read exactly.
class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  std::string_view text;

  explicit FloatLiteralExpr(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Unit-suffixed literal: `100ms`, `2.5Hz`.
class QuantityLiteralExpr
: public NodeBase<QuantityLiteralExpr, Expr, NodeKind::QuantityLiteral>
{
public:
  std::string_view magnitude;
  std::string_view unit;

  QuantityLiteralExpr(std::string_view m, std::string_view u, SourceRange r = {})
  : NodeBase(r), magnitude(m), unit(u)
  {
  }
};

// ============================================================================
// Stream Access Expressions
// ============================================================================

/// Synchronous access to a stream's current value: `x`.
class StreamRefExpr : public NodeBase<StreamRefExpr, Expr, NodeKind::StreamRef>
{
public:
  std::string_view name;

  /// Set by the graph builder
  uint32_t resolvedStream = k_unresolved_stream;

  explicit StreamRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Discrete offset access: `x.offset(by: -2)`; negative looks back.
class OffsetExpr : public NodeBase<OffsetExpr, Expr, NodeKind::Offset>
{
public:
  StreamRefExpr * stream;
  int64_t offset;

  OffsetExpr(StreamRefExpr * s, int64_t by, SourceRange r = {})
  : NodeBase(r), stream(s), offset(by)
  {
  }
};

/// Sample-and-hold access: `x.hold()`.
class HoldExpr : public NodeBase<HoldExpr, Expr, NodeKind::Hold>
{
public:
  StreamRefExpr * stream;

  explicit HoldExpr(StreamRefExpr * s, SourceRange r = {}) : NodeBase(r), stream(s) {}
};

/// Sliding window: `x.aggregate(over: 5s, using: sum)`.
class WindowExpr : public NodeBase<WindowExpr, Expr, NodeKind::Window>
{
public:
  StreamRefExpr * stream;
  QuantityLiteralExpr * duration;
  WindowOp op;

  WindowExpr(StreamRefExpr * s, QuantityLiteralExpr * d, WindowOp o, SourceRange r = {})
  : NodeBase(r), stream(s), duration(d), op(o)
  {
  }
};

/// `value.defaults(to: fallback)`
class DefaultExpr : public NodeBase<DefaultExpr, Expr, NodeKind::Default>
{
public:
  Expr * value;
  Expr * fallback;

  DefaultExpr(Expr * v, Expr * f, SourceRange r = {}) : NodeBase(r), value(v), fallback(f) {}
};

// ============================================================================
// Operator Expressions
// ============================================================================

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/// `if c then a else b`
class IfExpr : public NodeBase<IfExpr, Expr, NodeKind::IfExpr>
{
public:
  Expr * condition;
  Expr * thenExpr;
  Expr * elseExpr;

  IfExpr(Expr * c, Expr * t, Expr * e, SourceRange r = {})
  : NodeBase(r), condition(c), thenExpr(t), elseExpr(e)
  {
  }
};

class TupleExpr : public NodeBase<TupleExpr, Expr, NodeKind::TupleExpr>
{
public:
  gsl::span<Expr *> elements;

  explicit TupleExpr(gsl::span<Expr *> elems, SourceRange r = {}) : NodeBase(r), elements(elems)
  {
  }
};

/// Tuple projection: `t.0`
class TupleAccessExpr : public NodeBase<TupleAccessExpr, Expr, NodeKind::TupleAccess>
{
public:
  Expr * tuple;
  uint32_t index;

  TupleAccessExpr(Expr * t, uint32_t i, SourceRange r = {}) : NodeBase(r), tuple(t), index(i) {}
};

/// Numeric conversion: `cast<Float64>(x)`
class CastExpr : public NodeBase<CastExpr, Expr, NodeKind::CastExpr>
{
public:
  Expr * expr;
  TypeNode * targetType;

  CastExpr(Expr * e, TypeNode * t, SourceRange r = {}) : NodeBase(r), expr(e), targetType(t) {}
};

/// Call of a built-in function: `sqrt(x)`
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  std::string_view callee;
  gsl::span<Expr *> args;

  CallExpr(std::string_view c, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), callee(c), args(a)
  {
  }
};

// ============================================================================
// Type Nodes
// ============================================================================

/// Built-in type name, optionally with a unit: `Float64`, `Float64<s>`.
class NamedType : public NodeBase<NamedType, TypeNode, NodeKind::NamedType>
{
public:
  std::string_view name;
  std::string_view unit;

  explicit NamedType(std::string_view n, std::string_view u = {}, SourceRange r = {})
  : NodeBase(r), name(n), unit(u)
  {
  }
};

/// `Option<T>`
class OptionType : public NodeBase<OptionType, TypeNode, NodeKind::OptionType>
{
public:
  TypeNode * inner;

  explicit OptionType(TypeNode * i, SourceRange r = {}) : NodeBase(r), inner(i) {}
};

/// `(T1, T2, ...)`
class TupleType : public NodeBase<TupleType, TypeNode, NodeKind::TupleType>
{
public:
  gsl::span<TypeNode *> elements;

  explicit TupleType(gsl::span<TypeNode *> elems, SourceRange r = {})
  : NodeBase(r), elements(elems)
  {
  }
};

// ============================================================================
// Pacing Annotations
// ============================================================================

/// `@ 10Hz` or `@ 100ms`
class FrequencyPacing : public NodeBase<FrequencyPacing, PacingNode, NodeKind::FrequencyPacing>
{
public:
  QuantityLiteralExpr * value;

  explicit FrequencyPacing(QuantityLiteralExpr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `@ (a && b) || c` - activation condition over input streams
class EventPacing : public NodeBase<EventPacing, PacingNode, NodeKind::EventPacing>
{
public:
  Expr * condition;

  explicit EventPacing(Expr * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

// ============================================================================
// Declarations
// ============================================================================

/// `input name: Type [@ pacing]`
class InputDecl : public NodeBase<InputDecl, Decl, NodeKind::InputDecl>
{
public:
  std::string_view name;
  TypeNode * type;
  PacingNode * pacing = nullptr;

  InputDecl(std::string_view n, TypeNode * t, SourceRange r = {}) : NodeBase(r), name(n), type(t)
  {
  }
};

/// `output name [: Type] [@ pacing] := expr`
class OutputDecl : public NodeBase<OutputDecl, Decl, NodeKind::OutputDecl>
{
public:
  std::string_view name;
  TypeNode * type = nullptr;
  PacingNode * pacing = nullptr;
  Expr * expr;

  OutputDecl(std::string_view n, Expr * e, SourceRange r = {}) : NodeBase(r), name(n), expr(e) {}
};

/// `trigger [@ pacing] condition ["message"]`
class TriggerDecl : public NodeBase<TriggerDecl, Decl, NodeKind::TriggerDecl>
{
public:
  Expr * condition;
  std::string_view message;
  PacingNode * pacing = nullptr;

  TriggerDecl(Expr * c, std::string_view msg, SourceRange r = {})
  : NodeBase(r), condition(c), message(msg)
  {
  }
};

// ============================================================================
// Program
// ============================================================================

/// A complete specification: declarations in source order.
class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Decl *> decls;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

/// Range of the declared name, falling back to the whole declaration.
[[nodiscard]] inline SourceRange get_name_range(const Decl * decl) noexcept
{
  if (decl == nullptr) return {};
  return decl->nameRange.is_valid() ? decl->nameRange : decl->get_range();
}

}  // namespace lola
