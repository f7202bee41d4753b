// lola/ast/visitor.hpp - CRTP visitor for AST traversal
//
// Dispatch cases and default visit methods are generated from
// ast_nodes.def, so adding a node kind only touches the .def file and the
// passes that care about it.
//
#pragma once

#include <type_traits>

#include "lola/ast/ast.hpp"
#include "lola/ast/ast_enums.hpp"
#include "lola/basic/casting.hpp"

namespace lola
{

namespace detail
{

/// DerivedNode * or const DerivedNode *, following NodePtrT
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

// ============================================================================
// AstVisitor
// ============================================================================

/**
 * CRTP visitor without virtual dispatch.
 *
 * @code
 *   class RefCounter : public ConstAstVisitor<RefCounter, int> {
 *   public:
 *     int visit_stream_ref(const StreamRefExpr *) { return 1; }
 *   };
 * @endcode
 *
 * Unhandled kinds fall back to visit_expr / visit_type_node / visit_decl /
 * visit_node.
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TYPE(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_DECL(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "lola/ast/ast_nodes.def"
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_TYPE(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_type_node(node);                             \
  }
#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "lola/ast/ast_nodes.def"

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_type_node(detail::propagate_const_t<NodePtrT, TypeNode> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor
// ============================================================================

/**
 * Visitor that walks into children automatically.
 *
 * Override a visit method to customize a node; call the base version to keep
 * descending, or return false to stop the whole traversal.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  // Stream access
  bool visit_offset(NodePtr<OffsetExpr> node) { return get_derived().visit(node->stream); }
  bool visit_hold(NodePtr<HoldExpr> node) { return get_derived().visit(node->stream); }
  bool visit_window(NodePtr<WindowExpr> node)
  {
    if (!get_derived().visit(node->stream)) return false;
    return get_derived().visit(node->duration);
  }
  bool visit_default_expr(NodePtr<DefaultExpr> node)
  {
    if (!get_derived().visit(node->value)) return false;
    return get_derived().visit(node->fallback);
  }

  // Operators
  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    if (!get_derived().visit(node->lhs)) return false;
    return get_derived().visit(node->rhs);
  }
  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->operand); }
  bool visit_if_expr(NodePtr<IfExpr> node)
  {
    if (!get_derived().visit(node->condition)) return false;
    if (!get_derived().visit(node->thenExpr)) return false;
    return get_derived().visit(node->elseExpr);
  }
  bool visit_tuple_expr(NodePtr<TupleExpr> node)
  {
    for (auto * e : node->elements) {
      if (!get_derived().visit(e)) return false;
    }
    return true;
  }
  bool visit_tuple_access(NodePtr<TupleAccessExpr> node)
  {
    return get_derived().visit(node->tuple);
  }
  bool visit_cast_expr(NodePtr<CastExpr> node)
  {
    if (!get_derived().visit(node->expr)) return false;
    return get_derived().visit(node->targetType);
  }
  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    for (auto * a : node->args) {
      if (!get_derived().visit(a)) return false;
    }
    return true;
  }

  // Types
  bool visit_option_type(NodePtr<OptionType> node) { return get_derived().visit(node->inner); }
  bool visit_tuple_type(NodePtr<TupleType> node)
  {
    for (auto * t : node->elements) {
      if (!get_derived().visit(t)) return false;
    }
    return true;
  }

  // Pacing
  bool visit_frequency_pacing(NodePtr<FrequencyPacing> node)
  {
    return get_derived().visit(node->value);
  }
  bool visit_event_pacing(NodePtr<EventPacing> node)
  {
    return get_derived().visit(node->condition);
  }

  // Declarations
  bool visit_input_decl(NodePtr<InputDecl> node)
  {
    if (!get_derived().visit(node->type)) return false;
    return !node->pacing || get_derived().visit(node->pacing);
  }
  bool visit_output_decl(NodePtr<OutputDecl> node)
  {
    if (node->type && !get_derived().visit(node->type)) return false;
    if (node->pacing && !get_derived().visit(node->pacing)) return false;
    return get_derived().visit(node->expr);
  }
  bool visit_trigger_decl(NodePtr<TriggerDecl> node)
  {
    if (node->pacing && !get_derived().visit(node->pacing)) return false;
    return get_derived().visit(node->condition);
  }

  bool visit_program(NodePtr<Program> node)
  {
    for (auto * d : node->decls) {
      if (!get_derived().visit(d)) return false;
    }
    return true;
  }

  // Leaves
  bool visit_node(NodePtrT /*node*/) { return true; }
};

template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace lola
