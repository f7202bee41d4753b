// lola/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators and window aggregation functions.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace lola
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Generated from ast_nodes.def and grouped by category so that category
 * membership is a range check.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "lola/ast/ast_nodes.def"

// === Types ===
#define AST_NODE_TYPE(Class, Kind, Snake) Kind,
#include "lola/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "lola/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "lola/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "lola/ast/ast_nodes.def"
};

[[nodiscard]] constexpr bool is_expr_kind(NodeKind k) noexcept
{
  return k >= NodeKind::IntLiteral && k <= NodeKind::CallExpr;
}

[[nodiscard]] constexpr bool is_type_kind(NodeKind k) noexcept
{
  return k >= NodeKind::NamedType && k <= NodeKind::TupleType;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind k) noexcept
{
  return k >= NodeKind::InputDecl && k <= NodeKind::TriggerDecl;
}

[[nodiscard]] constexpr bool is_pacing_kind(NodeKind k) noexcept
{
  return k == NodeKind::FrequencyPacing || k == NodeKind::EventPacing;
}

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
  Pow,  ///< **
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
};

enum class UnaryOp : uint8_t {
  Not,  ///< !
  Neg,  ///< -
};

[[nodiscard]] constexpr bool is_arithmetic(BinaryOp op) noexcept { return op <= BinaryOp::Pow; }

[[nodiscard]] constexpr bool is_comparison(BinaryOp op) noexcept
{
  return op >= BinaryOp::Eq && op <= BinaryOp::Ge;
}

[[nodiscard]] constexpr bool is_logical(BinaryOp op) noexcept
{
  return op == BinaryOp::And || op == BinaryOp::Or;
}

/**
 * Aggregation applied by a sliding window.
 */
enum class WindowOp : uint8_t {
  Sum,
  Product,
  Average,
  Count,
  Integral,
  Min,
  Max,
};

// ============================================================================
// String conversions
// ============================================================================

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
    case BinaryOp::Pow:
      return "**";
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
  }
  return "?";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Neg:
      return "-";
  }
  return "?";
}

[[nodiscard]] constexpr std::string_view to_string(WindowOp op) noexcept
{
  switch (op) {
    case WindowOp::Sum:
      return "sum";
    case WindowOp::Product:
      return "product";
    case WindowOp::Average:
      return "average";
    case WindowOp::Count:
      return "count";
    case WindowOp::Integral:
      return "integral";
    case WindowOp::Min:
      return "min";
    case WindowOp::Max:
      return "max";
  }
  return "?";
}

[[nodiscard]] std::optional<BinaryOp> parse_binary_op(std::string_view text) noexcept;
[[nodiscard]] std::optional<UnaryOp> parse_unary_op(std::string_view text) noexcept;

/// Accepts the names printed by to_string() plus "avg".
[[nodiscard]] std::optional<WindowOp> parse_window_op(std::string_view text) noexcept;

}  // namespace lola
