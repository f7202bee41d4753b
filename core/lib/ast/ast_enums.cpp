// lola/ast/ast_enums.cpp - Operator and window name parsing
#include "lola/ast/ast_enums.hpp"

#include <array>

namespace lola
{

std::optional<BinaryOp> parse_binary_op(std::string_view text) noexcept
{
  static constexpr std::array<BinaryOp, 14> k_ops = {
    BinaryOp::Add, BinaryOp::Sub, BinaryOp::Mul, BinaryOp::Div, BinaryOp::Mod,
    BinaryOp::Pow, BinaryOp::Eq,  BinaryOp::Ne,  BinaryOp::Lt,  BinaryOp::Le,
    BinaryOp::Gt,  BinaryOp::Ge,  BinaryOp::And, BinaryOp::Or,
  };
  for (const BinaryOp op : k_ops) {
    if (to_string(op) == text) {
      return op;
    }
  }
  return std::nullopt;
}

std::optional<UnaryOp> parse_unary_op(std::string_view text) noexcept
{
  if (text == "!") return UnaryOp::Not;
  if (text == "-") return UnaryOp::Neg;
  return std::nullopt;
}

std::optional<WindowOp> parse_window_op(std::string_view text) noexcept
{
  static constexpr std::array<WindowOp, 7> k_ops = {
    WindowOp::Sum, WindowOp::Product, WindowOp::Average, WindowOp::Count,
    WindowOp::Integral, WindowOp::Min, WindowOp::Max,
  };
  for (const WindowOp op : k_ops) {
    if (to_string(op) == text) {
      return op;
    }
  }
  if (text == "avg") {
    return WindowOp::Average;
  }
  return std::nullopt;
}

}  // namespace lola
