// lola/sema/types/type_term.cpp - Inference-time type terms
#include "lola/sema/types/type_term.hpp"

#include <utility>

namespace lola
{

namespace
{

/// Placeholder order: {numeric} < {integer} < {float}
int placeholder_rank(TermKind kind)
{
  switch (kind) {
    case TermKind::Numeric:
      return 0;
    case TermKind::Integer:
      return 1;
    case TermKind::Float:
      return 2;
    default:
      return -1;
  }
}

bool placeholder_accepts(TermKind placeholder, TypeKind concrete)
{
  switch (placeholder) {
    case TermKind::Numeric:
    case TermKind::Integer:
      return is_numeric_kind(concrete);
    case TermKind::Float:
      return is_float_kind(concrete);
    default:
      return false;
  }
}

/// Join ignoring units; nullopt on a shape conflict.
std::optional<TypeTerm> merge_shape(const TypeTerm & a, const TypeTerm & b)
{
  if (a.kind == TermKind::Option || b.kind == TermKind::Option) {
    if (a.kind == b.kind) return a;
    return std::nullopt;
  }
  if (a.kind == TermKind::Tuple || b.kind == TermKind::Tuple) {
    if (a.kind == b.kind && a.children.size() == b.children.size()) return a;
    return std::nullopt;
  }

  if (a.kind == TermKind::Concrete && b.kind == TermKind::Concrete) {
    if (a.concrete == b.concrete) return a;
    return std::nullopt;
  }
  if (a.kind == TermKind::Concrete) {
    if (placeholder_accepts(b.kind, a.concrete)) return a;
    return std::nullopt;
  }
  if (b.kind == TermKind::Concrete) {
    if (placeholder_accepts(a.kind, b.concrete)) return b;
    return std::nullopt;
  }

  // Two placeholders
  return placeholder_rank(a.kind) >= placeholder_rank(b.kind) ? a : b;
}

}  // namespace

// ============================================================================
// TypeTerm
// ============================================================================

TypeTerm TypeTerm::error()
{
  TypeTerm t;
  t.kind = TermKind::Error;
  return t;
}

TypeTerm TypeTerm::numeric(std::optional<Unit> unit)
{
  TypeTerm t;
  t.kind = TermKind::Numeric;
  t.unit = unit;
  return t;
}

TypeTerm TypeTerm::integer(std::optional<Unit> unit)
{
  TypeTerm t;
  t.kind = TermKind::Integer;
  t.unit = unit;
  return t;
}

TypeTerm TypeTerm::floating(std::optional<Unit> unit)
{
  TypeTerm t;
  t.kind = TermKind::Float;
  t.unit = unit;
  return t;
}

TypeTerm TypeTerm::primitive(TypeKind kind, std::optional<Unit> unit)
{
  TypeTerm t;
  t.kind = TermKind::Concrete;
  t.concrete = kind;
  t.unit = is_numeric_kind(kind) ? unit : std::nullopt;
  return t;
}

TypeTerm TypeTerm::option(VarId inner)
{
  TypeTerm t;
  t.kind = TermKind::Option;
  t.children.push_back(inner);
  return t;
}

TypeTerm TypeTerm::tuple(std::vector<VarId> elements)
{
  TypeTerm t;
  t.kind = TermKind::Tuple;
  t.children = std::move(elements);
  return t;
}

bool TypeTerm::is_numeric_like() const noexcept
{
  switch (kind) {
    case TermKind::Numeric:
    case TermKind::Integer:
    case TermKind::Float:
      return true;
    case TermKind::Concrete:
      return is_numeric_kind(concrete);
    default:
      return false;
  }
}

TypeTerm TypeTerm::without_unit() const
{
  TypeTerm t = *this;
  t.unit.reset();
  return t;
}

std::string TypeTerm::to_string() const
{
  std::string s;
  switch (kind) {
    case TermKind::Unknown:
      return "?";
    case TermKind::Error:
      return "<error>";
    case TermKind::Option:
      return "Option<..>";
    case TermKind::Tuple:
      return "(" + std::to_string(children.size()) + "-tuple)";
    case TermKind::Numeric:
      s = "{numeric}";
      break;
    case TermKind::Integer:
      s = "{integer}";
      break;
    case TermKind::Float:
      s = "{float}";
      break;
    case TermKind::Concrete:
      s = std::string(lola::to_string(concrete));
      break;
  }
  if (unit && !unit->is_dimensionless()) {
    s += "<" + unit->to_string() + ">";
  }
  return s;
}

// ============================================================================
// Merge
// ============================================================================

std::optional<TypeTerm> TypeTermMerge::operator()(const TypeTerm & a, const TypeTerm & b) const
{
  if (a.is_error() || b.is_error()) return TypeTerm::error();
  if (a.is_unknown()) return b;
  if (b.is_unknown()) return a;

  auto merged = merge_shape(a, b);
  if (!merged) return std::nullopt;

  if (!merged->is_numeric_like()) {
    merged->unit.reset();
    return merged;
  }
  if (a.unit && b.unit && *a.unit != *b.unit) {
    return std::nullopt;
  }
  merged->unit = a.unit ? a.unit : b.unit;
  return merged;
}

bool is_unit_conflict(const TypeTerm & a, const TypeTerm & b)
{
  if (!a.unit || !b.unit || *a.unit == *b.unit) return false;
  return TypeTermMerge{}(a.without_unit(), b.without_unit()).has_value();
}

}  // namespace lola
