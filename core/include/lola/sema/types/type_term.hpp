// lola/sema/types/type_term.hpp - Inference-time type terms
//
// TypeTerm is the value attached to a type unification variable. It extends
// the resolved Type lattice with placeholders for literals ({integer},
// {float}, {numeric}) and refers to the element types of Option and Tuple
// through further unification variables.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "lola/basic/quantity.hpp"
#include "lola/sema/types/type.hpp"
#include "lola/sema/unify/unifier.hpp"

namespace lola
{

enum class TermKind : uint8_t {
  Unknown,   ///< unconstrained
  Numeric,   ///< {numeric}: some integer or float type
  Integer,   ///< {integer}: integer literal, also usable as float
  Float,     ///< {float}: some float type
  Concrete,  ///< a primitive TypeKind
  Option,    ///< Option of children[0]
  Tuple,     ///< tuple of children
  Error,     ///< conflict already reported
};

struct TypeTerm
{
  TermKind kind = TermKind::Unknown;

  /// Primitive kind (Concrete only)
  TypeKind concrete = TypeKind::Error;

  /// Unit of numeric terms; nullopt while unconstrained
  std::optional<Unit> unit;

  /// Element variables (Option: one, Tuple: n)
  std::vector<VarId> children;

  [[nodiscard]] static TypeTerm unknown() { return TypeTerm{}; }
  [[nodiscard]] static TypeTerm error();
  [[nodiscard]] static TypeTerm numeric(std::optional<Unit> unit = std::nullopt);
  [[nodiscard]] static TypeTerm integer(std::optional<Unit> unit = std::nullopt);
  [[nodiscard]] static TypeTerm floating(std::optional<Unit> unit = std::nullopt);
  [[nodiscard]] static TypeTerm primitive(TypeKind kind, std::optional<Unit> unit = std::nullopt);
  [[nodiscard]] static TypeTerm option(VarId inner);
  [[nodiscard]] static TypeTerm tuple(std::vector<VarId> elements);

  [[nodiscard]] bool is_unknown() const noexcept { return kind == TermKind::Unknown; }
  [[nodiscard]] bool is_error() const noexcept { return kind == TermKind::Error; }
  [[nodiscard]] bool is_structured() const noexcept
  {
    return kind == TermKind::Option || kind == TermKind::Tuple;
  }

  /// May still become (or already is) a numeric type
  [[nodiscard]] bool is_numeric_like() const noexcept;

  /// Same term with the unit left open
  [[nodiscard]] TypeTerm without_unit() const;

  /// Shallow rendering: "{integer}", "Float64<s>", "Option<..>"
  [[nodiscard]] std::string to_string() const;

  bool operator==(const TypeTerm & o) const
  {
    return kind == o.kind && concrete == o.concrete && unit == o.unit && children == o.children;
  }
  bool operator!=(const TypeTerm & o) const { return !(*this == o); }
};

/**
 * Join of two type terms.
 *
 * Option and Tuple join shape-wise only; their children are unified by the
 * type checker before the parents are merged.
 */
struct TypeTermMerge
{
  std::optional<TypeTerm> operator()(const TypeTerm & a, const TypeTerm & b) const;
};

/// `a` and `b` agree on everything except a unit.
[[nodiscard]] bool is_unit_conflict(const TypeTerm & a, const TypeTerm & b);

using TypeUnifier = Unifier<TypeTerm, TypeTermMerge>;

}  // namespace lola
