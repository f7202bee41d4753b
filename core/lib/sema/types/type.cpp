// lola/sema/types/type.cpp - Semantic type implementation
#include "lola/sema/types/type.hpp"

#include <array>
#include <utility>

namespace lola
{

namespace
{

struct PrimitiveName
{
  std::string_view name;
  TypeKind kind;
};

constexpr std::array<PrimitiveName, 12> k_primitive_names = {{
  {"Bool", TypeKind::Bool},
  {"Int8", TypeKind::Int8},
  {"Int16", TypeKind::Int16},
  {"Int32", TypeKind::Int32},
  {"Int64", TypeKind::Int64},
  {"UInt8", TypeKind::UInt8},
  {"UInt16", TypeKind::UInt16},
  {"UInt32", TypeKind::UInt32},
  {"UInt64", TypeKind::UInt64},
  {"Float32", TypeKind::Float32},
  {"Float64", TypeKind::Float64},
  {"String", TypeKind::String},
}};

bool same_structure(const Type & a, const Type & b)
{
  return a.kind == b.kind && a.unit == b.unit && a.inner == b.inner && a.elements == b.elements;
}

}  // namespace

std::string_view to_string(TypeKind kind) noexcept
{
  for (const auto & p : k_primitive_names) {
    if (p.kind == kind) {
      return p.name;
    }
  }
  switch (kind) {
    case TypeKind::Tuple:
      return "Tuple";
    case TypeKind::Option:
      return "Option";
    default:
      return "<error>";
  }
}

std::optional<TypeKind> lookup_primitive(std::string_view name) noexcept
{
  for (const auto & p : k_primitive_names) {
    if (p.name == name) {
      return p.kind;
    }
  }
  return std::nullopt;
}

bool is_integer_kind(TypeKind kind) noexcept
{
  return kind >= TypeKind::Int8 && kind <= TypeKind::UInt64;
}

bool is_float_kind(TypeKind kind) noexcept
{
  return kind == TypeKind::Float32 || kind == TypeKind::Float64;
}

bool is_numeric_kind(TypeKind kind) noexcept { return is_integer_kind(kind) || is_float_kind(kind); }

std::string Type::to_string() const
{
  switch (kind) {
    case TypeKind::Option:
      return "Option<" + (inner ? inner->to_string() : std::string("?")) + ">";
    case TypeKind::Tuple: {
      std::string s = "(";
      for (size_t i = 0; i < elements.size(); ++i) {
        if (i > 0) s += ", ";
        s += elements[i]->to_string();
      }
      return s + ")";
    }
    default:
      break;
  }
  std::string s(lola::to_string(kind));
  if (is_numeric() && !unit.is_dimensionless()) {
    s += "<" + unit.to_string() + ">";
  }
  return s;
}

TypeContext::TypeContext()
{
  bool_ = get_primitive(TypeKind::Bool);
  string_ = get_primitive(TypeKind::String);
  Type error;
  error.kind = TypeKind::Error;
  error_ = intern(std::move(error));
}

const Type * TypeContext::intern(Type candidate)
{
  for (const auto & t : types_) {
    if (same_structure(t, candidate)) {
      return &t;
    }
  }
  types_.push_back(std::move(candidate));
  return &types_.back();
}

const Type * TypeContext::get_primitive(TypeKind kind, Unit unit)
{
  Type t;
  t.kind = kind;
  t.unit = is_numeric_kind(kind) ? unit : Unit::dimensionless();
  return intern(std::move(t));
}

const Type * TypeContext::get_option(const Type * inner)
{
  Type t;
  t.kind = TypeKind::Option;
  t.inner = inner;
  return intern(std::move(t));
}

const Type * TypeContext::get_tuple(const std::vector<const Type *> & elements)
{
  Type t;
  t.kind = TypeKind::Tuple;
  t.elements = elements;
  return intern(std::move(t));
}

}  // namespace lola
