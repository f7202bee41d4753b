// lola/sema/types/type.hpp - Semantic value types
//
// Resolved types of streams and expressions. Types are interned by
// TypeContext, so two types are equal iff their pointers are equal.
//
#pragma once

#include <cstdint>
#include <deque>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lola/basic/quantity.hpp"

namespace lola
{

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind : uint8_t {
  // Primitive types
  Bool,
  Int8,
  Int16,
  Int32,
  Int64,
  UInt8,
  UInt16,
  UInt32,
  UInt64,
  Float32,
  Float64,
  String,

  // Composite types
  Tuple,   ///< (T1, T2, ...)
  Option,  ///< Option<T>, the result of history access

  // Error
  Error,  ///< Error recovery placeholder
};

// ============================================================================
// Type
// ============================================================================

/**
 * Resolved semantic type.
 *
 * Numeric types carry a unit (time-dimension exponent). Bool, String and the
 * composite kinds are always dimensionless.
 */
struct Type
{
  TypeKind kind = TypeKind::Error;

  /// For numeric types
  Unit unit;

  /// For Option: the inner type
  const Type * inner = nullptr;

  /// For Tuple: element types
  std::vector<const Type *> elements;

  [[nodiscard]] bool is_signed_integer() const noexcept
  {
    return kind == TypeKind::Int8 || kind == TypeKind::Int16 || kind == TypeKind::Int32 ||
           kind == TypeKind::Int64;
  }

  [[nodiscard]] bool is_unsigned_integer() const noexcept
  {
    return kind == TypeKind::UInt8 || kind == TypeKind::UInt16 || kind == TypeKind::UInt32 ||
           kind == TypeKind::UInt64;
  }

  [[nodiscard]] bool is_integer() const noexcept
  {
    return is_signed_integer() || is_unsigned_integer();
  }

  [[nodiscard]] bool is_float() const noexcept
  {
    return kind == TypeKind::Float32 || kind == TypeKind::Float64;
  }

  [[nodiscard]] bool is_numeric() const noexcept { return is_integer() || is_float(); }
  [[nodiscard]] bool is_option() const noexcept { return kind == TypeKind::Option; }
  [[nodiscard]] bool is_tuple() const noexcept { return kind == TypeKind::Tuple; }
  [[nodiscard]] bool is_error() const noexcept { return kind == TypeKind::Error; }

  /// "Int64", "Float64<s>", "Option<Bool>", "(Int8, String)"
  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] std::string_view to_string(TypeKind kind) noexcept;

/// Primitive kind for a built-in type name ("Int64", "Float32", "Bool", ...)
[[nodiscard]] std::optional<TypeKind> lookup_primitive(std::string_view name) noexcept;

[[nodiscard]] bool is_numeric_kind(TypeKind kind) noexcept;
[[nodiscard]] bool is_integer_kind(TypeKind kind) noexcept;
[[nodiscard]] bool is_float_kind(TypeKind kind) noexcept;

// ============================================================================
// Type Context
// ============================================================================

/**
 * Owns and interns all semantic types of one analysis run.
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  [[nodiscard]] const Type * bool_type() const noexcept { return bool_; }
  [[nodiscard]] const Type * string_type() const noexcept { return string_; }
  [[nodiscard]] const Type * error_type() const noexcept { return error_; }

  /// Primitive type with a unit; non-numeric kinds ignore the unit.
  const Type * get_primitive(TypeKind kind, Unit unit = Unit::dimensionless());

  const Type * get_option(const Type * inner);

  const Type * get_tuple(const std::vector<const Type *> & elements);

  [[nodiscard]] size_t size() const noexcept { return types_.size(); }

private:
  const Type * intern(Type candidate);

  std::pmr::monotonic_buffer_resource arena_{4096};
  // Interned types are handed out by pointer; a deque keeps addresses stable.
  std::pmr::deque<Type> types_{&arena_};

  const Type * bool_ = nullptr;
  const Type * string_ = nullptr;
  const Type * error_ = nullptr;
};

}  // namespace lola
