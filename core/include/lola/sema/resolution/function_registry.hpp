// lola/sema/resolution/function_registry.hpp - Built-in function library
//
// Functions are generic over one numeric type parameter T: every argument
// and the result have type T, and T must satisfy the signature's constraint.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace lola
{

enum class TypeConstraint : uint8_t {
  Numeric,        ///< any integer or float
  FloatingPoint,  ///< Float32 or Float64
};

struct FunctionSignature
{
  std::string_view name;
  size_t arity = 1;
  TypeConstraint constraint = TypeConstraint::Numeric;

  /// Arguments must carry no unit (transcendental functions)
  bool dimensionless = false;
};

/**
 * Lookup table for callable functions.
 *
 * The default-constructed registry contains the math library:
 * sqrt, sin, cos (dimensionless floats) and abs (any numeric).
 */
class FunctionRegistry
{
public:
  FunctionRegistry();

  /// Register a function; a later registration shadows an earlier one.
  void add(const FunctionSignature & sig);

  [[nodiscard]] const FunctionSignature * lookup(std::string_view name) const noexcept;

  [[nodiscard]] size_t size() const noexcept { return functions_.size(); }

private:
  std::vector<FunctionSignature> functions_;
};

}  // namespace lola
