// lola/sema/resolution/function_registry.cpp - Built-in function library
#include "lola/sema/resolution/function_registry.hpp"

namespace lola
{

FunctionRegistry::FunctionRegistry()
{
  add({"sqrt", 1, TypeConstraint::FloatingPoint, true});
  add({"sin", 1, TypeConstraint::FloatingPoint, true});
  add({"cos", 1, TypeConstraint::FloatingPoint, true});
  add({"abs", 1, TypeConstraint::Numeric, false});
}

void FunctionRegistry::add(const FunctionSignature & sig) { functions_.push_back(sig); }

const FunctionSignature * FunctionRegistry::lookup(std::string_view name) const noexcept
{
  for (auto it = functions_.rbegin(); it != functions_.rend(); ++it) {
    if (it->name == name) {
      return &*it;
    }
  }
  return nullptr;
}

}  // namespace lola
