// lola/basic/quantity.cpp - Physical quantities over the time dimension
#include "lola/basic/quantity.hpp"

#include <fmt/core.h>

#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace lola
{

namespace
{

struct SuffixInfo
{
  std::string_view suffix;
  Rational factor;  // multiply magnitude by this to get base units
  Unit unit;
};

const std::array<SuffixInfo, 11> & suffix_table()
{
  static const std::array<SuffixInfo, 11> k_table = {{
    {"ns", Rational(1, 1000000000), Unit::seconds()},
    {"us", Rational(1, 1000000), Unit::seconds()},
    {"ms", Rational(1, 1000), Unit::seconds()},
    {"s", Rational(1), Unit::seconds()},
    {"min", Rational(60), Unit::seconds()},
    {"h", Rational(3600), Unit::seconds()},
    {"d", Rational(86400), Unit::seconds()},
    {"Hz", Rational(1), Unit::hertz()},
    {"kHz", Rational(1000), Unit::hertz()},
    {"MHz", Rational(1000000), Unit::hertz()},
    {"GHz", Rational(1000000000), Unit::hertz()},
  }};
  return k_table;
}

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.remove_suffix(1);
  }
  return s;
}

}  // namespace

std::string Unit::to_string() const
{
  switch (time_exponent) {
    case 0:
      return "";
    case 1:
      return "s";
    case -1:
      return "Hz";
    default:
      return fmt::format("s^{}", time_exponent);
  }
}

QuantityResult QuantityResult::success(Quantity q)
{
  QuantityResult r;
  r.value = std::move(q);
  return r;
}

QuantityResult QuantityResult::mismatch(std::string msg)
{
  QuantityResult r;
  r.unit_mismatch = true;
  r.error = std::move(msg);
  return r;
}

QuantityResult QuantityResult::fail(std::string msg)
{
  QuantityResult r;
  r.error = std::move(msg);
  return r;
}

std::optional<Quantity> Quantity::from_literal(std::string_view magnitude, std::string_view suffix)
{
  const auto value = Rational::parse(trim(magnitude));
  if (!value) {
    return std::nullopt;
  }

  suffix = trim(suffix);
  if (suffix.empty()) {
    return Quantity(*value, Unit::dimensionless());
  }
  for (const auto & info : suffix_table()) {
    if (info.suffix != suffix) continue;
    try {
      return Quantity(*value * info.factor, info.unit);
    } catch (const std::overflow_error &) {
      // e.g. "1e18d": valid digits, but not representable in seconds
      return std::nullopt;
    }
  }
  return std::nullopt;
}

std::optional<Quantity> Quantity::parse(std::string_view text)
{
  text = trim(text);
  size_t split = 0;
  while (split < text.size()) {
    const char c = text[split];
    const bool numeric = std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '_';
    // exponent marker only when followed by a digit or sign ("1e3" vs "1 h")
    const bool exponent = (c == 'e' || c == 'E') && split + 1 < text.size() &&
                          (std::isdigit(static_cast<unsigned char>(text[split + 1])) != 0 ||
                           text[split + 1] == '-' || text[split + 1] == '+');
    if (exponent) {
      split += 2;
      continue;
    }
    if (!numeric) {
      break;
    }
    ++split;
  }
  return from_literal(text.substr(0, split), text.substr(split));
}

QuantityResult Quantity::add(const Quantity & o) const
{
  if (unit_ != o.unit_) {
    return QuantityResult::mismatch(
      fmt::format("cannot add {} to {}", o.to_string(), to_string()));
  }
  return QuantityResult::success(Quantity(magnitude_ + o.magnitude_, unit_));
}

QuantityResult Quantity::sub(const Quantity & o) const
{
  if (unit_ != o.unit_) {
    return QuantityResult::mismatch(
      fmt::format("cannot subtract {} from {}", o.to_string(), to_string()));
  }
  return QuantityResult::success(Quantity(magnitude_ - o.magnitude_, unit_));
}

Quantity Quantity::mul(const Quantity & o) const
{
  return {magnitude_ * o.magnitude_, unit_ * o.unit_};
}

QuantityResult Quantity::div(const Quantity & o) const
{
  if (o.magnitude_.is_zero()) {
    return QuantityResult::fail("division by a zero quantity");
  }
  return QuantityResult::success(Quantity(magnitude_ / o.magnitude_, unit_ / o.unit_));
}

std::optional<int> Quantity::compare(const Quantity & o) const
{
  if (unit_ != o.unit_) {
    return std::nullopt;
  }
  if (magnitude_ < o.magnitude_) return -1;
  if (o.magnitude_ < magnitude_) return 1;
  return 0;
}

QuantityResult Quantity::to_frequency() const
{
  if (!magnitude_.is_positive()) {
    return QuantityResult::fail(fmt::format("'{}' is not a positive quantity", to_string()));
  }
  if (unit_.is_frequency()) {
    return QuantityResult::success(*this);
  }
  if (unit_.is_duration()) {
    return QuantityResult::success(Quantity::hertz(magnitude_.reciprocal()));
  }
  return QuantityResult::mismatch(
    fmt::format("expected a frequency or a period, found '{}'", to_string()));
}

QuantityResult Quantity::to_period() const
{
  if (!magnitude_.is_positive()) {
    return QuantityResult::fail(fmt::format("'{}' is not a positive quantity", to_string()));
  }
  if (unit_.is_duration()) {
    return QuantityResult::success(*this);
  }
  if (unit_.is_frequency()) {
    return QuantityResult::success(Quantity::seconds(magnitude_.reciprocal()));
  }
  return QuantityResult::mismatch(
    fmt::format("expected a duration or a frequency, found '{}'", to_string()));
}

std::string Quantity::to_string() const { return magnitude_.to_string() + unit_.to_string(); }

}  // namespace lola
