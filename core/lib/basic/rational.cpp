// lola/basic/rational.cpp - Exact rational numbers
#include "lola/basic/rational.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace lola
{

namespace
{

using Wide = __int128;

Wide wide_abs(Wide v) { return v < 0 ? -v : v; }

Wide wide_gcd(Wide a, Wide b)
{
  a = wide_abs(a);
  b = wide_abs(b);
  while (b != 0) {
    const Wide t = a % b;
    a = b;
    b = t;
  }
  return a;
}

bool fits_int64(Wide v)
{
  return v >= static_cast<Wide>(std::numeric_limits<int64_t>::min()) &&
         v <= static_cast<Wide>(std::numeric_limits<int64_t>::max());
}

// Decimal accumulation step; false once the value leaves the int64 range.
bool checked_mul_add(Wide & acc, int factor, int addend)
{
  const Wide limit = static_cast<Wide>(std::numeric_limits<int64_t>::max());
  acc = acc * factor + addend;
  return acc <= limit;
}

}  // namespace

Rational::Rational(int64_t num, int64_t den)
{
  if (den == 0) {
    throw std::invalid_argument("rational with zero denominator");
  }
  *this = from_wide(num, den);
}

Rational Rational::from_wide(Wide num, Wide den)
{
  if (den == 0) {
    throw std::invalid_argument("rational with zero denominator");
  }
  if (den < 0) {
    num = -num;
    den = -den;
  }
  const Wide g = wide_gcd(num, den);
  if (g > 1) {
    num /= g;
    den /= g;
  }
  if (!fits_int64(num) || !fits_int64(den)) {
    throw std::overflow_error("rational arithmetic overflow");
  }
  Rational r;
  r.num_ = static_cast<int64_t>(num);
  r.den_ = static_cast<int64_t>(den);
  return r;
}

std::optional<Rational> Rational::parse(std::string_view text)
{
  if (text.empty()) {
    return std::nullopt;
  }

  Wide mantissa = 0;
  Wide scale = 1;
  bool seen_digit = false;
  bool seen_point = false;
  size_t i = 0;

  for (; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '_') {
      continue;
    }
    if (c == '.') {
      if (seen_point) return std::nullopt;
      seen_point = true;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      break;
    }
    seen_digit = true;
    if (!checked_mul_add(mantissa, 10, c - '0')) return std::nullopt;
    if (seen_point) {
      if (!checked_mul_add(scale, 10, 0)) return std::nullopt;
    }
  }
  if (!seen_digit) {
    return std::nullopt;
  }

  int exponent = 0;
  if (i < text.size()) {
    if (text[i] != 'e' && text[i] != 'E') return std::nullopt;
    ++i;
    bool negative = false;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
      negative = text[i] == '-';
      ++i;
    }
    if (i >= text.size()) return std::nullopt;
    for (; i < text.size(); ++i) {
      if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) return std::nullopt;
      exponent = exponent * 10 + (text[i] - '0');
      if (exponent > 18) return std::nullopt;
    }
    if (negative) exponent = -exponent;
  }

  for (; exponent > 0; --exponent) {
    if (!checked_mul_add(mantissa, 10, 0)) return std::nullopt;
  }
  for (; exponent < 0; ++exponent) {
    if (!checked_mul_add(scale, 10, 0)) return std::nullopt;
  }
  return from_wide(mantissa, scale);
}

Rational Rational::reciprocal() const
{
  if (num_ == 0) {
    throw std::domain_error("reciprocal of zero");
  }
  return from_wide(den_, num_);
}

int64_t Rational::floor() const noexcept
{
  int64_t q = num_ / den_;
  if (num_ % den_ != 0 && num_ < 0) {
    --q;
  }
  return q;
}

int64_t Rational::ceil() const noexcept
{
  int64_t q = num_ / den_;
  if (num_ % den_ != 0 && num_ > 0) {
    ++q;
  }
  return q;
}

std::string Rational::to_string() const
{
  if (den_ == 1) {
    return std::to_string(num_);
  }
  return std::to_string(num_) + "/" + std::to_string(den_);
}

Rational Rational::operator-() const { return from_wide(-static_cast<Wide>(num_), den_); }

Rational operator+(const Rational & a, const Rational & b)
{
  return Rational::from_wide(
    static_cast<Wide>(a.num_) * b.den_ + static_cast<Wide>(b.num_) * a.den_,
    static_cast<Wide>(a.den_) * b.den_);
}

Rational operator-(const Rational & a, const Rational & b)
{
  return Rational::from_wide(
    static_cast<Wide>(a.num_) * b.den_ - static_cast<Wide>(b.num_) * a.den_,
    static_cast<Wide>(a.den_) * b.den_);
}

Rational operator*(const Rational & a, const Rational & b)
{
  return Rational::from_wide(
    static_cast<Wide>(a.num_) * b.num_, static_cast<Wide>(a.den_) * b.den_);
}

Rational operator/(const Rational & a, const Rational & b)
{
  if (b.num_ == 0) {
    throw std::domain_error("division by zero");
  }
  return Rational::from_wide(
    static_cast<Wide>(a.num_) * b.den_, static_cast<Wide>(a.den_) * b.num_);
}

bool operator<(const Rational & a, const Rational & b) noexcept
{
  return static_cast<Wide>(a.num_) * b.den_ < static_cast<Wide>(b.num_) * a.den_;
}

Rational gcd(const Rational & a, const Rational & b)
{
  if (a.is_negative() || b.is_negative()) {
    throw std::domain_error("gcd of negative rational");
  }
  if (a.is_zero()) return b;
  if (b.is_zero()) return a;

  const Wide num = wide_gcd(a.numerator(), b.numerator());
  const Wide den_g = wide_gcd(a.denominator(), b.denominator());
  const Wide den = static_cast<Wide>(a.denominator()) / den_g * b.denominator();
  if (!fits_int64(num) || !fits_int64(den)) {
    throw std::overflow_error("rational arithmetic overflow");
  }
  return Rational(static_cast<int64_t>(num), static_cast<int64_t>(den));
}

Rational lcm(const Rational & a, const Rational & b)
{
  if (!a.is_positive() || !b.is_positive()) {
    throw std::domain_error("lcm of non-positive rational");
  }
  const Wide num_g = wide_gcd(a.numerator(), b.numerator());
  const Wide num = static_cast<Wide>(a.numerator()) / num_g * b.numerator();
  const Wide den = wide_gcd(a.denominator(), b.denominator());
  if (!fits_int64(num) || !fits_int64(den)) {
    throw std::overflow_error("rational arithmetic overflow");
  }
  return Rational(static_cast<int64_t>(num), static_cast<int64_t>(den));
}

bool is_integer_multiple(const Rational & a, const Rational & b) noexcept
{
  if (b.is_zero()) {
    return false;
  }
  // a / b = (an * bd) / (ad * bn); both products fit the wide type.
  const Wide num = static_cast<Wide>(a.numerator()) * b.denominator();
  const Wide den = static_cast<Wide>(a.denominator()) * b.numerator();
  return num % den == 0;
}

}  // namespace lola
