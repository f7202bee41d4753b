// lola/basic/rational.hpp - Exact rational numbers
//
// All frequency and duration arithmetic in the frontend goes through
// Rational so that scheduling decisions never depend on floating point.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lola
{

/**
 * An exact rational number num/den.
 *
 * Values are always normalized: the denominator is positive and
 * gcd(|num|, den) == 1. Zero is represented as 0/1.
 *
 * Arithmetic is carried out in 128-bit intermediates; a result that does not
 * fit into 64 bits after reduction throws std::overflow_error.
 */
class Rational
{
public:
  constexpr Rational() noexcept = default;

  /// Construct from an integer.
  constexpr Rational(int64_t value) noexcept  // NOLINT(google-explicit-constructor)
  : num_(value)
  {
  }

  /// Construct num/den, normalizing. Throws std::invalid_argument if den == 0.
  Rational(int64_t num, int64_t den);

  /**
   * Parse a non-negative decimal literal such as "12", "0.25" or "1.5e3".
   *
   * @return std::nullopt if the text is not a decimal literal
   */
  [[nodiscard]] static std::optional<Rational> parse(std::string_view text);

  [[nodiscard]] constexpr int64_t numerator() const noexcept { return num_; }
  [[nodiscard]] constexpr int64_t denominator() const noexcept { return den_; }

  [[nodiscard]] constexpr bool is_zero() const noexcept { return num_ == 0; }
  [[nodiscard]] constexpr bool is_positive() const noexcept { return num_ > 0; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return num_ < 0; }
  [[nodiscard]] constexpr bool is_integer() const noexcept { return den_ == 1; }

  /// 1/x. Throws std::domain_error for zero.
  [[nodiscard]] Rational reciprocal() const;

  /// Largest integer <= value
  [[nodiscard]] int64_t floor() const noexcept;

  /// Smallest integer >= value
  [[nodiscard]] int64_t ceil() const noexcept;

  /// Approximate value, for display only.
  [[nodiscard]] double to_double() const noexcept
  {
    return static_cast<double>(num_) / static_cast<double>(den_);
  }

  /// "3/2", "5" or "-1/4"
  [[nodiscard]] std::string to_string() const;

  Rational operator-() const;

  friend Rational operator+(const Rational & a, const Rational & b);
  friend Rational operator-(const Rational & a, const Rational & b);
  friend Rational operator*(const Rational & a, const Rational & b);
  friend Rational operator/(const Rational & a, const Rational & b);

  Rational & operator+=(const Rational & o) { return *this = *this + o; }
  Rational & operator-=(const Rational & o) { return *this = *this - o; }
  Rational & operator*=(const Rational & o) { return *this = *this * o; }
  Rational & operator/=(const Rational & o) { return *this = *this / o; }

  friend bool operator==(const Rational & a, const Rational & b) noexcept
  {
    return a.num_ == b.num_ && a.den_ == b.den_;
  }
  friend bool operator!=(const Rational & a, const Rational & b) noexcept { return !(a == b); }
  friend bool operator<(const Rational & a, const Rational & b) noexcept;
  friend bool operator>(const Rational & a, const Rational & b) noexcept { return b < a; }
  friend bool operator<=(const Rational & a, const Rational & b) noexcept { return !(b < a); }
  friend bool operator>=(const Rational & a, const Rational & b) noexcept { return !(a < b); }

private:
  static Rational from_wide(__int128 num, __int128 den);

  int64_t num_ = 0;
  int64_t den_ = 1;
};

/**
 * Greatest common divisor of two non-negative rationals.
 *
 * gcd(a/b, c/d) = gcd(a, c) / lcm(b, d): the largest rational of which both
 * arguments are integer multiples. gcd(0, x) == x.
 * Throws std::domain_error for negative arguments.
 */
[[nodiscard]] Rational gcd(const Rational & a, const Rational & b);

/**
 * Least common multiple of two positive rationals.
 *
 * lcm(a/b, c/d) = lcm(a, c) / gcd(b, d): the smallest rational that is an
 * integer multiple of both arguments.
 * Throws std::domain_error for non-positive arguments.
 */
[[nodiscard]] Rational lcm(const Rational & a, const Rational & b);

/// True if `a` is an exact integer multiple of `b` (b != 0). Never overflows.
[[nodiscard]] bool is_integer_multiple(const Rational & a, const Rational & b) noexcept;

}  // namespace lola
