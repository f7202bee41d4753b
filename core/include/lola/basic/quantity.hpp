// lola/basic/quantity.hpp - Physical quantities over the time dimension
//
// Quantities appear in pacing annotations (`@ 10Hz`, `@ 100ms`), window
// durations and unit-suffixed literals. Every quantity is canonicalized to
// base units (seconds, hertz) when it is created.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "lola/basic/rational.hpp"

namespace lola
{

// ============================================================================
// Unit
// ============================================================================

/**
 * Unit of a quantity, expressed as the exponent of the time dimension.
 *
 * 0 = dimensionless, 1 = seconds (duration), -1 = hertz (frequency).
 */
struct Unit
{
  int time_exponent = 0;

  [[nodiscard]] static constexpr Unit dimensionless() noexcept { return Unit{0}; }
  [[nodiscard]] static constexpr Unit seconds() noexcept { return Unit{1}; }
  [[nodiscard]] static constexpr Unit hertz() noexcept { return Unit{-1}; }

  [[nodiscard]] constexpr bool is_dimensionless() const noexcept { return time_exponent == 0; }
  [[nodiscard]] constexpr bool is_duration() const noexcept { return time_exponent == 1; }
  [[nodiscard]] constexpr bool is_frequency() const noexcept { return time_exponent == -1; }

  [[nodiscard]] constexpr Unit operator*(Unit o) const noexcept
  {
    return Unit{time_exponent + o.time_exponent};
  }
  [[nodiscard]] constexpr Unit operator/(Unit o) const noexcept
  {
    return Unit{time_exponent - o.time_exponent};
  }
  [[nodiscard]] constexpr bool operator==(Unit o) const noexcept
  {
    return time_exponent == o.time_exponent;
  }
  [[nodiscard]] constexpr bool operator!=(Unit o) const noexcept { return !(*this == o); }

  /// "", "s", "Hz", "s^2", "s^-3"
  [[nodiscard]] std::string to_string() const;
};

// ============================================================================
// Quantity
// ============================================================================

struct QuantityResult;

/**
 * An exact magnitude in base units together with its unit.
 */
class Quantity
{
public:
  Quantity() = default;
  Quantity(Rational magnitude, Unit unit) : magnitude_(magnitude), unit_(unit) {}

  [[nodiscard]] static Quantity seconds(Rational s) { return {s, Unit::seconds()}; }
  [[nodiscard]] static Quantity hertz(Rational hz) { return {hz, Unit::hertz()}; }

  /**
   * Build a quantity from a decimal magnitude and a unit suffix.
   *
   * Recognized suffixes: ns, us, ms, s, min, h, d (durations) and
   * Hz, kHz, MHz, GHz (frequencies). An empty suffix is dimensionless.
   *
   * @return std::nullopt for an unknown suffix or a malformed magnitude
   */
  [[nodiscard]] static std::optional<Quantity> from_literal(
    std::string_view magnitude, std::string_view suffix);

  /// Parse "10Hz", "0.5s", "100 ms" or a bare number.
  [[nodiscard]] static std::optional<Quantity> parse(std::string_view text);

  [[nodiscard]] const Rational & magnitude() const noexcept { return magnitude_; }
  [[nodiscard]] Unit unit() const noexcept { return unit_; }

  [[nodiscard]] QuantityResult add(const Quantity & o) const;
  [[nodiscard]] QuantityResult sub(const Quantity & o) const;
  [[nodiscard]] Quantity mul(const Quantity & o) const;
  [[nodiscard]] QuantityResult div(const Quantity & o) const;

  /// -1, 0 or 1; fails on differing units.
  [[nodiscard]] std::optional<int> compare(const Quantity & o) const;

  /// Frequency in Hz; a duration is converted to its reciprocal.
  [[nodiscard]] QuantityResult to_frequency() const;

  /// Period in seconds; a frequency is converted to its reciprocal.
  [[nodiscard]] QuantityResult to_period() const;

  /// "10Hz", "1/2s"
  [[nodiscard]] std::string to_string() const;

  bool operator==(const Quantity & o) const noexcept
  {
    return magnitude_ == o.magnitude_ && unit_ == o.unit_;
  }
  bool operator!=(const Quantity & o) const noexcept { return !(*this == o); }

private:
  Rational magnitude_;
  Unit unit_;
};

/**
 * Result of a unit-checked quantity operation.
 */
struct QuantityResult
{
  std::optional<Quantity> value;

  /// Set when the operation failed because units were incompatible
  bool unit_mismatch = false;

  std::string error;

  [[nodiscard]] bool ok() const noexcept { return value.has_value(); }

  static QuantityResult success(Quantity q);
  static QuantityResult mismatch(std::string msg);
  static QuantityResult fail(std::string msg);
};

}  // namespace lola
