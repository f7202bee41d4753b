// lola/ir/schedule.hpp - Static schedule of time-driven streams
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "lola/basic/rational.hpp"
#include "lola/ir/stream_ir.hpp"

namespace lola::ir
{

/// Wait `pause` seconds after the previous deadline, then evaluate `due`.
struct Deadline
{
  Rational pause;
  std::vector<StreamId> due;
};

/**
 * Repeating schedule over one hyper period.
 *
 * The hyper period is split into gcd-sized steps. A stream with period p is
 * due at every step that is a multiple of p / gcd. Runs of empty steps are
 * condensed into the pause of the next deadline; trailing empty steps become
 * a final deadline with nothing due.
 */
struct Schedule
{
  /// gcd of all periods: the longest safe wait between checks
  Rational gcd;

  /// lcm of all periods
  Rational hyper_period;

  std::vector<Deadline> deadlines;

  /// Upper bound on hyper_period / gcd
  static constexpr size_t k_max_steps = size_t{1} << 20;

  /**
   * Build the schedule of `ir`'s time-driven streams.
   *
   * @return std::nullopt if the IR has no time-driven streams
   * @throws std::length_error if the hyper period spans more than
   *         k_max_steps steps or does not fit a 64-bit rational
   */
  [[nodiscard]] static std::optional<Schedule> from(const StreamIr & ir);
};

}  // namespace lola::ir
