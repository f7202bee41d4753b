// lola/ir/schedule.cpp - Static schedule of time-driven streams
#include "lola/ir/schedule.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace lola::ir
{

std::optional<Schedule> Schedule::from(const StreamIr & ir)
{
  if (ir.time_driven.empty()) return std::nullopt;

  Schedule schedule;
  schedule.gcd = ir.time_driven.front().extend_period;
  schedule.hyper_period = ir.time_driven.front().extend_period;
  Rational ratio;
  try {
    for (const auto & s : ir.time_driven) {
      schedule.gcd = lola::gcd(schedule.gcd, s.extend_period);
      schedule.hyper_period = lola::lcm(schedule.hyper_period, s.extend_period);
    }
    ratio = schedule.hyper_period / schedule.gcd;
  } catch (const std::overflow_error &) {
    throw std::length_error("hyper period of the time-driven streams is not representable");
  }

  if (ratio.numerator() > static_cast<int64_t>(k_max_steps)) {
    throw std::length_error(
      "schedule needs " + ratio.to_string() + " steps per hyper period (limit " +
      std::to_string(k_max_steps) + ")");
  }
  const auto steps = static_cast<size_t>(ratio.numerator());

  // due[i]: streams due at the end of step i + 1
  std::vector<std::vector<StreamId>> due(steps);
  for (const auto & s : ir.time_driven) {
    const auto every = static_cast<size_t>((s.extend_period / schedule.gcd).numerator());
    for (size_t k = every; k <= steps; k += every) {
      due[k - 1].push_back(s.reference);
    }
  }

  int64_t empty = 0;
  for (auto & step : due) {
    if (step.empty()) {
      ++empty;
      continue;
    }
    std::sort(step.begin(), step.end());
    schedule.deadlines.push_back(Deadline{schedule.gcd * Rational(empty + 1), std::move(step)});
    empty = 0;
  }
  if (empty > 0) {
    schedule.deadlines.push_back(Deadline{schedule.gcd * Rational(empty), {}});
  }
  return schedule;
}

}  // namespace lola::ir
