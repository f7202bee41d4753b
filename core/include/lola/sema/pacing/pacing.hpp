// lola/sema/pacing/pacing.hpp - Evaluation clocks of streams
//
// A pacing is either a periodic clock (exact frequency in Hz) or an
// event-driven clock fired by an activation condition over input streams.
// Pacings are the values of the pacing unifier; PacingMerge implements the
// lattice join under a configurable policy.
//
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "lola/basic/rational.hpp"
#include "lola/sema/unify/unifier.hpp"

namespace lola
{

// ============================================================================
// Activation Condition
// ============================================================================

/**
 * Boolean combination of input streams, kept in disjunctive normal form.
 *
 * Each clause is a sorted set of stream ids that must all have fired. The
 * clause list is sorted and free of subsumed clauses, so structurally equal
 * conditions compare equal.
 */
class ActivationCondition
{
public:
  using Conjunction = std::vector<uint32_t>;

  ActivationCondition() = default;

  /// Fires whenever `stream` produces a new value.
  [[nodiscard]] static ActivationCondition stream(uint32_t stream);

  /// `a | b`
  [[nodiscard]] ActivationCondition disjunction(const ActivationCondition & other) const;

  /// `a & b`
  [[nodiscard]] ActivationCondition conjunction(const ActivationCondition & other) const;

  /**
   * Whenever this condition holds, `other` holds too.
   *
   * For positive DNF this is: every clause here contains some clause of
   * `other`.
   */
  [[nodiscard]] bool implies(const ActivationCondition & other) const;

  [[nodiscard]] bool empty() const noexcept { return clauses_.empty(); }
  [[nodiscard]] const std::vector<Conjunction> & clauses() const noexcept { return clauses_; }

  /// All stream ids mentioned, sorted
  [[nodiscard]] std::vector<uint32_t> streams() const;

  /// "a & b | c"; `name_of` maps stream ids to names
  [[nodiscard]] std::string to_string(
    const std::function<std::string(uint32_t)> & name_of = {}) const;

  bool operator==(const ActivationCondition & o) const { return clauses_ == o.clauses_; }
  bool operator!=(const ActivationCondition & o) const { return !(*this == o); }

private:
  void normalize();

  std::vector<Conjunction> clauses_;
};

// ============================================================================
// Pacing
// ============================================================================

enum class PacingKind : uint8_t {
  Unknown,      ///< not yet constrained
  Periodic,     ///< fixed frequency
  EventDriven,  ///< fired by input arrivals
  Error,        ///< a diagnostic was already reported
};

struct Pacing
{
  PacingKind kind = PacingKind::Unknown;

  /// Frequency in Hz (Periodic only)
  Rational frequency;

  /// Firing condition (EventDriven only)
  ActivationCondition activation;

  [[nodiscard]] static Pacing unknown() { return Pacing{}; }
  [[nodiscard]] static Pacing periodic(Rational hz);
  [[nodiscard]] static Pacing event_driven(ActivationCondition condition);
  [[nodiscard]] static Pacing error();

  [[nodiscard]] bool is_unknown() const noexcept { return kind == PacingKind::Unknown; }
  [[nodiscard]] bool is_periodic() const noexcept { return kind == PacingKind::Periodic; }
  [[nodiscard]] bool is_event_driven() const noexcept { return kind == PacingKind::EventDriven; }
  [[nodiscard]] bool is_error() const noexcept { return kind == PacingKind::Error; }

  /// Period 1/f in seconds (Periodic only)
  [[nodiscard]] Rational period() const { return frequency.reciprocal(); }

  /// "10Hz", "a | b", "?"
  [[nodiscard]] std::string to_string(
    const std::function<std::string(uint32_t)> & name_of = {}) const;

  bool operator==(const Pacing & o) const;
  bool operator!=(const Pacing & o) const { return !(*this == o); }
};

// ============================================================================
// Policy
// ============================================================================

/// How the event-driven dependencies of an unannotated stream combine.
enum class EventCombination : uint8_t {
  Any,  ///< fire when any dependency fires (disjunction)
  All,  ///< fire only when all dependencies fire (conjunction)
};

/// When two periodic clocks are compatible.
enum class FrequencyRule : uint8_t {
  IntegerMultiple,  ///< the faster frequency is an integer multiple of the slower
  Equal,            ///< frequencies must match exactly
};

struct PacingPolicy
{
  EventCombination event_combination = EventCombination::Any;
  FrequencyRule frequency_rule = FrequencyRule::IntegerMultiple;
};

/// Whether periodic clocks `a` and `b` (Hz) may be combined under `rule`.
[[nodiscard]] bool frequencies_compatible(
  const Rational & a, const Rational & b, FrequencyRule rule);

// ============================================================================
// Unification
// ============================================================================

/**
 * Join of two pacings.
 *
 * Unknown yields to the other side and Error absorbs everything. Two periodic
 * clocks join to the faster one if compatible; two event-driven clocks join by
 * the configured combination. Periodic and event-driven never join.
 */
struct PacingMerge
{
  PacingPolicy policy;

  std::optional<Pacing> operator()(const Pacing & a, const Pacing & b) const;
};

using PacingUnifier = Unifier<Pacing, PacingMerge>;

}  // namespace lola
