// lola/sema/pacing/pacing.cpp - Clock values and their join
#include "lola/sema/pacing/pacing.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace lola
{

namespace
{

// a ⊆ b for sorted vectors
bool is_subset(const ActivationCondition::Conjunction & a, const ActivationCondition::Conjunction & b)
{
  return std::includes(b.begin(), b.end(), a.begin(), a.end());
}

std::string default_name(uint32_t id) { return "#" + std::to_string(id); }

}  // namespace

// ============================================================================
// ActivationCondition
// ============================================================================

ActivationCondition ActivationCondition::stream(uint32_t stream)
{
  ActivationCondition c;
  c.clauses_.push_back(Conjunction{stream});
  return c;
}

ActivationCondition ActivationCondition::disjunction(const ActivationCondition & other) const
{
  ActivationCondition result = *this;
  result.clauses_.insert(result.clauses_.end(), other.clauses_.begin(), other.clauses_.end());
  result.normalize();
  return result;
}

ActivationCondition ActivationCondition::conjunction(const ActivationCondition & other) const
{
  if (empty()) return other;
  if (other.empty()) return *this;

  ActivationCondition result;
  for (const auto & lhs : clauses_) {
    for (const auto & rhs : other.clauses_) {
      Conjunction merged;
      std::set_union(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), std::back_inserter(merged));
      result.clauses_.push_back(std::move(merged));
    }
  }
  result.normalize();
  return result;
}

bool ActivationCondition::implies(const ActivationCondition & other) const
{
  if (other.empty()) return true;
  for (const auto & clause : clauses_) {
    const bool covered = std::any_of(
      other.clauses_.begin(), other.clauses_.end(),
      [&](const Conjunction & o) { return is_subset(o, clause); });
    if (!covered) return false;
  }
  return true;
}

std::vector<uint32_t> ActivationCondition::streams() const
{
  std::vector<uint32_t> ids;
  for (const auto & clause : clauses_) {
    ids.insert(ids.end(), clause.begin(), clause.end());
  }
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  return ids;
}

void ActivationCondition::normalize()
{
  for (auto & clause : clauses_) {
    std::sort(clause.begin(), clause.end());
    clause.erase(std::unique(clause.begin(), clause.end()), clause.end());
  }
  std::sort(clauses_.begin(), clauses_.end());
  clauses_.erase(std::unique(clauses_.begin(), clauses_.end()), clauses_.end());

  // Absorption: a | (a & b) == a
  std::vector<Conjunction> kept;
  kept.reserve(clauses_.size());
  for (size_t i = 0; i < clauses_.size(); ++i) {
    bool subsumed = false;
    for (size_t j = 0; j < clauses_.size() && !subsumed; ++j) {
      subsumed = i != j && clauses_[j].size() < clauses_[i].size() &&
                 is_subset(clauses_[j], clauses_[i]);
    }
    if (!subsumed) {
      kept.push_back(clauses_[i]);
    }
  }
  clauses_ = std::move(kept);
}

std::string ActivationCondition::to_string(
  const std::function<std::string(uint32_t)> & name_of) const
{
  if (clauses_.empty()) return "false";

  std::string s;
  for (size_t i = 0; i < clauses_.size(); ++i) {
    if (i > 0) s += " | ";
    const auto & clause = clauses_[i];
    for (size_t j = 0; j < clause.size(); ++j) {
      if (j > 0) s += " & ";
      s += name_of ? name_of(clause[j]) : default_name(clause[j]);
    }
  }
  return s;
}

// ============================================================================
// Pacing
// ============================================================================

Pacing Pacing::periodic(Rational hz)
{
  Pacing p;
  p.kind = PacingKind::Periodic;
  p.frequency = hz;
  return p;
}

Pacing Pacing::event_driven(ActivationCondition condition)
{
  Pacing p;
  p.kind = PacingKind::EventDriven;
  p.activation = std::move(condition);
  return p;
}

Pacing Pacing::error()
{
  Pacing p;
  p.kind = PacingKind::Error;
  return p;
}

std::string Pacing::to_string(const std::function<std::string(uint32_t)> & name_of) const
{
  switch (kind) {
    case PacingKind::Periodic:
      return frequency.to_string() + "Hz";
    case PacingKind::EventDriven:
      return activation.to_string(name_of);
    case PacingKind::Error:
      return "<error>";
    case PacingKind::Unknown:
      break;
  }
  return "?";
}

bool Pacing::operator==(const Pacing & o) const
{
  if (kind != o.kind) return false;
  switch (kind) {
    case PacingKind::Periodic:
      return frequency == o.frequency;
    case PacingKind::EventDriven:
      return activation == o.activation;
    default:
      return true;
  }
}

bool frequencies_compatible(const Rational & a, const Rational & b, FrequencyRule rule)
{
  if (a == b) return true;
  if (rule == FrequencyRule::Equal) return false;
  return a > b ? is_integer_multiple(a, b) : is_integer_multiple(b, a);
}

// ============================================================================
// PacingMerge
// ============================================================================

std::optional<Pacing> PacingMerge::operator()(const Pacing & a, const Pacing & b) const
{
  if (a.is_error() || b.is_error()) return Pacing::error();
  if (a.is_unknown()) return b;
  if (b.is_unknown()) return a;

  if (a.is_periodic() && b.is_periodic()) {
    if (!frequencies_compatible(a.frequency, b.frequency, policy.frequency_rule)) {
      return std::nullopt;
    }
    return a.frequency >= b.frequency ? a : b;
  }

  if (a.is_event_driven() && b.is_event_driven()) {
    if (policy.event_combination == EventCombination::All) {
      return Pacing::event_driven(a.activation.conjunction(b.activation));
    }
    return Pacing::event_driven(a.activation.disjunction(b.activation));
  }

  return std::nullopt;
}

}  // namespace lola
