// lola/sema/pacing/pacing_analyzer.cpp - Pacing inference and checking
#include "lola/sema/pacing/pacing_analyzer.hpp"

#include <algorithm>
#include <utility>

#include "lola/basic/casting.hpp"
#include "lola/basic/quantity.hpp"

namespace lola
{

PacingAnalyzer::PacingAnalyzer(StreamGraph & graph, DiagnosticBag * diags, PacingPolicy policy)
: graph_(graph), diags_(diags), policy_(policy), unifier_(PacingMerge{policy})
{
}

// ============================================================================
// Entry Point
// ============================================================================

bool PacingAnalyzer::check()
{
  has_errors_ = false;
  error_count_ = 0;
  fixed_.assign(graph_.stream_count(), false);
  partial_.assign(graph_.stream_count(), false);

  for (auto & stream : graph_.streams()) {
    current_ = stream.id;
    declare(stream);
  }
  current_ = k_invalid_stream;

  do {
    propagate();
  } while (infer_from_history() || join_known_dependencies());

  report_ambiguous();

  for (const auto & stream : graph_.streams()) {
    if ((fixed_[stream.id] && !stream.is_input()) || partial_[stream.id]) {
      check_annotated(stream);
    }
  }
  check_lookaheads();

  for (auto & stream : graph_.streams()) {
    finalize_stream(stream);
  }
  return !has_errors_;
}

// ============================================================================
// Declarations
// ============================================================================

void PacingAnalyzer::declare(Stream & stream)
{
  stream.pacing_var = unifier_.new_var(Pacing::unknown());
  const VarId var = stream.pacing_var;

  std::optional<Pacing> declared;
  if (const auto * freq = dyn_cast<FrequencyPacing>(stream.declared_pacing)) {
    declared = frequency_annotation(freq);
    if (!declared) declared = Pacing::error();
  } else if (const auto * event = dyn_cast<EventPacing>(stream.declared_pacing)) {
    if (stream.is_input()) {
      report_error(
        DiagnosticKind::InconsistentPacing, event->get_range(),
        "input stream '" + stream.name + "' cannot have an activation condition",
        "inputs fire on their own arrival");
      declared = Pacing::error();
    } else if (auto condition = activation_of(event->condition)) {
      declared = Pacing::event_driven(std::move(*condition));
    } else {
      declared = Pacing::error();
    }
  } else if (stream.is_input()) {
    declared = Pacing::event_driven(ActivationCondition::stream(stream.id));
  }

  if (declared) {
    fixed_[stream.id] = true;
    unifier_.unify_var_value(var, *declared);
  }
}

std::optional<Pacing> PacingAnalyzer::frequency_annotation(const FrequencyPacing * node)
{
  const QuantityLiteralExpr * lit = node->value;
  if (!lit) {
    report_error(DiagnosticKind::InvalidAst, node->get_range(), "pacing without a frequency");
    return std::nullopt;
  }

  const auto q = Quantity::from_literal(lit->magnitude, lit->unit);
  if (!q) {
    report_error(
      DiagnosticKind::InvalidAst, lit->get_range(),
      "invalid pacing '" + std::string(lit->magnitude) + std::string(lit->unit) + "'");
    return std::nullopt;
  }
  if (!q->magnitude().is_positive()) {
    report_error(DiagnosticKind::InvalidAst, lit->get_range(), "pacing frequency must be positive");
    return std::nullopt;
  }

  const QuantityResult hz = q->to_frequency();
  if (!hz.ok()) {
    report_error(
      DiagnosticKind::UnitMismatch, lit->get_range(),
      "pacing must be a frequency or a period, found '" + q->to_string() + "'",
      "expected a unit such as 'Hz' or 'ms'");
    return std::nullopt;
  }
  return Pacing::periodic(hz.value->magnitude());
}

std::optional<ActivationCondition> PacingAnalyzer::activation_of(const Expr * expr)
{
  if (!expr) return std::nullopt;

  if (const auto * ref = dyn_cast<StreamRefExpr>(expr)) {
    // Undeclared names were reported by the graph builder.
    if (ref->resolvedStream == k_unresolved_stream) return std::nullopt;

    const Stream & accessed = graph_.stream(ref->resolvedStream);
    if (!accessed.is_input()) {
      report_error(
        DiagnosticKind::InconsistentPacing, ref->get_range(),
        "activation condition names '" + accessed.name + "', which is not an input stream",
        "only input streams can fire an event-driven stream");
      return std::nullopt;
    }
    return ActivationCondition::stream(accessed.id);
  }

  if (const auto * bin = dyn_cast<BinaryExpr>(expr)) {
    if (bin->op == BinaryOp::And || bin->op == BinaryOp::Or) {
      auto lhs = activation_of(bin->lhs);
      auto rhs = activation_of(bin->rhs);
      if (!lhs || !rhs) return std::nullopt;
      return bin->op == BinaryOp::And ? lhs->conjunction(*rhs) : lhs->disjunction(*rhs);
    }
  }

  report_error(
    DiagnosticKind::InconsistentPacing, expr->get_range(),
    "activation conditions may only combine input streams with '&' and '|'");
  return std::nullopt;
}

// ============================================================================
// Inference
// ============================================================================

void PacingAnalyzer::propagate()
{
  bool changed = true;
  while (changed) {
    changed = false;

    for (const auto & stream : graph_.streams()) {
      if (fixed_[stream.id] || !unifier_.probe(stream.pacing_var).is_unknown()) continue;

      const std::vector<EdgeId> deps = synchronous_dependencies(stream);
      const bool ready = std::none_of(deps.begin(), deps.end(), [&](EdgeId e) {
        return source_pacing(e).is_unknown();
      });
      if (deps.empty() || !ready) continue;

      join_dependencies(stream, deps);
      changed = true;
    }
  }
}

bool PacingAnalyzer::join_known_dependencies()
{
  bool changed = false;
  for (const auto & stream : graph_.streams()) {
    if (fixed_[stream.id] || !unifier_.probe(stream.pacing_var).is_unknown()) continue;

    std::vector<EdgeId> known = synchronous_dependencies(stream);
    known.erase(
      std::remove_if(
        known.begin(), known.end(), [&](EdgeId e) { return source_pacing(e).is_unknown(); }),
      known.end());
    if (known.empty()) continue;

    join_dependencies(stream, known);
    partial_[stream.id] = true;
    changed = true;
  }
  return changed;
}

void PacingAnalyzer::join_dependencies(const Stream & stream, std::vector<EdgeId> deps)
{
  // Seed with the fastest periodic clock: every other clock is then checked
  // against the final frequency, whatever the operand order.
  const auto first = std::min_element(deps.begin(), deps.end(), [&](EdgeId a, EdgeId b) {
    const Pacing & pa = source_pacing(a);
    const Pacing & pb = source_pacing(b);
    if (pa.is_periodic() != pb.is_periodic()) return pa.is_periodic();
    return pa.is_periodic() && pb.frequency < pa.frequency;
  });
  std::rotate(deps.begin(), first, first + 1);

  const VarId var = stream.pacing_var;
  for (const EdgeId e : deps) {
    const Pacing have = unifier_.probe(var);
    if (have.is_error()) return;

    const Pacing dep = source_pacing(e);
    if (!unifier_.unify_var_value(var, dep).ok()) {
      report_join_conflict(stream, graph_.reference(e), have);
      unifier_.unify_var_value(var, Pacing::error());
      return;
    }
  }
}

std::vector<EdgeId> PacingAnalyzer::synchronous_dependencies(const Stream & stream) const
{
  std::vector<EdgeId> deps;
  for (const EdgeId e : graph_.dependencies_of(stream.id)) {
    const Reference & edge = graph_.reference(e);
    if (edge.offset.constrains_pacing() && edge.source != stream.id) {
      deps.push_back(e);
    }
  }
  return deps;
}

const Pacing & PacingAnalyzer::source_pacing(EdgeId edge)
{
  return unifier_.probe(graph_.stream(graph_.reference(edge).source).pacing_var);
}

bool PacingAnalyzer::infer_from_history()
{
  for (const auto & stream : graph_.streams()) {
    if (fixed_[stream.id]) continue;
    const VarId var = stream.pacing_var;
    if (!unifier_.probe(var).is_unknown()) continue;

    std::vector<StreamId> candidates;
    for (const EdgeId e : graph_.dependencies_of(stream.id)) {
      const Reference & edge = graph_.reference(e);
      if (edge.offset.constrains_pacing() || edge.source == stream.id) continue;
      const Pacing & dep = unifier_.probe(graph_.stream(edge.source).pacing_var);
      if (dep.is_unknown() || dep.is_error()) continue;
      candidates.push_back(edge.source);
    }
    std::sort(candidates.begin(), candidates.end());

    for (const StreamId source : candidates) {
      const Pacing dep = unifier_.probe(graph_.stream(source).pacing_var);
      const Mark mark = unifier_.snapshot();
      if (unifier_.unify_var_value(var, dep).ok() && !unifier_.probe(var).is_unknown()) {
        unifier_.commit(mark);
        return true;
      }
      unifier_.rollback_to(mark);
    }
  }
  return false;
}

void PacingAnalyzer::report_join_conflict(
  const Stream & stream, const Reference & edge, const Pacing & have)
{
  const Stream & source = graph_.stream(edge.source);
  const Pacing dep = unifier_.probe(source.pacing_var);

  if (!diags_) {
    has_errors_ = true;
    ++error_count_;
    return;
  }

  if (have.is_periodic() && dep.is_periodic()) {
    has_errors_ = true;
    ++error_count_;
    diags_
      ->report_error(
        DiagnosticKind::IncompatibleFrequency, edge.range,
        "stream '" + stream.name + "' combines incompatible frequencies " + describe(have) +
          " and " + describe(dep),
        "'" + source.name + "' runs at " + describe(dep))
      .with_stream(stream.id)
      .with_stream(source.id)
      .with_help("annotate '" + stream.name + "' with a common frequency");
    return;
  }

  has_errors_ = true;
  ++error_count_;
  diags_
    ->report_error(
      DiagnosticKind::InconsistentPacing, edge.range,
      "stream '" + stream.name + "' combines periodic and event-driven dependencies",
      "'" + source.name + "' is " + (dep.is_periodic() ? "periodic" : "event-driven"))
    .with_stream(stream.id)
    .with_stream(source.id)
    .with_help("use a sample-and-hold access (`.hold()`) or annotate the stream");
}

void PacingAnalyzer::report_ambiguous()
{
  for (const auto & stream : graph_.streams()) {
    if (!unifier_.probe(stream.pacing_var).is_unknown()) continue;

    const auto & deps = graph_.dependencies_of(stream.id);
    const bool waits = std::any_of(deps.begin(), deps.end(), [&](EdgeId e) {
      const Reference & edge = graph_.reference(e);
      return edge.offset.constrains_pacing() && edge.source != stream.id &&
             unifier_.probe(graph_.stream(edge.source).pacing_var).is_unknown();
    });
    if (waits) continue;

    has_errors_ = true;
    ++error_count_;
    if (diags_) {
      diags_
        ->report_error(
          DiagnosticKind::AmbiguousPacing, get_name_range(stream.decl),
          "cannot infer the pacing of stream '" + stream.name + "'")
        .with_stream(stream.id)
        .with_help("annotate the stream with a frequency (`@ 1Hz`) or an activation condition");
    }
  }
}

// ============================================================================
// Checks
// ============================================================================

bool PacingAnalyzer::accepts(VarId annotation, const Pacing & dependency)
{
  const Mark mark = unifier_.snapshot();
  const bool joined = unifier_.unify_var_value(annotation, dependency).ok();
  unifier_.rollback_to(mark);

  if (!joined) return false;
  if (dependency.is_event_driven()) {
    return unifier_.probe(annotation).activation.implies(dependency.activation);
  }
  return true;
}

void PacingAnalyzer::check_annotated(const Stream & stream)
{
  const Pacing have = unifier_.probe(stream.pacing_var);
  if (have.is_error()) return;

  for (const EdgeId e : graph_.dependencies_of(stream.id)) {
    const Reference & edge = graph_.reference(e);
    if (!edge.offset.constrains_pacing() || edge.source == stream.id) continue;

    const Stream & source = graph_.stream(edge.source);
    const Pacing dep = unifier_.probe(source.pacing_var);
    if (dep.is_unknown() || dep.is_error()) continue;
    if (accepts(stream.pacing_var, dep)) continue;

    has_errors_ = true;
    ++error_count_;
    if (!diags_) continue;

    const SourceRange annotation =
      stream.declared_pacing ? stream.declared_pacing->get_range() : get_name_range(stream.decl);
    const std::string annotation_label =
      stream.declared_pacing ? "pacing declared here" : "pacing inferred here";

    if (have.is_periodic() && dep.is_periodic()) {
      diags_
        ->report_error(
          DiagnosticKind::IncompatibleFrequency, edge.range,
          "stream '" + stream.name + "' runs at " + describe(have) + " but accesses '" +
            source.name + "' running at " + describe(dep),
          "synchronous access here")
        .with_secondary_label(annotation, annotation_label)
        .with_stream(stream.id)
        .with_stream(source.id);
    } else if (have.is_event_driven() && dep.is_event_driven()) {
      diags_
        ->report_error(
          DiagnosticKind::InconsistentPacing, edge.range,
          "activation condition '" + describe(have) + "' of stream '" + stream.name +
            "' does not imply '" + describe(dep) + "' of '" + source.name + "'",
          "synchronous access here")
        .with_secondary_label(annotation, annotation_label)
        .with_stream(stream.id)
        .with_stream(source.id)
        .with_help("extend the activation condition or use a sample-and-hold access");
    } else {
      diags_
        ->report_error(
          DiagnosticKind::InconsistentPacing, edge.range,
          std::string(have.is_periodic() ? "periodic" : "event-driven") + " stream '" +
            stream.name + "' cannot synchronously access " +
            (dep.is_periodic() ? "periodic" : "event-driven") + " stream '" + source.name + "'",
          "synchronous access here")
        .with_secondary_label(annotation, annotation_label)
        .with_stream(stream.id)
        .with_stream(source.id)
        .with_help("use a sample-and-hold access (`.hold()`)");
    }
  }
}

void PacingAnalyzer::check_lookaheads()
{
  for (const auto & edge : graph_.references()) {
    if (!edge.offset.is_lookahead()) continue;

    const Pacing accessed = unifier_.probe(graph_.stream(edge.source).pacing_var);
    const Pacing accessing = unifier_.probe(graph_.stream(edge.target).pacing_var);
    if (accessed.is_unknown() || accessed.is_error()) continue;
    if (accessing.is_unknown() || accessing.is_error()) continue;
    if (accessed == accessing) continue;

    has_errors_ = true;
    ++error_count_;
    if (diags_) {
      diags_
        ->report_error(
          DiagnosticKind::InconsistentPacing, edge.range,
          "lookahead access needs both streams on the same clock, but '" +
            graph_.stream(edge.source).name + "' is " + describe(accessed) + " and '" +
            graph_.stream(edge.target).name + "' is " + describe(accessing))
        .with_stream(edge.target)
        .with_stream(edge.source);
    }
  }
}

void PacingAnalyzer::finalize_stream(Stream & stream)
{
  const Pacing & result = unifier_.probe(stream.pacing_var);
  stream.pacing = result.is_unknown() ? Pacing::error() : result;
}

std::string PacingAnalyzer::describe(const Pacing & pacing) const
{
  return pacing.to_string([this](uint32_t id) { return std::string(graph_.name_of(id)); });
}

void PacingAnalyzer::report_error(
  DiagnosticKind kind, SourceRange range, std::string message, std::string label)
{
  has_errors_ = true;
  ++error_count_;
  if (!diags_) return;

  auto builder = diags_->report_error(kind, range, std::move(message), std::move(label));
  if (current_ != k_invalid_stream) {
    builder.with_stream(current_);
  }
}

}  // namespace lola
