// lola/sema/resolution/stream_graph_builder.cpp - Naming & lowering
#include "lola/sema/resolution/stream_graph_builder.hpp"

#include <string>
#include <utility>

#include "lola/ast/visitor.hpp"
#include "lola/basic/casting.hpp"
#include "lola/basic/quantity.hpp"

namespace lola
{

namespace
{

// ============================================================================
// Reference Collector
// ============================================================================

/**
 * Walks one stream expression and records every stream access.
 *
 * Offset, hold and window accesses handle their own StreamRefExpr so that it
 * is not also recorded as a synchronous access.
 */
class ReferenceCollector : public RecursiveAstVisitor<ReferenceCollector>
{
public:
  ReferenceCollector(StreamGraphBuilder & builder, StreamId target)
  : builder_(builder), target_(target)
  {
  }

  bool visit_stream_ref(StreamRefExpr * node)
  {
    builder_.add_reference(target_, node, Offset::current(), node);
    return true;
  }

  bool visit_offset(OffsetExpr * node)
  {
    if (const auto offset = builder_.discrete_offset(node)) {
      builder_.add_reference(target_, node->stream, *offset, node);
    } else {
      builder_.resolve(node->stream);
    }
    return true;
  }

  bool visit_hold(HoldExpr * node)
  {
    builder_.add_reference(target_, node->stream, Offset::sample_and_hold(), node);
    return true;
  }

  bool visit_window(WindowExpr * node)
  {
    const auto duration = builder_.window_duration(node);
    if (duration) {
      builder_.add_reference(target_, node->stream, Offset::window(*duration, node->op), node);
    } else {
      // Still resolve the name; the malformed window was reported.
      builder_.resolve(node->stream);
    }
    return true;
  }

  bool visit_call_expr(CallExpr * node)
  {
    builder_.check_function(node);
    return RecursiveAstVisitor::visit_call_expr(node);
  }

private:
  StreamGraphBuilder & builder_;
  StreamId target_;
};

/// Resolves the stream names of an activation condition; no edges.
class ActivationCollector : public RecursiveAstVisitor<ActivationCollector>
{
public:
  explicit ActivationCollector(StreamGraphBuilder & builder) : builder_(builder) {}

  bool visit_stream_ref(StreamRefExpr * node)
  {
    if (const auto id = builder_.resolve(node)) {
      builder_.note_activation_use(*id);
    }
    return true;
  }

private:
  StreamGraphBuilder & builder_;
};

PacingNode * pacing_of(Decl * decl)
{
  if (auto * in = dyn_cast<InputDecl>(decl)) return in->pacing;
  if (auto * out = dyn_cast<OutputDecl>(decl)) return out->pacing;
  if (auto * trig = dyn_cast<TriggerDecl>(decl)) return trig->pacing;
  return nullptr;
}

Expr * expression_of(Decl * decl)
{
  if (auto * out = dyn_cast<OutputDecl>(decl)) return out->expr;
  if (auto * trig = dyn_cast<TriggerDecl>(decl)) return trig->condition;
  return nullptr;
}

}  // namespace

// ============================================================================
// Entry Point
// ============================================================================

bool StreamGraphBuilder::build(Program & program)
{
  has_errors_ = false;
  error_count_ = 0;

  declare_streams(program);
  usedInActivation_.assign(graph_.stream_count(), false);
  collect_references(program);
  if (options_.warn_unused_inputs) {
    report_unused_inputs();
  }

  graph_.freeze();
  return !has_errors_;
}

// ============================================================================
// Declarations
// ============================================================================

void StreamGraphBuilder::declare_streams(Program & program)
{
  size_t trigger_index = 0;

  for (auto * decl : program.decls) {
    if (!decl) continue;

    Stream stream;
    stream.decl = decl;
    stream.declared_pacing = pacing_of(decl);
    stream.expr = expression_of(decl);

    if (const auto * in = dyn_cast<InputDecl>(decl)) {
      stream.kind = StreamKind::Input;
      stream.name = std::string(in->name);
      stream.declared_type = in->type;
    } else if (const auto * out = dyn_cast<OutputDecl>(decl)) {
      stream.kind = StreamKind::Output;
      stream.name = std::string(out->name);
      stream.declared_type = out->type;
    } else if (const auto * trig = dyn_cast<TriggerDecl>(decl)) {
      stream.kind = StreamKind::Trigger;
      stream.message = std::string(trig->message);
      // Synthetic names must not collide with user streams.
      std::string name = "trigger_" + std::to_string(trigger_index++);
      while (graph_.find(name)) {
        name += "_";
      }
      stream.name = std::move(name);
    } else {
      continue;
    }

    if (const auto existing = graph_.find(stream.name)) {
      const Stream & first = graph_.stream(*existing);
      if (diags_) {
        diags_
          ->report_error(
            DiagnosticKind::DuplicateDeclaration, get_name_range(decl),
            "stream '" + stream.name + "' is declared more than once", "redeclared here")
          .with_secondary_label(get_name_range(first.decl), "first declared here")
          .with_stream(*existing);
      }
      has_errors_ = true;
      ++error_count_;
      continue;
    }

    decl->resolvedStream = graph_.add_stream(std::move(stream));
  }
}

// ============================================================================
// References
// ============================================================================

void StreamGraphBuilder::collect_references(Program & program)
{
  for (auto * decl : program.decls) {
    if (!decl) continue;

    // Expressions of rejected duplicates are still resolved so that unknown
    // names inside them are reported; they produce no edges.
    if (Expr * expr = expression_of(decl)) {
      ReferenceCollector collector(*this, decl->resolvedStream);
      collector.visit(expr);
    }

    if (auto * event = dyn_cast<EventPacing>(pacing_of(decl))) {
      ActivationCollector collector(*this);
      collector.visit(event->condition);
    }
  }
}

std::optional<StreamId> StreamGraphBuilder::resolve(StreamRefExpr * ref)
{
  if (!ref) return std::nullopt;

  if (const auto id = graph_.find(ref->name)) {
    ref->resolvedStream = *id;
    return id;
  }

  report_error(
    DiagnosticKind::UndeclaredStream, ref->get_range(),
    "use of undeclared stream '" + std::string(ref->name) + "'",
    "not declared in this specification");
  return std::nullopt;
}

void StreamGraphBuilder::add_reference(
  StreamId target, StreamRefExpr * ref, Offset offset, const Expr * access)
{
  const auto source = resolve(ref);
  if (!source || target == k_invalid_stream) {
    return;
  }

  Reference edge;
  edge.source = *source;
  edge.target = target;
  edge.offset = std::move(offset);
  edge.range = access ? access->get_range() : ref->get_range();
  edge.expr = access;
  graph_.add_reference(std::move(edge));
}

void StreamGraphBuilder::check_function(const CallExpr * call)
{
  if (functions_.lookup(call->callee)) {
    return;
  }
  report_error(
    DiagnosticKind::UndeclaredFunction, call->get_range(),
    "call to unknown function '" + std::string(call->callee) + "'");
}

std::optional<Rational> StreamGraphBuilder::window_duration(const WindowExpr * window)
{
  const QuantityLiteralExpr * lit = window->duration;
  if (!lit) {
    report_error(DiagnosticKind::InvalidAst, window->get_range(), "window without a duration");
    return std::nullopt;
  }

  const auto q = Quantity::from_literal(lit->magnitude, lit->unit);
  if (!q) {
    report_error(
      DiagnosticKind::InvalidAst, lit->get_range(),
      "invalid window duration '" + std::string(lit->magnitude) + std::string(lit->unit) + "'");
    return std::nullopt;
  }
  if (!q->unit().is_duration()) {
    report_error(
      DiagnosticKind::UnitMismatch, lit->get_range(),
      "window duration must be a duration, found '" + q->to_string() + "'",
      "expected a time unit such as 's' or 'ms'");
    return std::nullopt;
  }
  if (!q->magnitude().is_positive()) {
    report_error(
      DiagnosticKind::InvalidAst, lit->get_range(), "window duration must be positive");
    return std::nullopt;
  }
  return q->magnitude();
}

std::optional<Offset> StreamGraphBuilder::discrete_offset(const OffsetExpr * offset)
{
  constexpr auto k_max = static_cast<int64_t>(Offset::k_max_amount);
  const int64_t by = offset->offset;
  if (by < -k_max || by > k_max) {
    report_error(
      DiagnosticKind::InvalidAst, offset->get_range(),
      "offset " + std::to_string(by) + " is out of range",
      "at most " + std::to_string(k_max) + " values in either direction");
    return std::nullopt;
  }
  return by < 0 ? Offset::lookback(static_cast<uint32_t>(-by))
                : Offset::lookahead(static_cast<uint32_t>(by));
}

void StreamGraphBuilder::note_activation_use(StreamId id)
{
  if (id < usedInActivation_.size()) {
    usedInActivation_[id] = true;
  }
}

// ============================================================================
// Lints
// ============================================================================

void StreamGraphBuilder::report_unused_inputs()
{
  if (!diags_) return;

  for (const auto & stream : graph_.streams()) {
    if (!stream.is_input()) continue;
    if (!graph_.dependents_of(stream.id).empty() || usedInActivation_[stream.id]) continue;

    diags_
      ->report_warning(
        DiagnosticKind::UnusedStream, get_name_range(stream.decl),
        "input stream '" + stream.name + "' is never used")
      .with_stream(stream.id)
      .with_help("remove the declaration or reference it from an output");
  }
}

void StreamGraphBuilder::report_error(
  DiagnosticKind kind, SourceRange range, std::string message, std::string label)
{
  has_errors_ = true;
  ++error_count_;
  if (diags_) {
    diags_->report_error(kind, range, std::move(message), std::move(label));
  }
}

}  // namespace lola
