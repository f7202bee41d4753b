// lola/basic/diagnostic.cpp - Diagnostic implementation
#include "lola/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace lola
{

std::string_view to_string(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::DuplicateDeclaration:
      return "DuplicateDeclaration";
    case DiagnosticKind::UndeclaredStream:
      return "UndeclaredStream";
    case DiagnosticKind::UndeclaredFunction:
      return "UndeclaredFunction";
    case DiagnosticKind::TypeMismatch:
      return "TypeMismatch";
    case DiagnosticKind::AmbiguousType:
      return "AmbiguousType";
    case DiagnosticKind::UnitMismatch:
      return "UnitMismatch";
    case DiagnosticKind::InconsistentPacing:
      return "InconsistentPacing";
    case DiagnosticKind::IncompatibleFrequency:
      return "IncompatibleFrequency";
    case DiagnosticKind::AmbiguousPacing:
      return "AmbiguousPacing";
    case DiagnosticKind::IllegalCycle:
      return "IllegalCycle";
    case DiagnosticKind::SchedulingCycle:
      return "SchedulingCycle";
    case DiagnosticKind::InvalidAst:
      return "InvalidAst";
    case DiagnosticKind::IoError:
      return "IoError";
    case DiagnosticKind::UnusedStream:
      return "UnusedStream";
    case DiagnosticKind::Other:
      return "Other";
  }
  return "Other";
}

std::string_view diagnostic_code(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::DuplicateDeclaration:
      return "E0001";
    case DiagnosticKind::UndeclaredStream:
      return "E0002";
    case DiagnosticKind::UndeclaredFunction:
      return "E0003";
    case DiagnosticKind::TypeMismatch:
      return "E0101";
    case DiagnosticKind::AmbiguousType:
      return "E0102";
    case DiagnosticKind::UnitMismatch:
      return "E0103";
    case DiagnosticKind::InconsistentPacing:
      return "E0201";
    case DiagnosticKind::IncompatibleFrequency:
      return "E0202";
    case DiagnosticKind::AmbiguousPacing:
      return "E0203";
    case DiagnosticKind::IllegalCycle:
      return "E0301";
    case DiagnosticKind::SchedulingCycle:
      return "E0900";
    case DiagnosticKind::InvalidAst:
      return "E0901";
    case DiagnosticKind::IoError:
      return "E0902";
    case DiagnosticKind::UnusedStream:
      return "W0001";
    case DiagnosticKind::Other:
      return "";
  }
  return "";
}

const Label * Diagnostic::primary_label() const noexcept
{
  for (const auto & l : labels) {
    if (l.style == LabelStyle::Primary) {
      return &l;
    }
  }
  if (!labels.empty()) {
    return &labels.front();
  }
  return nullptr;
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  return l == nullptr ? SourceRange{} : l->range;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  SourceRange range, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  return with_label(range, std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_stream(uint32_t stream_id)
{
  diagnostic_.streams.push_back(stream_id);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

namespace
{

Diagnostic make_diagnostic(
  Severity severity, DiagnosticKind kind, SourceRange range, std::string message,
  std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.kind = kind;
  d.code = std::string(diagnostic_code(kind));
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return d;
}

}  // namespace

DiagnosticBuilder DiagnosticBag::report_error(
  DiagnosticKind kind, SourceRange range, std::string message, std::string label_message)
{
  return {
    *this,
    make_diagnostic(Severity::Error, kind, range, std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  DiagnosticKind kind, SourceRange range, std::string message, std::string label_message)
{
  return {
    *this,
    make_diagnostic(Severity::Warning, kind, range, std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_note(SourceRange range, std::string message)
{
  return {
    *this, make_diagnostic(Severity::Info, DiagnosticKind::Other, range, std::move(message), "")};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

std::vector<Diagnostic> DiagnosticBag::of_kind(DiagnosticKind kind) const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [kind](const Diagnostic & d) { return d.kind == kind; });
  return result;
}

size_t DiagnosticBag::count(DiagnosticKind kind) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [kind](const Diagnostic & d) { return d.kind == kind; }));
}

std::vector<Diagnostic> DiagnosticBag::sorted() const
{
  std::vector<Diagnostic> result = diagnostics_;
  std::stable_sort(result.begin(), result.end(), [](const Diagnostic & a, const Diagnostic & b) {
    return a.primary_range().get_begin() < b.primary_range().get_begin();
  });
  return result;
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace lola
