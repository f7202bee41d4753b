// lola/basic/diagnostic.hpp - Diagnostics produced by the analysis pipeline
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lola/basic/source_manager.hpp"

namespace lola
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

/**
 * Stable tag identifying the class of problem a diagnostic reports.
 *
 * Consumers (tests, tooling) match on the kind rather than on message text.
 */
enum class DiagnosticKind : uint8_t {
  // Naming & lowering
  DuplicateDeclaration,
  UndeclaredStream,
  UndeclaredFunction,
  // Types
  TypeMismatch,
  AmbiguousType,
  UnitMismatch,
  // Pacing
  InconsistentPacing,
  IncompatibleFrequency,
  AmbiguousPacing,
  // Graph
  IllegalCycle,
  SchedulingCycle,  ///< internal invariant violation
  // Input
  InvalidAst,
  IoError,
  // Lints
  UnusedStream,
  // Diagnostics without a specific kind (e.g. notes)
  Other,
};

/// "UndeclaredStream", ...
[[nodiscard]] std::string_view to_string(DiagnosticKind kind) noexcept;

/// Stable code printed in brackets: "E0002"
[[nodiscard]] std::string_view diagnostic_code(DiagnosticKind kind) noexcept;

enum class LabelStyle : uint8_t {
  Primary,    // direct cause
  Secondary,  // related location
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  DiagnosticKind kind = DiagnosticKind::Other;
  std::string code;  // e.g., "E0101"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  /// Ids of the streams the diagnostic is about (StreamGraph ids)
  std::vector<uint32_t> streams;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder; the diagnostic is added to its bag when the builder is
 * destroyed.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

  DiagnosticBuilder & with_stream(uint32_t stream_id);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  DiagnosticBuilder report_error(
    DiagnosticKind kind, SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    DiagnosticKind kind, SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_note(SourceRange range, std::string message);

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  /// Diagnostics of the given kind, in insertion order
  [[nodiscard]] std::vector<Diagnostic> of_kind(DiagnosticKind kind) const;
  [[nodiscard]] size_t count(DiagnosticKind kind) const;

  /// Copy ordered by primary span start; ties keep insertion order.
  [[nodiscard]] std::vector<Diagnostic> sorted() const;

  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace lola
