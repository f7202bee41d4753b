// lola/basic/diagnostic_printer.hpp
//
// Renders diagnostics with source context in Rust-style format. This is the
// only place in the project that knows about terminal colors.
//
#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>

#include "lola/basic/diagnostic.hpp"
#include "lola/basic/source_manager.hpp"

namespace lola
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0002]: undeclared stream 'velocity'
 *     --> specs/drone.lola:5:19
 *      |
 *    5 | output fast := velocity > 3.0
 *      |                ^^^^^^^^ not found in this specification
 *      |
 *      = help: declare it as `input velocity: Float64`
 *
 * When no source text is available only the header, location and help lines
 * are printed. Diagnostics about several streams end with a note naming them
 * once a stream namer is installed.
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// @param source Source text of the specification, or nullptr
  void print(const Diagnostic & diag, const SourceManager * source);

  /// Print every diagnostic, ordered by primary span.
  void print_all(const DiagnosticBag & diags, const SourceManager * source);

  /// "2 errors, 1 warning" summary line
  void print_summary(const DiagnosticBag & diags);

  using StreamNamer = std::function<std::string(uint32_t)>;

  /// Resolve Diagnostic::streams ids to names for the "streams involved" note.
  void set_stream_namer(StreamNamer namer) { namer_ = std::move(namer); }

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceManager & source);
  void print_source_line(
    std::string_view line, uint32_t line_number, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_help(std::string_view message);
  void print_note(std::string_view message);
  void print_streams(const Diagnostic & diag);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
  StreamNamer namer_;
};

}  // namespace lola
