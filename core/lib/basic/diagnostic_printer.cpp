// lola/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "lola/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <rang.hpp>
#include <string>

namespace lola
{

namespace
{

std::string_view severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "note";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager * source)
{
  print_severity_header(diag);

  const SourceRange primary = diag.primary_range();
  std::string filename = "<spec>";
  if (source != nullptr && !source->get_file_path().empty()) {
    filename = source->get_file_path().string();
  }

  if (source != nullptr && primary.is_valid()) {
    const FullSourceRange fr = source->get_full_range(primary);
    if (fr.is_valid()) {
      fmt::print(os_, "{} {}:{}:{}\n", gutter_arrow(), filename, fr.start_line, fr.start_column);
    } else {
      fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
    }
  } else if (primary.is_valid()) {
    fmt::print(
      os_, "{} {}@{}..{}\n", gutter_arrow(), filename, primary.get_begin().get_offset(),
      primary.get_end().get_offset());
  }

  if (source != nullptr) {
    fmt::print(os_, "{}\n", gutter_pipe());
    for (const auto & label : diag.labels) {
      print_label_context(label, *source);
    }
  } else {
    for (const auto & label : diag.labels) {
      if (!label.message.empty()) {
        print_note(label.message);
      }
    }
  }

  print_streams(diag);

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager * source)
{
  for (const auto & d : diags.sorted()) {
    print(d, source);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.errors().size();
  const size_t warnings = diags.warnings().size();
  if (errors == 0 && warnings == 0) {
    return;
  }
  if (use_color_) {
    os_ << rang::style::bold;
  }
  fmt::print(
    os_, "{} error{}, {} warning{}\n", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s");
  if (use_color_) {
    os_ << rang::style::reset;
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << name;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", name, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", name, diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceManager & source)
{
  if (!label.range.is_valid()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  const FullSourceRange fr = source.get_full_range(label.range);
  if (!fr.is_valid()) {
    return;
  }

  // Multi-line spans are underlined on their first line only
  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : fr.start_column + 1;

  print_source_line(
    source.get_line(fr.start_line - 1), fr.start_line, fr.start_column, end_col, label.style,
    label.message);
}

void DiagnosticPrinter::print_source_line(
  std::string_view line, uint32_t line_number, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  if (line.empty()) {
    return;
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_number);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_number);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  std::string marker_prefix;
  for (uint32_t col = 1; col < start_col && col - 1 < line.size(); ++col) {
    marker_prefix += line[col - 1] == '\t' ? "    " : " ";
  }
  const size_t marker_len = end_col > start_col ? end_col - start_col : 1;
  const char marker_char = style == LabelStyle::Primary ? '^' : '-';

  fmt::print(os_, "{}{}", gutter_pipe(), " ");
  fmt::print(os_, "{}", marker_prefix);
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

void DiagnosticPrinter::print_streams(const Diagnostic & diag)
{
  if (!namer_ || diag.streams.size() < 2) {
    return;
  }
  std::string names;
  for (size_t i = 0; i < diag.streams.size(); ++i) {
    const uint32_t id = diag.streams[i];
    if (std::find(diag.streams.begin(), diag.streams.begin() + static_cast<std::ptrdiff_t>(i), id) !=
        diag.streams.begin() + static_cast<std::ptrdiff_t>(i)) {
      continue;
    }
    if (!names.empty()) names += ", ";
    names += "'" + namer_(id) + "'";
  }
  print_note("streams involved: " + names);
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  return use_color_ ? std::string("\033[1;36m  -->\033[0m") : std::string("  -->");
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  return use_color_ ? std::string("\033[1;36m      |\033[0m") : std::string("      |");
}

}  // namespace lola
