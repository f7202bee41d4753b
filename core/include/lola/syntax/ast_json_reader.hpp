// lola/syntax/ast_json_reader.hpp - JSON interchange format to AST
//
// The analysis consumes ASTs produced by an external parser. This reader
// accepts the JSON form of such an AST; the schema is documented in
// DESIGN.md. Problems are reported as InvalidAst (malformed input) or
// IoError (unreadable file).
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "lola/ast/ast.hpp"
#include "lola/ast/ast_context.hpp"
#include "lola/basic/diagnostic.hpp"

namespace lola
{

class AstJsonReader
{
public:
  explicit AstJsonReader(AstContext & ast, DiagnosticBag * diags = nullptr)
  : ast_(ast), diags_(diags)
  {
  }

  /**
   * Build a Program from JSON text.
   *
   * Malformed nodes are reported and skipped, so a partially valid file still
   * yields a Program.
   *
   * @return nullptr if the text is not JSON or has no "decls" array
   */
  Program * read(std::string_view text);

  /// Read and parse a file; unreadable files are reported as IoError.
  Program * read_file(const std::filesystem::path & path);

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

  // Internal (used by the implementation unit's builder).
  void report_error(DiagnosticKind kind, SourceRange range, std::string message);

private:
  AstContext & ast_;
  DiagnosticBag * diags_ = nullptr;
  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace lola
