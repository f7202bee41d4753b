// lola/driver/compiler.hpp - Analysis driver
//
// Single entry point for the analysis pipeline.
// Used by the CLI and by end-to-end tests.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "lola/ast/ast.hpp"
#include "lola/ast/ast_context.hpp"
#include "lola/basic/diagnostic.hpp"
#include "lola/ir/stream_ir.hpp"
#include "lola/project/project_config.hpp"
#include "lola/sema/graph/stream_graph.hpp"
#include "lola/sema/types/type.hpp"

namespace lola
{

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  /// Analysis policy (usually taken from lolac.yaml)
  AnalysisConfig analysis;

  /// Lower to the IR when analysis succeeds
  bool build_ir = true;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether analysis succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Owns the Types referenced by the graph and the IR
  std::unique_ptr<TypeContext> types;

  /// Owns the AST when it was read by analyze_file()
  std::unique_ptr<AstContext> ast;

  /// Analyzed graph (null when the AST could not be read)
  std::unique_ptr<StreamGraph> graph;

  /// Only present on success
  std::optional<ir::StreamIr> ir;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Driver that orchestrates the analysis pipeline.
 *
 * The pipeline consists of:
 * 1. Naming & lowering to the stream graph
 * 2. Type checking
 * 3. Pacing analysis
 * 4. Graph analysis (cycles, memory bounds, evaluation order)
 * 5. IR lowering (only without errors)
 *
 * Every analysis runs even when an earlier one reported errors, so a single
 * run shows all independent problems.
 */
class Compiler
{
public:
  /**
   * Analyze an AST built by the caller.
   *
   * The Program must outlive the result: the graph points into it.
   */
  [[nodiscard]] static CompileResult analyze(Program & program, const CompileOptions & options);

  /**
   * Read a JSON AST file and analyze it.
   *
   * @param file Path to the JSON interchange file
   */
  [[nodiscard]] static CompileResult analyze_file(
    const std::filesystem::path & file, const CompileOptions & options);

private:
  static void run_pipeline(Program & program, const CompileOptions & options, CompileResult & result);
};

}  // namespace lola
