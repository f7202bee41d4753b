// lola/sema/resolution/stream_graph_builder.hpp - Naming & lowering
//
// Turns the declarations of a Program into a StreamGraph: one stream per
// declaration, one reference per stream access. Resolved stream ids are
// written back into the AST (Decl::resolvedStream, StreamRefExpr::resolvedStream).
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lola/ast/ast.hpp"
#include "lola/basic/diagnostic.hpp"
#include "lola/sema/graph/stream_graph.hpp"
#include "lola/sema/resolution/function_registry.hpp"

namespace lola
{

struct GraphBuildOptions
{
  /// Warn about inputs nothing reads
  bool warn_unused_inputs = true;
};

/**
 * Lowering pass from AST to StreamGraph.
 *
 * Reports DuplicateDeclaration, UndeclaredStream, UndeclaredFunction and
 * malformed window durations. Resolution continues after every error, so a
 * single run reports all independent problems. The graph is frozen when
 * build() returns.
 */
class StreamGraphBuilder
{
public:
  StreamGraphBuilder(
    StreamGraph & graph, const FunctionRegistry & functions, DiagnosticBag * diags = nullptr,
    GraphBuildOptions options = {})
  : graph_(graph), functions_(functions), diags_(diags), options_(options)
  {
  }

  /**
   * Lower all declarations of `program`.
   *
   * @return true if no errors occurred
   */
  bool build(Program & program);

  // ===========================================================================
  // Error State
  // ===========================================================================

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

  // Internal (used by the reference collector in the implementation unit)
  std::optional<StreamId> resolve(StreamRefExpr * ref);
  void add_reference(StreamId target, StreamRefExpr * ref, Offset offset, const Expr * access);
  void check_function(const CallExpr * call);
  std::optional<Rational> window_duration(const WindowExpr * window);
  std::optional<Offset> discrete_offset(const OffsetExpr * offset);
  void note_activation_use(StreamId id);

private:
  void declare_streams(Program & program);
  void collect_references(Program & program);
  void report_unused_inputs();

  void report_error(DiagnosticKind kind, SourceRange range, std::string message,
                    std::string label = "");

  StreamGraph & graph_;
  const FunctionRegistry & functions_;
  DiagnosticBag * diags_ = nullptr;
  GraphBuildOptions options_;

  /// Inputs named by an activation condition count as used
  std::vector<bool> usedInActivation_;

  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace lola
