// lola/sema/pacing/pacing_analyzer.hpp - Pacing inference and checking
//
// Runs after the StreamGraphBuilder. Independent of the type checker; the
// two may run in either order.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "lola/ast/ast.hpp"
#include "lola/basic/diagnostic.hpp"
#include "lola/sema/graph/stream_graph.hpp"
#include "lola/sema/pacing/pacing.hpp"

namespace lola
{

/**
 * Assigns every stream its evaluation clock.
 *
 * ## Algorithm
 *
 * 1. Inputs and annotated streams get their declared pacing. Unannotated
 *    inputs are event-driven on their own arrival.
 * 2. Unannotated streams take the join of the pacings of their synchronous
 *    (`Current`, non-hold) dependencies once all of them are known, iterated
 *    to a fixpoint. The join is seeded with the fastest periodic clock, so
 *    the verdict does not depend on operand order. A failed join is reported
 *    once and the stream becomes Error.
 * 3. Streams still Unknown try their history accesses (lookback, window,
 *    hold, lookahead) in declaration order; the first known clock wins and
 *    the fixpoint is resumed. If none applies, streams waiting on an Unknown
 *    dependency join their known dependencies only. Streams left Unknown are
 *    AmbiguousPacing.
 * 4. Annotated streams, and streams joined from a partial dependency set,
 *    are checked against each synchronous dependency by a speculative join
 *    that is always rolled back.
 * 5. Lookahead accesses require identical clocks on both ends.
 *
 * After check(), Stream::pacing holds the result for every stream.
 */
class PacingAnalyzer
{
public:
  /**
   * Create an analyzer over a lowered graph.
   *
   * @param graph Frozen graph; Stream::pacing_var and Stream::pacing are written
   * @param diags Diagnostic sink, or nullptr to only count errors
   * @param policy How event-driven and periodic dependencies combine
   */
  explicit PacingAnalyzer(
    StreamGraph & graph, DiagnosticBag * diags = nullptr, PacingPolicy policy = {});

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /**
   * Infer and check the pacing of all streams.
   *
   * Streams whose pacing cannot be determined end up with an Error pacing.
   * Running check() again on the same graph starts from scratch.
   *
   * @return true if no errors occurred
   */
  bool check();

  // ===========================================================================
  // Error State
  // ===========================================================================

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  // ===========================================================================
  // Declarations
  // ===========================================================================

  void declare(Stream & stream);
  std::optional<Pacing> frequency_annotation(const FrequencyPacing * node);
  std::optional<ActivationCondition> activation_of(const Expr * expr);

  // ===========================================================================
  // Inference
  // ===========================================================================

  /// Join synchronous dependencies until nothing changes.
  void propagate();

  /// Assign one Unknown stream from its history accesses; false if none could.
  bool infer_from_history();

  /// Join the known dependencies of streams that still wait; false if none did.
  bool join_known_dependencies();

  /// Unify `stream` with the clocks behind `deps` and report the first conflict.
  void join_dependencies(const Stream & stream, std::vector<EdgeId> deps);

  /// Incoming edges that constrain pacing, self-accesses excluded
  [[nodiscard]] std::vector<EdgeId> synchronous_dependencies(const Stream & stream) const;

  const Pacing & source_pacing(EdgeId edge);

  void report_join_conflict(const Stream & stream, const Reference & edge, const Pacing & have);

  /// AmbiguousPacing for Unknown streams that do not just wait on another one
  void report_ambiguous();

  // ===========================================================================
  // Checks
  // ===========================================================================

  void check_annotated(const Stream & stream);
  void check_lookaheads();

  /// `annotation` may read a dependency paced by `dependency`.
  bool accepts(VarId annotation, const Pacing & dependency);

  void finalize_stream(Stream & stream);

  [[nodiscard]] std::string describe(const Pacing & pacing) const;

  void report_error(
    DiagnosticKind kind, SourceRange range, std::string message, std::string label = "");

  // ===========================================================================
  // Member Variables
  // ===========================================================================

  StreamGraph & graph_;
  DiagnosticBag * diags_;
  PacingPolicy policy_;

  PacingUnifier unifier_;

  /// Pacing was written by the user (or is an input)
  std::vector<bool> fixed_;

  /// Pacing was joined while some synchronous dependency was still Unknown
  std::vector<bool> partial_;

  /// Stream whose declaration is being processed
  StreamId current_ = k_invalid_stream;

  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace lola
