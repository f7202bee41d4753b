// lola/sema/analysis/graph_analyzer.hpp - Whole-graph analyses
//
// Runs after the type checker and pacing analyzer. Errors from those passes do
// not prevent it from running; the analyses only read the graph structure and
// resolved pacings.
//
#pragma once

#include <cstddef>

#include "lola/basic/diagnostic.hpp"
#include "lola/sema/analysis/dependency_cycle_checker.hpp"
#include "lola/sema/analysis/evaluation_order.hpp"
#include "lola/sema/graph/stream_graph.hpp"

namespace lola
{

/**
 * Cycle legality, memory bounds, evaluation order and future dependency.
 *
 * On return every Stream carries its memory bound, layer and future flag, and
 * the graph carries an evaluation order. If illegal cycles were reported the
 * order is best effort: streams on synchronous cycles are appended in
 * declaration order.
 */
class GraphAnalyzer
{
public:
  explicit GraphAnalyzer(DiagnosticBag * diags = nullptr) : diags_(diags), cycles_(diags) {}

  /**
   * Run all graph analyses on `graph`.
   *
   * Order: cycle detection, memory bounds, evaluation order, future
   * dependency. SchedulingCycle is only reported if the order is incomplete
   * although no illegal cycle was found.
   *
   * @param graph Frozen graph with resolved pacings
   * @return true if no errors occurred
   */
  bool analyze(StreamGraph & graph);

  [[nodiscard]] const DependencyCycleChecker & cycle_checker() const noexcept { return cycles_; }

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  void schedule(StreamGraph & graph, bool cycles_reported);

  DiagnosticBag * diags_ = nullptr;
  DependencyCycleChecker cycles_;
  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace lola
